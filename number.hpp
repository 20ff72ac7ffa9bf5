// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef HJSON_NUMBER_HPP_
#define HJSON_NUMBER_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/variant.hpp>
#include <cstdint>
namespace hjson {

// This is an exact base-10 number, made up of an unscaled magnitude, a scale
// and a sign. Its value is `(-1)^sign * unscaled / 10^scale`. The magnitude has
// no upper bound. The scale is at most 255.
class Decimal
  {
  private:
    // base 10^9, least significant limb first, no leading zero limbs
    ::rocket::cow_vector<uint32_t> m_limbs;
    uint8_t m_scale = 0;
    bool m_neg = false;

  private:
    uint32_t
    do_divide_small(uint32_t divisor);

  public:
    // Initializes zero.
    Decimal() noexcept = default;

    // Initializes an integer.
    explicit
    Decimal(int64_t value);

    // Checks whether the value is zero, regardless of scale.
    bool
    is_zero() const noexcept
      { return this->m_limbs.empty();  }

    // Checks whether the value is negative. Zero is never negative.
    bool
    is_negative() const noexcept
      { return this->m_neg;  }

    // Sets the sign. This has no effect on zero.
    Decimal&
    set_negative(bool neg) noexcept
      {
        this->m_neg = neg && !this->m_limbs.empty();
        return *this;
      }

    // Gets the number of decimal digits after the decimal point.
    uint8_t
    scale() const noexcept
      { return this->m_scale;  }

    // Sets the scale, which divides the value by a power of ten.
    Decimal&
    set_scale(uint8_t scale) noexcept
      {
        this->m_scale = scale;
        return *this;
      }

    // Gets the unscaled magnitude, in base 10^9 limbs, least significant first.
    const ::rocket::cow_vector<uint32_t>&
    limbs() const noexcept
      { return this->m_limbs;  }

    // Performs `unscaled = unscaled * mul + add` on the magnitude. Both operands
    // shall be less than 10^9.
    Decimal&
    mul_add(uint32_t mul, uint32_t add);

    // Multiplies the unscaled magnitude by `10^count`. The scale is unchanged.
    Decimal&
    shift_left(uint32_t count);

    // Divides the unscaled magnitude by `10^count`, rounding half to even. The
    // scale is unchanged.
    Decimal&
    round_off_digits(uint32_t count);

    // Reduces the scale to `scale`, rounding half to even. If the current scale
    // is not greater than `scale`, there is no effect.
    Decimal&
    round_to_scale(uint8_t scale);

    // Removes trailing zeros after the decimal point.
    Decimal&
    trim_trailing_zeros();

    // Gets the value as a 64-bit integer. If the value has a non-zero scale, or
    // is out of range, `false` is returned and `value` is unchanged.
    bool
    get_int64(int64_t& value) const noexcept;

    // Converts this value to a double-precision number, which may be inexact.
    double
    to_double() const;

    // Creates a decimal from a finite double-precision number, rounded to 15
    // significant digits, with trailing zeros after the decimal point removed.
    // Digits beyond the 255th decimal place are rounded off.
    static
    Decimal
    from_double(double value);

    // Compares two values numerically, so `1.50` equals `1.5`.
    static
    int
    compare(const Decimal& lhs, const Decimal& rhs);

    // Prints this value in plain decimal notation, such as `-123.4500`. No
    // exponent is ever printed, and the scale is preserved.
    void
    print_to(::rocket::cow_string& str) const;

    ::rocket::cow_string
    to_string() const;

    // Parses a string in the notation of `print_to()`. If the string is invalid,
    // or the scale would be too large, `false` is returned and this value is
    // unchanged.
    bool
    parse(const char* str, size_t len);
  };

inline
bool
operator==(const Decimal& lhs, const Decimal& rhs)
  {
    return Decimal::compare(lhs, rhs) == 0;
  }

inline
bool
operator!=(const Decimal& lhs, const Decimal& rhs)
  {
    return Decimal::compare(lhs, rhs) != 0;
  }

// Define aliases and enumerators for numeric representations.
using N_int32   = ::std::int32_t;
using N_int64   = ::std::int64_t;
using N_decimal = Decimal;

enum Number_Type : ::std::uint8_t
  {
    n_int32    = 0,
    n_int64    = 1,
    n_decimal  = 2,
  };

// This is the result of a numeric literal. The numeric scanner chooses the
// narrowest representation that holds the literal exactly; see
// `Reader::read_numeric_literal()`.
class Number
  {
  private:
    ::rocket::variant<N_int32, N_int64, N_decimal> m_stor;

  public:
    // Initializes a 32-bit integer.
    Number(N_int32 val = 0) noexcept
      {
        this->m_stor.emplace<N_int32>(val);
      }

    // Initializes a 64-bit integer.
    Number(N_int64 val) noexcept
      {
        this->m_stor.emplace<N_int64>(val);
      }

    // Initializes a decimal.
    Number(const N_decimal& val) noexcept
      {
        this->m_stor.emplace<N_decimal>(val);
      }

    // Gets the representation of the stored value.
    Number_Type
    type() const noexcept
      { return static_cast<Number_Type>(this->m_stor.index());  }

    bool
    is_int32() const noexcept
      { return this->m_stor.index() == n_int32;  }

    // Gets a 32-bit integer. If the stored value is not a 32-bit integer, an
    // exception is thrown, and there is no effect.
    N_int32
    as_int32() const
      { return this->m_stor.as<N_int32>();  }

    bool
    is_int64() const noexcept
      { return this->m_stor.index() == n_int64;  }

    N_int64
    as_int64() const
      { return this->m_stor.as<N_int64>();  }

    bool
    is_decimal() const noexcept
      { return this->m_stor.index() == n_decimal;  }

    const N_decimal&
    as_decimal() const
      { return this->m_stor.as<N_decimal>();  }

    // Converts the stored value to a decimal. This is always exact.
    N_decimal
    to_decimal() const;

    // Converts the stored value to a double-precision number, which may be
    // inexact for large integers and decimals.
    double
    to_double() const;

    // Prints the stored value in plain decimal notation.
    void
    print_to(::rocket::cow_string& str) const;

    ::rocket::cow_string
    to_string() const;
  };

// Two numbers are equal if they have the same representation and the same
// value.
bool
operator==(const Number& lhs, const Number& rhs);

inline
bool
operator!=(const Number& lhs, const Number& rhs)
  {
    return !(lhs == rhs);
  }

static_assert(::std::is_nothrow_copy_constructible<Number>::value, "");
static_assert(::std::is_nothrow_move_constructible<Number>::value, "");

}  // namespace hjson

extern template
class ::rocket::cow_vector<uint32_t>;

extern template
class ::rocket::variant<::hjson::N_int32, ::hjson::N_int64, ::hjson::N_decimal>;
#endif
