// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "number.hpp"
#include <rocket/ascii_numput.hpp>
#include <rocket/ascii_numget.hpp>
#include <cmath>
template class ::rocket::cow_vector<uint32_t>;
template class ::rocket::variant<::hjson::N_int32, ::hjson::N_int64, ::hjson::N_decimal>;
namespace hjson {
namespace {

constexpr uint32_t s_limb_base = 1000000000;
constexpr uint32_t s_limb_digits = 9;

constexpr uint32_t s_pow10[] =
  {
    1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000,
  };

void
do_append_limb(::rocket::cow_string& str, uint32_t limb, bool pad)
  {
    char temp[16];
    size_t ntemp = 0;

    // Write digits backwards.
    do {
      temp[ntemp] = static_cast<char>('0' + limb % 10);
      ntemp ++;
      limb /= 10;
    }
    while(limb != 0);

    if(pad)
      while(ntemp != s_limb_digits) {
        temp[ntemp] = '0';
        ntemp ++;
      }

    while(ntemp != 0) {
      ntemp --;
      str.push_back(temp[ntemp]);
    }
  }

int
do_compare_magnitudes(const ::rocket::cow_vector<uint32_t>& lhs,
                      const ::rocket::cow_vector<uint32_t>& rhs) noexcept
  {
    if(lhs.size() != rhs.size())
      return (lhs.size() < rhs.size()) ? -1 : +1;

    for(size_t k = lhs.size();  k != 0;  --k)
      if(lhs[k-1] != rhs[k-1])
        return (lhs[k-1] < rhs[k-1]) ? -1 : +1;

    return 0;
  }

}  // namespace

Decimal::
Decimal(int64_t value)
  {
    uint64_t mag = static_cast<uint64_t>(value);
    if(value < 0)
      mag = 0 - mag;

    while(mag != 0) {
      this->m_limbs.push_back(static_cast<uint32_t>(mag % s_limb_base));
      mag /= s_limb_base;
    }

    this->m_neg = value < 0;
  }

uint32_t
Decimal::
do_divide_small(uint32_t divisor)
  {
    uint64_t rem = 0;
    for(size_t k = this->m_limbs.size();  k != 0;  --k) {
      uint64_t cur = rem * s_limb_base + this->m_limbs[k-1];
      this->m_limbs.mut(k-1) = static_cast<uint32_t>(cur / divisor);
      rem = cur % divisor;
    }

    while(!this->m_limbs.empty() && (this->m_limbs.back() == 0))
      this->m_limbs.pop_back();

    return static_cast<uint32_t>(rem);
  }

Decimal&
Decimal::
round_off_digits(uint32_t count)
  {
    if(count == 0)
      return *this;

    // Divide the magnitude by `10^count`, remembering the most significant
    // digit that has been dropped, and whether any other dropped digit is
    // non-zero, so we can round half to even.
    uint32_t last = 0;
    bool sticky = false;
    for(uint32_t k = 0;  k != count;  ++k) {
      if(this->m_limbs.empty()) {
        sticky |= last != 0;
        last = 0;
        break;
      }

      sticky |= last != 0;
      last = this->do_divide_small(10);
    }

    bool odd = !this->m_limbs.empty() && (this->m_limbs[0] % 2 != 0);
    if((last > 5) || ((last == 5) && (sticky || odd)))
      this->mul_add(1, 1);

    if(this->m_limbs.empty())
      this->m_neg = false;
    return *this;
  }

Decimal&
Decimal::
mul_add(uint32_t mul, uint32_t add)
  {
    ROCKET_ASSERT(mul < s_limb_base);
    ROCKET_ASSERT(add < s_limb_base);

    uint64_t carry = add;
    for(size_t k = 0;  k != this->m_limbs.size();  ++k) {
      uint64_t cur = static_cast<uint64_t>(this->m_limbs[k]) * mul + carry;
      this->m_limbs.mut(k) = static_cast<uint32_t>(cur % s_limb_base);
      carry = cur / s_limb_base;
    }

    if(carry != 0)
      this->m_limbs.push_back(static_cast<uint32_t>(carry));

    while(!this->m_limbs.empty() && (this->m_limbs.back() == 0))
      this->m_limbs.pop_back();

    if(this->m_limbs.empty())
      this->m_neg = false;
    return *this;
  }

Decimal&
Decimal::
shift_left(uint32_t count)
  {
    if(this->m_limbs.empty())
      return *this;

    if(count % s_limb_digits != 0)
      this->mul_add(s_pow10[count % s_limb_digits], 0);

    if(count / s_limb_digits != 0) {
      // Prepend whole zero limbs.
      ::rocket::cow_vector<uint32_t> limbs;
      limbs.reserve(count / s_limb_digits + this->m_limbs.size());
      for(uint32_t k = 0;  k != count / s_limb_digits;  ++k)
        limbs.push_back(0);
      for(size_t k = 0;  k != this->m_limbs.size();  ++k)
        limbs.push_back(this->m_limbs[k]);
      this->m_limbs.swap(limbs);
    }
    return *this;
  }

Decimal&
Decimal::
round_to_scale(uint8_t scale)
  {
    if(this->m_scale <= scale)
      return *this;

    this->round_off_digits(static_cast<uint32_t>(this->m_scale - scale));
    this->m_scale = scale;
    return *this;
  }

Decimal&
Decimal::
trim_trailing_zeros()
  {
    while((this->m_scale != 0) && !this->m_limbs.empty() && (this->m_limbs[0] % 10 == 0)) {
      this->do_divide_small(10);
      this->m_scale --;
    }

    if(this->m_limbs.empty())
      this->m_scale = 0;
    return *this;
  }

bool
Decimal::
get_int64(int64_t& value) const noexcept
  {
    if(this->m_scale != 0)
      return false;

    // 10^27 is far beyond the range of `int64_t`. If there are three limbs, the
    // most significant one shall be less than 10, so the sum can't overflow a
    // `uint64_t`.
    if(this->m_limbs.size() > 3)
      return false;

    if((this->m_limbs.size() == 3) && (this->m_limbs[2] >= 10))
      return false;

    uint64_t mag = 0;
    for(size_t k = this->m_limbs.size();  k != 0;  --k)
      mag = mag * s_limb_base + this->m_limbs[k-1];

    if(this->m_neg) {
      if(mag > static_cast<uint64_t>(INT64_MAX) + 1)
        return false;

      value = (mag == 0) ? 0 : (-static_cast<int64_t>(mag - 1) - 1);
    }
    else {
      if(mag > static_cast<uint64_t>(INT64_MAX))
        return false;

      value = static_cast<int64_t>(mag);
    }
    return true;
  }

double
Decimal::
to_double() const
  {
    ::rocket::cow_string str;
    this->print_to(str);

    ::rocket::ascii_numget numg;
    double value = 0;
    numg.parse_DD(str.data(), str.size());
    numg.cast_D(value, -HUGE_VAL, HUGE_VAL);
    return value;
  }

Decimal
Decimal::
from_double(double value)
  {
    ROCKET_ASSERT(::std::isfinite(value));

    // Get the shortest representation that converts back to `value`, such
    // as `-123.45` or `1.5e-07`.
    ::rocket::ascii_numput nump;
    nump.put_DD(value);

    Decimal dec;
    const char* bptr = nump.data();
    const char* eptr = bptr + nump.size();

    bool neg = false;
    if((bptr != eptr) && (*bptr == '-')) {
      neg = true;
      bptr ++;
    }

    // Collect significant digits, and count those after the decimal point.
    int nsig = 0;
    int nfrac = 0;
    bool in_frac = false;
    while((bptr != eptr) && (*bptr != 'e') && (*bptr != 'E')) {
      if(*bptr == '.')
        in_frac = true;
      else if((*bptr >= '0') && (*bptr <= '9')) {
        dec.mul_add(10, static_cast<uint32_t>(*bptr - '0'));
        nsig += !dec.m_limbs.empty();
        nfrac += in_frac;
      }
      bptr ++;
    }

    int exp = 0;
    bool exp_neg = false;
    if(bptr != eptr) {
      bptr ++;
      if((bptr != eptr) && ((*bptr == '+') || (*bptr == '-'))) {
        exp_neg = *bptr == '-';
        bptr ++;
      }

      while((bptr != eptr) && (*bptr >= '0') && (*bptr <= '9')) {
        exp = exp * 10 + (*bptr - '0');
        bptr ++;
      }
    }

    if(exp_neg)
      exp = -exp;

    // Keep 15 significant digits.
    int shift = exp - nfrac;
    if(nsig > 15) {
      dec.round_off_digits(static_cast<uint32_t>(nsig - 15));
      shift += nsig - 15;
    }

    // The value is `digits * 10^shift`.
    if(shift >= 0)
      dec.shift_left(static_cast<uint32_t>(shift));
    else {
      int scale = -shift;
      if(scale > UINT8_MAX) {
        dec.round_off_digits(static_cast<uint32_t>(scale - UINT8_MAX));
        scale = UINT8_MAX;
      }
      dec.m_scale = static_cast<uint8_t>(scale);
    }

    dec.trim_trailing_zeros();
    dec.set_negative(neg);
    return dec;
  }

int
Decimal::
compare(const Decimal& lhs, const Decimal& rhs)
  {
    if(lhs.m_neg != rhs.m_neg)
      return lhs.m_neg ? -1 : +1;

    int cmp;
    if(lhs.m_scale == rhs.m_scale)
      cmp = do_compare_magnitudes(lhs.m_limbs, rhs.m_limbs);
    else if(lhs.m_scale < rhs.m_scale) {
      Decimal temp = lhs;
      temp.shift_left(static_cast<uint32_t>(rhs.m_scale - lhs.m_scale));
      cmp = do_compare_magnitudes(temp.m_limbs, rhs.m_limbs);
    }
    else {
      Decimal temp = rhs;
      temp.shift_left(static_cast<uint32_t>(lhs.m_scale - rhs.m_scale));
      cmp = do_compare_magnitudes(lhs.m_limbs, temp.m_limbs);
    }

    return lhs.m_neg ? -cmp : cmp;
  }

void
Decimal::
print_to(::rocket::cow_string& str) const
  {
    ::rocket::cow_string digits;
    if(this->m_limbs.empty())
      digits.push_back('0');
    else {
      size_t k = this->m_limbs.size() - 1;
      do_append_limb(digits, this->m_limbs[k], false);
      while(k != 0) {
        k --;
        do_append_limb(digits, this->m_limbs[k], true);
      }
    }

    if(this->m_neg)
      str.push_back('-');

    if(this->m_scale == 0) {
      str.append(digits.data(), digits.size());
      return;
    }

    // There shall be at least one digit before the decimal point.
    size_t scale = this->m_scale;
    if(digits.size() <= scale)
      str.append(scale + 1 - digits.size(), '0');

    size_t nint = (digits.size() > scale) ? (digits.size() - scale) : 0;
    str.append(digits.data(), nint);
    str.push_back('.');
    str.append(digits.data() + nint, digits.size() - nint);
  }

::rocket::cow_string
Decimal::
to_string() const
  {
    ::rocket::cow_string str;
    this->print_to(str);
    return str;
  }

bool
Decimal::
parse(const char* str, size_t len)
  {
    Decimal dec;
    const char* bptr = str;
    const char* eptr = str + len;

    bool neg = false;
    if((bptr != eptr) && (*bptr == '-')) {
      neg = true;
      bptr ++;
    }

    size_t nint = 0;
    while((bptr != eptr) && (*bptr >= '0') && (*bptr <= '9')) {
      dec.mul_add(10, static_cast<uint32_t>(*bptr - '0'));
      nint ++;
      bptr ++;
    }

    if(nint == 0)
      return false;

    size_t nfrac = 0;
    if((bptr != eptr) && (*bptr == '.')) {
      bptr ++;
      while((bptr != eptr) && (*bptr >= '0') && (*bptr <= '9')) {
        dec.mul_add(10, static_cast<uint32_t>(*bptr - '0'));
        nfrac ++;
        bptr ++;
      }

      if(nfrac == 0)
        return false;
    }

    if((bptr != eptr) || (nfrac > UINT8_MAX))
      return false;

    dec.m_scale = static_cast<uint8_t>(nfrac);
    dec.set_negative(neg);
    *this = ::std::move(dec);
    return true;
  }

N_decimal
Number::
to_decimal() const
  {
    switch(this->type())
      {
      case n_int32:
        return N_decimal(this->m_stor.as<N_int32>());

      case n_int64:
        return N_decimal(this->m_stor.as<N_int64>());

      case n_decimal:
        return this->m_stor.as<N_decimal>();

      default:
        ROCKET_UNREACHABLE();
      }
  }

double
Number::
to_double() const
  {
    switch(this->type())
      {
      case n_int32:
        return static_cast<double>(this->m_stor.as<N_int32>());

      case n_int64:
        return static_cast<double>(this->m_stor.as<N_int64>());

      case n_decimal:
        return this->m_stor.as<N_decimal>().to_double();

      default:
        ROCKET_UNREACHABLE();
      }
  }

void
Number::
print_to(::rocket::cow_string& str) const
  {
    ::rocket::ascii_numput nump;

    switch(this->type())
      {
      case n_int32:
        nump.put_DI(this->m_stor.as<N_int32>());
        str.append(nump.data(), nump.size());
        break;

      case n_int64:
        nump.put_DI(this->m_stor.as<N_int64>());
        str.append(nump.data(), nump.size());
        break;

      case n_decimal:
        this->m_stor.as<N_decimal>().print_to(str);
        break;

      default:
        ROCKET_UNREACHABLE();
      }
  }

::rocket::cow_string
Number::
to_string() const
  {
    ::rocket::cow_string str;
    this->print_to(str);
    return str;
  }

bool
operator==(const Number& lhs, const Number& rhs)
  {
    if(lhs.type() != rhs.type())
      return false;

    switch(lhs.type())
      {
      case n_int32:
        return lhs.as_int32() == rhs.as_int32();

      case n_int64:
        return lhs.as_int64() == rhs.as_int64();

      case n_decimal:
        return lhs.as_decimal() == rhs.as_decimal();

      default:
        ROCKET_UNREACHABLE();
      }
  }

}  // namespace hjson
