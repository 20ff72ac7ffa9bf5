// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "reader.hpp"
#include <climits>
#include <cmath>
#include <cstring>
#undef NDEBUG
#include <assert.h>

namespace {

bool
scan(::hjson::Number& num, ::hjson::Parser_Context& ctx, const char* str, size_t len)
  {
    ::hjson::Memory_Source msrc(str, len);
    ::hjson::Reader rd(ctx, &msrc);
    return rd.read_numeric_literal(num);
  }

bool
scan(::hjson::Number& num, ::hjson::Parser_Context& ctx, const char* str)
  {
    return scan(num, ctx, str, ::std::strlen(str));
  }

::hjson::Decimal
dec(const char* str)
  {
    ::hjson::Decimal d;
    bool succ = d.parse(str, ::std::strlen(str));
    assert(succ);
    return d;
  }

}  // namespace

int
main(void)
  {
    ::hjson::Parser_Context ctx;
    ::hjson::Number num;

    {
      // 32-bit integers
      assert(scan(num, ctx, "0"));
      assert(num.type() == ::hjson::n_int32);
      assert(num.as_int32() == 0);

      assert(scan(num, ctx, "-0"));
      assert(num.is_int32());
      assert(num.as_int32() == 0);

      assert(scan(num, ctx, "42"));
      assert(num.is_int32());
      assert(num.as_int32() == 42);

      assert(scan(num, ctx, "2147483647"));
      assert(num.is_int32());
      assert(num.as_int32() == INT32_MAX);

      assert(scan(num, ctx, "-2147483648"));
      assert(num.is_int32());
      assert(num.as_int32() == INT32_MIN);
    }

    {
      // 64-bit integers
      assert(scan(num, ctx, "2147483648"));
      assert(num.type() == ::hjson::n_int64);
      assert(num.as_int64() == 2147483648);

      assert(scan(num, ctx, "-2147483649"));
      assert(num.is_int64());
      assert(num.as_int64() == -2147483649);

      assert(scan(num, ctx, "9223372036854775807"));
      assert(num.is_int64());
      assert(num.as_int64() == INT64_MAX);

      assert(scan(num, ctx, "-9223372036854775808"));
      assert(num.is_int64());
      assert(num.as_int64() == INT64_MIN);
    }

    {
      // integers beyond 64 bits
      assert(scan(num, ctx, "9223372036854775808"));
      assert(num.type() == ::hjson::n_decimal);
      assert(num.as_decimal().scale() == 0);
      assert(num.to_string() == "9223372036854775808");

      assert(scan(num, ctx, "-9223372036854775809"));
      assert(num.is_decimal());
      assert(num.as_decimal().is_negative());
      assert(num.to_string() == "-9223372036854775809");

      assert(scan(num, ctx, "123456789012345678901234567890123456789"));
      assert(num.is_decimal());
      assert(num.to_string() == "123456789012345678901234567890123456789");
    }

    {
      // leading zeros
      assert(!scan(num, ctx, "00"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.line == 1);
      assert(ctx.error.column == 2);
      assert(ctx.error.message == "leading multiple zeros are not allowed. At line 1, column 2");

      assert(!scan(num, ctx, "01"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "leading multiple zeros are not allowed. At line 1, column 2");

      assert(!scan(num, ctx, "-007"));
      assert(ctx.error.message == "leading multiple zeros are not allowed. At line 1, column 3");

      assert(scan(num, ctx, "0.01"));
      assert(num.is_decimal());
    }

    {
      // signs
      assert(!scan(num, ctx, "-"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "Invalid JSON numeric literal; extra negation. At line 1, column 1");

      assert(!scan(num, ctx, "-x"));
      assert(ctx.error.message == "Invalid JSON numeric literal; extra negation. At line 1, column 1");

      assert(!scan(num, ctx, "--1"));
      assert(ctx.error.message == "Invalid JSON numeric literal; extra negation. At line 1, column 1");

      assert(!scan(num, ctx, ".5"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "Invalid JSON numeric literal format. At line 1, column 0");

      assert(!scan(num, ctx, "+1"));
      assert(ctx.error.message == "Invalid JSON numeric literal format. At line 1, column 0");
    }

    {
      // fractions
      assert(scan(num, ctx, "1.5"));
      assert(num.is_decimal());
      assert(num.as_decimal() == dec("1.5"));
      assert(num.as_decimal().scale() == 1);
      assert(num.to_string() == "1.5");
      assert(num.to_double() == 1.5);

      assert(scan(num, ctx, "-12.3400"));
      assert(num.is_decimal());
      assert(num.as_decimal().scale() == 4);
      assert(num.to_string() == "-12.3400");

      assert(scan(num, ctx, "-0.0"));
      assert(num.is_decimal());
      assert(num.as_decimal().is_zero());
      assert(!num.as_decimal().is_negative());
      assert(num.to_string() == "0.0");

      assert(!scan(num, ctx, "1."));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "Invalid JSON numeric literal; extra dot. At line 1, column 2");

      assert(!scan(num, ctx, "1.e5"));
      assert(ctx.error.message == "Invalid JSON numeric literal; extra dot. At line 1, column 2");
    }

    {
      // fractions that are too long are rounded half to even
      ::rocket::cow_string str("0.");
      str.append(254, '0');
      str.append("25");
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.is_decimal());
      assert(num.as_decimal().scale() == 255);
      assert(num.as_decimal().limbs().size() == 1);
      assert(num.as_decimal().limbs()[0] == 2);

      str.assign("0.");
      str.append(254, '0');
      str.append("35");
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.as_decimal().scale() == 255);
      assert(num.as_decimal().limbs()[0] == 4);
    }

    {
      // very long fractions keep 255 digits
      ::rocket::cow_string str("0.");
      str.append(200000, '1');
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.is_decimal());
      assert(num.as_decimal().scale() == 255);
      ::rocket::cow_string expect("0.");
      expect.append(255, '1');
      assert(num.to_string() == expect);

      // a tie followed by many zeros stays even
      str.assign("0.");
      str.append(254, '0');
      str.append("25");
      str.append(200000, '0');
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.as_decimal().scale() == 255);
      assert(num.as_decimal().limbs().size() == 1);
      assert(num.as_decimal().limbs()[0] == 2);

      // a non-zero digit far behind a tie rounds up
      str.assign("0.");
      str.append(254, '0');
      str.append("25");
      str.append(200000, '0');
      str.append("1");
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.as_decimal().scale() == 255);
      assert(num.as_decimal().limbs()[0] == 3);

      // rounding up carries across limbs
      str.assign("0.");
      str.append(255, '9');
      str.append(100000, '9');
      assert(scan(num, ctx, str.data(), str.size()));
      assert(num.as_decimal().scale() == 255);
      assert(num.as_decimal() == ::hjson::Decimal(1));
    }

    {
      // non-negative exponents are exact
      assert(scan(num, ctx, "1e2"));
      assert(num.is_decimal());
      assert(num.as_decimal() == ::hjson::Decimal(100));
      assert(num.as_decimal().scale() == 0);
      assert(num.to_string() == "100");

      assert(scan(num, ctx, "1E+2"));
      assert(num.is_decimal());
      assert(num.to_string() == "100");

      assert(scan(num, ctx, "-3e0"));
      assert(num.is_decimal());
      assert(num.to_string() == "-3");

      assert(scan(num, ctx, "1.5e1"));
      assert(num.is_decimal());
      assert(num.as_decimal() == ::hjson::Decimal(15));

      assert(scan(num, ctx, "1.25e1"));
      assert(num.to_string() == "12.5");

      assert(scan(num, ctx, "2.5e3"));
      assert(num.to_string() == "2500");

      assert(scan(num, ctx, "1e30"));
      assert(num.to_string() == "1000000000000000000000000000000");

      assert(scan(num, ctx, "0e99999"));
      assert(num.as_decimal().is_zero());

      assert(!scan(num, ctx, "1e1001"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "Invalid JSON numeric literal; exponent out of range. At line 1, column 6");
    }

    {
      // negative exponents go through binary floating-point division
      assert(scan(num, ctx, "1e-2"));
      assert(num.is_decimal());
      assert(num.as_decimal().scale() == 2);
      assert(num.as_decimal().limbs().size() == 1);
      assert(num.as_decimal().limbs()[0] == 1);
      assert(num.to_string() == "0.01");
      assert(::std::fabs(num.to_double() - 0.01) < 1.0e-15);

      assert(scan(num, ctx, "-25e-1"));
      assert(num.is_decimal());
      assert(num.as_decimal().is_negative());
      assert(num.to_string() == "-2.5");

      assert(scan(num, ctx, "123.456E-3"));
      assert(num.to_string() == "0.123456");

      assert(scan(num, ctx, "1e-400"));
      assert(num.is_decimal());
      assert(num.as_decimal().is_zero());
    }

    {
      // incomplete exponents
      assert(!scan(num, ctx, "1e"));
      assert(ctx.error.kind == ::hjson::error_malformed_number);
      assert(ctx.error.message == "Invalid JSON numeric literal; incomplete exponent. At line 1, column 2");

      assert(!scan(num, ctx, "1e+"));
      assert(ctx.error.message == "Invalid JSON numeric literal; incomplete exponent. At line 1, column 3");

      assert(!scan(num, ctx, "1E-x"));
      assert(ctx.error.message == "Invalid JSON numeric literal; incomplete exponent. At line 1, column 3");
    }

    {
      // The scanner stops before the first character that is not part of the
      // literal.
      const char str[] = "123, 4";
      ::hjson::Memory_Source msrc(str, 6);
      ::hjson::Reader rd(ctx, &msrc);
      assert(rd.read_numeric_literal(num));
      assert(num.as_int32() == 123);
      assert(rd.column() == 3);
      assert(rd.peek() == ',');
    }

    {
      // Failure leaves the output unchanged.
      num = ::hjson::Number(7);
      assert(!scan(num, ctx, "1.x"));
      assert(num.is_int32());
      assert(num.as_int32() == 7);
    }

    {
      // Integers survive printing and scanning again.
      static constexpr const char* s_literals[] =
        {
          "0", "1", "-1", "2147483647", "-2147483648", "2147483648",
          "-9223372036854775808", "9223372036854775807", "9223372036854775808",
          "-99999999999999999999999999999", "1000000000000000000",
        };

      for(const char* lit : s_literals) {
        assert(scan(num, ctx, lit));
        ::rocket::cow_string str = num.to_string();
        assert(str == lit);

        ::hjson::Number again;
        assert(scan(again, ctx, str.data(), str.size()));
        assert(again == num);
      }
    }

    {
      // decimal arithmetic
      assert(dec("1.50") == dec("1.5"));
      assert(dec("-0.5") != dec("0.5"));
      assert(::hjson::Decimal::compare(dec("-2"), dec("1.999")) < 0);
      assert(::hjson::Decimal::compare(dec("10"), dec("9.99999")) > 0);
      assert(::hjson::Decimal::compare(dec("-10"), dec("-9.5")) < 0);
      assert(dec("0.000") == ::hjson::Decimal());

      ::hjson::Decimal d = dec("2.345");
      d.round_to_scale(2);
      assert(d.to_string() == "2.34");

      d = dec("2.355");
      d.round_to_scale(2);
      assert(d.to_string() == "2.36");

      d = dec("2.3451");
      d.round_to_scale(2);
      assert(d.to_string() == "2.35");

      d = dec("-0.004");
      d.round_to_scale(2);
      assert(d.is_zero());
      assert(!d.is_negative());

      d = dec("12.3000");
      d.trim_trailing_zeros();
      assert(d.scale() == 1);
      assert(d.to_string() == "12.3");

      int64_t ival = 0;
      assert(dec("-9223372036854775808").get_int64(ival));
      assert(ival == INT64_MIN);
      assert(!dec("9223372036854775808").get_int64(ival));
      assert(!dec("1.0").get_int64(ival));
      assert(ival == INT64_MIN);

      assert(::hjson::Decimal::from_double(0.1).to_string() == "0.1");
      assert(::hjson::Decimal::from_double(-1234.5).to_string() == "-1234.5");
      assert(::hjson::Decimal::from_double(1.0e20).to_string() == "100000000000000000000");
      assert(::hjson::Decimal::from_double(0.0).to_string() == "0");
      assert(::hjson::Decimal::from_double(0.1 + 0.2).to_string() == "0.3");
      assert(::hjson::Decimal::from_double(1.5e-7).to_string() == "0.00000015");
      assert(::hjson::Decimal::from_double(123.456).to_string() == "123.456");
      assert(dec("-0.25").to_double() == -0.25);

      ::hjson::Decimal bad = dec("3");
      assert(!bad.parse("1.", 2));
      assert(!bad.parse("", 0));
      assert(!bad.parse("1e5", 3));
      assert(!bad.parse("--1", 3));
      assert(bad == ::hjson::Decimal(3));
    }

    {
      // Numbers of different representations are not equal.
      assert(::hjson::Number(1) == ::hjson::Number(1));
      assert(::hjson::Number(1) != ::hjson::Number(static_cast<::hjson::N_int64>(1)));
      assert(::hjson::Number(1) != ::hjson::Number(::hjson::Decimal(1)));
      assert(::hjson::Number(dec("1.50")) == ::hjson::Number(dec("1.5")));
      assert(::hjson::Number(5).to_decimal() == ::hjson::Decimal(5));
      assert(::hjson::Number(static_cast<::hjson::N_int64>(-5)).to_double() == -5.0);
    }
  }
