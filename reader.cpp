// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "reader.hpp"
#include <rocket/ascii_numput.hpp>
#include <cmath>
#include <climits>
namespace hjson {
namespace {

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

// Encodes a code point for use in a message.
void
do_append_utf8(::rocket::cow_string& str, char32_t cp)
  {
    if(cp < 0x80)
      str.push_back(static_cast<char>(cp));
    else if(cp < 0x800) {
      str.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if(cp < 0x10000) {
      str.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else {
      str.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      str.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

void
do_append_found(::rocket::cow_string& str, int c)
  {
    if(c < 0)
      str.append("end of input");
    else {
      str.push_back('\'');
      do_append_utf8(str, static_cast<char32_t>(c));
      str.push_back('\'');
    }
  }

// Appends a code point as UTF-16.
void
do_append_utf16(V_string& str, int cp)
  {
    if(cp < 0x10000)
      str.push_back(static_cast<char16_t>(cp));
    else {
      cp -= 0x10000;
      str.push_back(static_cast<char16_t>(0xD800 | (cp >> 10)));
      str.push_back(static_cast<char16_t>(0xDC00 | (cp & 0x3FF)));
    }
  }

}  // namespace

int
Unified_Source::
getc() const
  {
    if(this->mem)
      return this->mem->getc();
    else if(this->buf)
      return this->buf->getc();
    else if(this->fp)
      return ::fgetc(this->fp);
    else
      ROCKET_UNREACHABLE();
  }

Reader::
Reader(Parser_Context& ctx, Unified_Source usrc) noexcept
  : m_ctx(&ctx), m_usrc(usrc)
  {
    // Initialize parser state.
    ctx.line = 1;
    ctx.column = 0;
    ctx.error = Diagnostic();
    ctx.nextc = -1;
    ctx.backc = -1;
    ctx.has_nextc = false;
    ctx.prev_lf = false;
  }

int
Reader::
do_getb()
  {
    int b = this->m_ctx->backc;
    if(b >= 0) {
      this->m_ctx->backc = -1;
      return b;
    }
    return this->m_usrc.getc();
  }

int
Reader::
do_decode_next()
  {
    int c = this->do_getb();
    if(c < 0x80)
      return c;

    // Parse a multibyte Unicode character. Overlong lead bytes are rejected
    // early.
    int u8len;
    if(is_within(c, 0xC2, 0xDF)) {
      u8len = 2;
      c &= 0x1F;
    }
    else if(is_within(c, 0xE0, 0xEF)) {
      u8len = 3;
      c &= 0x0F;
    }
    else if(is_within(c, 0xF0, 0xF4)) {
      u8len = 4;
      c &= 0x07;
    }
    else
      return 0xFFFD;

    for(int k = 1;  k < u8len;  ++k) {
      int next = this->do_getb();
      if(!is_within(next, 0x80, 0xBF)) {
        // Push the offending byte back, so it will start the next character.
        if(next >= 0)
          this->m_ctx->backc = next;
        return 0xFFFD;
      }

      c <<= 6;
      c |= next & 0x3F;
    }

    if(((u8len == 3) && (c < 0x800))  // overlong
        || ((u8len == 4) && (c < 0x10000))  // overlong
        || is_within(c, 0xD800, 0xDFFF)  // surrogates
        || (c > 0x10FFFF))
      return 0xFFFD;

    return c;
  }

int
Reader::
peek()
  {
    if(!this->m_ctx->has_nextc) {
      this->m_ctx->nextc = this->do_decode_next();
      this->m_ctx->has_nextc = true;
    }
    return this->m_ctx->nextc;
  }

int
Reader::
read()
  {
    int c = this->m_ctx->has_nextc ? this->m_ctx->nextc : this->do_decode_next();
    this->m_ctx->has_nextc = false;

    // A line feed ends its line, but it belongs to that line.
    if(this->m_ctx->prev_lf) {
      this->m_ctx->line ++;
      this->m_ctx->column = 0;
      this->m_ctx->prev_lf = false;
    }

    if(c == '\n')
      this->m_ctx->prev_lf = true;

    this->m_ctx->column ++;
    return c;
  }

void
Reader::
skip_whitespace()
  {
    while(is_whitespace(this->peek()))
      this->read();
  }

bool
Reader::
expect(char32_t expected)
  {
    int c = this->read();
    if(c == static_cast<int>(expected))
      return true;

    ::rocket::cow_string desc;
    desc.append("Expected '");
    do_append_utf8(desc, expected);
    desc.append("', got ");
    do_append_found(desc, c);
    return this->fail(this->error(error_unexpected_token, desc));
  }

bool
Reader::
expect(const char* expected)
  {
    for(size_t k = 0;  expected[k] != 0;  ++k) {
      int c = this->read();
      if(c == static_cast<unsigned char>(expected[k]))
        continue;

      ::rocket::ascii_numput nump;
      nump.put_DI(static_cast<int64_t>(k));

      ::rocket::cow_string desc;
      desc.append("Expected '");
      desc.append(expected);
      desc.append("', got ");
      do_append_found(desc, c);
      desc.append(" at index ");
      desc.append(nump.data(), nump.size());
      return this->fail(this->error(error_unexpected_token, desc));
    }
    return true;
  }

bool
Reader::
read_numeric_literal(Number& value)
  {
    int c = this->peek();
    if((c != '-') && !is_within(c, '0', '9'))
      return this->fail(error_malformed_number, "Invalid JSON numeric literal format");

    bool neg = false;
    if(c == '-') {
      neg = true;
      this->read();
      if(!is_within(this->peek(), '0', '9'))
        return this->fail(error_malformed_number,
                          "Invalid JSON numeric literal; extra negation");
    }

    // Accumulate all digits into the unscaled magnitude, which can't overflow.
    Decimal mant;
    bool zero_start = this->peek() == '0';
    uint32_t nint = 0;
    while(is_within(c = this->peek(), '0', '9')) {
      this->read();
      if(zero_start && (nint == 1))
        return this->fail(error_malformed_number,
                          "leading multiple zeros are not allowed");

      mant.mul_add(10, static_cast<uint32_t>(c - '0'));
      nint ++;
    }

    // fraction
    bool has_frac = false;
    uint32_t nfrac = 0;
    if(this->peek() == '.') {
      has_frac = true;
      this->read();

      // Digits after the 255th are not accumulated. The first of them is
      // the rounding digit and the others only tell whether it is a tie.
      uint32_t rdigit = 0;
      bool sticky = false;
      bool dropped = false;

      while(is_within(c = this->peek(), '0', '9')) {
        this->read();
        uint32_t d = static_cast<uint32_t>(c - '0');
        if(nfrac < UINT8_MAX) {
          mant.mul_add(10, d);
          nfrac ++;
        }
        else if(!dropped) {
          rdigit = d;
          dropped = true;
        }
        else
          sticky |= d != 0;
      }

      if(nfrac == 0)
        return this->fail(error_malformed_number,
                          "Invalid JSON numeric literal; extra dot");

      // Round half to even.
      bool odd = !mant.limbs().empty() && (mant.limbs()[0] % 2 != 0);
      if((rdigit > 5) || ((rdigit == 5) && (sticky || odd)))
        mant.mul_add(1, 1);
    }
    mant.set_scale(static_cast<uint8_t>(nfrac));

    c = this->peek();
    if((c != 'e') && (c != 'E')) {
      mant.set_negative(neg);

      int64_t ival;
      if(!has_frac && mant.get_int64(ival)) {
        // Choose the narrowest integer type.
        if((ival >= INT32_MIN) && (ival <= INT32_MAX))
          value = Number(static_cast<N_int32>(ival));
        else
          value = Number(static_cast<N_int64>(ival));
        return true;
      }

      value = Number(mant);
      return true;
    }

    // exponent
    this->read();

    bool exp_neg = false;
    c = this->peek();
    if(c == '-') {
      exp_neg = true;
      this->read();
    }
    else if(c == '+')
      this->read();

    if(!is_within(this->peek(), '0', '9'))
      return this->fail(error_malformed_number,
                        "Invalid JSON numeric literal; incomplete exponent");

    // Saturate the exponent; anything this large is either out of range or
    // zero.
    uint32_t exp = 0;
    while(is_within(c = this->peek(), '0', '9')) {
      this->read();
      if(exp < 100000)
        exp = exp * 10 + static_cast<uint32_t>(c - '0');
    }

    if(exp_neg) {
      // Scale through binary floating-point division, which is inexact; the
      // quotient is then rounded to 15 significant digits.
      double quot = mant.to_double() / ::std::pow(10.0, static_cast<double>(exp));
      if(!::std::isfinite(quot))
        return this->fail(error_malformed_number,
                          "Invalid JSON numeric literal; value out of range");

      mant = Decimal::from_double(quot);
    }
    else if(exp <= nfrac) {
      // Move the decimal point to the right, within the fraction.
      mant.set_scale(static_cast<uint8_t>(nfrac - exp));
    }
    else {
      // Append zeros, which is exact.
      if(!mant.is_zero() && (exp - nfrac > 1000))
        return this->fail(error_malformed_number,
                          "Invalid JSON numeric literal; exponent out of range");

      mant.shift_left(exp - nfrac);
      mant.set_scale(0);
    }

    mant.set_negative(neg);
    value = Number(mant);
    return true;
  }

bool
Reader::
read_string_literal(V_string& value)
  {
    if(this->peek() != '\"')
      return this->fail(error_malformed_string, "Invalid JSON string literal format");

    this->read();
    V_string str;
    for(;;) {
      int c = this->read();
      if(c < 0)
        return this->fail(error_malformed_string, "JSON string is not closed");

      if(c == '\"') {
        value = ::std::move(str);
        return true;
      }

      if(c != '\\') {
        // Control characters are accepted verbatim.
        do_append_utf16(str, c);
        continue;
      }

      // escape sequence
      c = this->read();
      if(c < 0)
        return this->fail(error_malformed_string,
                          "Invalid JSON string literal; incomplete escape sequence");

      switch(c)
        {
        case '\"':
        case '\\':
        case '/':
          str.push_back(static_cast<char16_t>(c));
          break;

        case 'b':
          str.push_back(u'\b');
          break;

        case 'f':
          str.push_back(u'\f');
          break;

        case 'n':
          str.push_back(u'\n');
          break;

        case 'r':
          str.push_back(u'\r');
          break;

        case 't':
          str.push_back(u'\t');
          break;

        case 'u':
          {
            // Read exactly four characters. A character that is not a hex
            // digit counts as zero.
            uint32_t cu = 0;
            for(int k = 0;  k != 4;  ++k) {
              cu <<= 4;
              c = this->read();
              if(c < 0)
                return this->fail(error_malformed_string,
                                  "Incomplete unicode character escape literal");

              if(is_within(c, '0', '9'))
                cu += static_cast<uint32_t>(c - '0');
              else if(is_within(c, 'A', 'F'))
                cu += static_cast<uint32_t>(c - 'A' + 10);
              else if(is_within(c, 'a', 'f'))
                cu += static_cast<uint32_t>(c - 'a' + 10);
            }

            // Surrogates are stored as is, and are not combined.
            str.push_back(static_cast<char16_t>(cu));
          }
          break;

        default:
          return this->fail(error_malformed_string,
                            "Invalid JSON string literal; unexpected escape character");
        }
    }
  }

Diagnostic
Reader::
error(Error_Kind kind, const char* desc) const
  {
    ::rocket::ascii_numput nump;
    Diagnostic diag;
    diag.kind = kind;
    diag.line = this->m_ctx->line;
    diag.column = this->m_ctx->column;

    diag.message.append(desc);
    diag.message.append(". At line ");
    nump.put_DI(diag.line);
    diag.message.append(nump.data(), nump.size());
    diag.message.append(", column ");
    nump.put_DI(diag.column);
    diag.message.append(nump.data(), nump.size());
    return diag;
  }

Diagnostic
Reader::
error(Error_Kind kind, const ::rocket::cow_string& desc) const
  {
    return this->error(kind, desc.c_str());
  }

bool
Reader::
fail(Diagnostic&& diag)
  {
    ROCKET_ASSERT(diag.kind != error_none);

    // Only the first error is kept.
    if(this->m_ctx->error.kind == error_none)
      this->m_ctx->error = ::std::move(diag);
    return false;
  }

}  // namespace hjson
