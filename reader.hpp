// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef HJSON_READER_HPP_
#define HJSON_READER_HPP_

#include "number.hpp"
#include <rocket/cow_string.hpp>
#include <rocket/tinybuf.hpp>
#include <cstdio>
namespace hjson {

using V_string = ::rocket::cow_u16string;

// These are categories of parse errors. All of them are fatal.
enum Error_Kind : ::std::uint8_t
  {
    error_none               = 0,
    error_malformed_number   = 1,
    error_malformed_string   = 2,
    error_unexpected_token   = 3,
  };

// This describes a parse error. `line` and `column` are 1-based, and denote the
// position of the cursor when the error was detected. `message` is of the form
// `<description>. At line <L>, column <C>`.
struct Diagnostic
  {
    Error_Kind kind = error_none;
    ::std::int64_t line = 0;
    ::std::int64_t column = 0;
    ::rocket::cow_string message;

    explicit operator
    bool() const noexcept
      { return this->kind != error_none;  }
  };

// This structure provides storage for all parser states. Some of these fields are
// for internal use. This structure need not be initialized before it is passed
// to a `Reader`.
struct Parser_Context
  {
    // line and column of the most recently consumed character
    ::std::int64_t line;
    ::std::int64_t column;

    // the first error; its `kind` is `error_none` if there has been no error
    Diagnostic error;

    // internal fields
    int nextc;
    int backc;
    bool has_nextc;
    bool prev_lf;
  };

// This is a cursor over an in-memory buffer.
struct Memory_Source
  {
    const char* bptr;
    const char* sptr;
    const char* eptr;

    constexpr Memory_Source() noexcept
      : bptr(), sptr(), eptr()  { }

    constexpr Memory_Source(const char* s, size_t n) noexcept
      : bptr(s), sptr(s), eptr(s + n)  { }

    int
    getc() noexcept
      {
        int r = -1;
        if(this->sptr != this->eptr) {
          r = static_cast<unsigned char>(*(this->sptr));
          this->sptr ++;
        }
        return r;
      }
  };

// This dispatches byte reads to one of the supported sources.
struct Unified_Source
  {
    Memory_Source* mem = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;

    Unified_Source(Memory_Source* m) noexcept : mem(m)  { }
    Unified_Source(::rocket::tinybuf* b) noexcept : buf(b)  { }
    Unified_Source(::std::FILE* f) noexcept : fp(f)  { }

    int
    getc() const;
  };

// This is the scanner of primitive literals. It reads characters from a source
// with one character of lookahead, and keeps track of lines and columns in the
// `Parser_Context` that it is constructed with. Bytes from the source are
// decoded as UTF-8; malformed sequences yield U+FFFD.
//
// Scanning functions return `true` on success. On failure, they return `false`
// and record a `Diagnostic` into the context, unless there is one already. No
// partial result is ever stored.
class Reader
  {
  private:
    Parser_Context* m_ctx;
    Unified_Source m_usrc;

  private:
    int
    do_getb();

    int
    do_decode_next();

  public:
    // Initializes a reader. The context is reset. The context and the source
    // must outlive this reader.
    Reader(Parser_Context& ctx, Unified_Source usrc) noexcept;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    // Gets the context.
    const Parser_Context&
    context() const noexcept
      { return *(this->m_ctx);  }

    // Gets the position of the most recently consumed character.
    ::std::int64_t
    line() const noexcept
      { return this->m_ctx->line;  }

    ::std::int64_t
    column() const noexcept
      { return this->m_ctx->column;  }

    // Checks whether an error has been recorded.
    bool
    failed() const noexcept
      { return this->m_ctx->error.kind != error_none;  }

    // Gets the next character without consuming it. At the end of input, -1 is
    // returned. Repeated calls return the same character.
    int
    peek();

    // Consumes the next character and returns it. At the end of input, -1 is
    // returned, and the column is advanced nonetheless. A character that
    // follows a line feed begins a new line.
    int
    read();

    // Consumes spaces, tabs, carriage returns and line feeds.
    void
    skip_whitespace();

    // Consumes one character, and checks that it is `expected`.
    bool
    expect(char32_t expected);

    // Consumes characters one by one, and checks that they spell `expected`,
    // which must be ASCII.
    bool
    expect(const char* expected);

    // Reads a JSON numeric literal. The next character must be a minus sign
    // or a digit. Integers that fit in `int32_t` or `int64_t` are returned as
    // such; others are returned as decimals.
    bool
    read_numeric_literal(Number& value);

    // Reads a double-quoted string literal, decoding escape sequences. The next
    // character must be a double quote. Each `\uXXXX` escape yields exactly
    // one UTF-16 code unit.
    bool
    read_string_literal(V_string& value);

    // Builds a diagnostic at the current position. This does not record it.
    Diagnostic
    error(Error_Kind kind, const char* desc) const;

    Diagnostic
    error(Error_Kind kind, const ::rocket::cow_string& desc) const;

    // Records a diagnostic into the context, unless there is one already, and
    // returns `false`.
    bool
    fail(Diagnostic&& diag);

    bool
    fail(Error_Kind kind, const char* desc)
      { return this->fail(this->error(kind, desc));  }
  };

// Checks whether a character is whitespace. Only ASCII space, tab, carriage
// return and line feed are.
constexpr
bool
is_whitespace(int c) noexcept
  {
    return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n');
  }

}  // namespace hjson
#endif
