// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "reader.hpp"
#include <cstdio>
#include <cstring>
#undef NDEBUG
#include <assert.h>

int
main(void)
  {
    ::hjson::Parser_Context ctx;

    {
      // lookahead
      ::hjson::Memory_Source msrc("ab", 2);
      ::hjson::Reader rd(ctx, &msrc);
      assert(rd.line() == 1);
      assert(rd.column() == 0);
      assert(!rd.failed());

      assert(rd.peek() == 'a');
      assert(rd.peek() == 'a');
      assert(rd.column() == 0);
      assert(rd.read() == 'a');
      assert(rd.column() == 1);
      assert(rd.read() == 'b');
      assert(rd.column() == 2);

      // The column advances at the end of input, too.
      assert(rd.peek() == -1);
      assert(rd.peek() == -1);
      assert(rd.column() == 2);
      assert(rd.read() == -1);
      assert(rd.column() == 3);
    }

    {
      // A line feed belongs to the line that it ends.
      ::hjson::Memory_Source msrc("ab\ncd", 5);
      ::hjson::Reader rd(ctx, &msrc);
      assert(rd.read() == 'a');
      assert(rd.read() == 'b');
      assert(rd.read() == '\n');
      assert(rd.line() == 1);
      assert(rd.column() == 3);
      assert(rd.peek() == 'c');
      assert(rd.line() == 1);

      assert(!rd.expect(U'x'));
      assert(rd.failed());
      assert(ctx.error.kind == ::hjson::error_unexpected_token);
      assert(ctx.error.line == 2);
      assert(ctx.error.column == 1);
      assert(ctx.error.message == "Expected 'x', got 'c'. At line 2, column 1");
    }

    {
      ::hjson::Memory_Source msrc("\n\n\nx", 4);
      ::hjson::Reader rd(ctx, &msrc);
      rd.skip_whitespace();
      assert(rd.line() == 3);
      assert(rd.column() == 1);
      assert(rd.read() == 'x');
      assert(rd.line() == 4);
      assert(rd.column() == 1);
    }

    {
      // whitespace
      ::hjson::Memory_Source msrc(" \t\r\n  x \v", 9);
      ::hjson::Reader rd(ctx, &msrc);
      rd.skip_whitespace();
      assert(rd.peek() == 'x');
      assert(rd.line() == 2);
      assert(rd.column() == 2);
      rd.skip_whitespace();
      assert(rd.read() == 'x');
      rd.skip_whitespace();
      assert(rd.peek() == '\v');
      assert(rd.read() == '\v');
      rd.skip_whitespace();
      assert(rd.peek() == -1);

      assert(::hjson::is_whitespace(' '));
      assert(::hjson::is_whitespace('\n'));
      assert(!::hjson::is_whitespace('\f'));
      assert(!::hjson::is_whitespace(-1));
    }

    {
      // literals
      ::hjson::Memory_Source msrc("true nul", 8);
      ::hjson::Reader rd(ctx, &msrc);
      assert(rd.expect("true"));
      assert(rd.column() == 4);
      assert(rd.expect(U' '));
      assert(!rd.expect("null"));
      assert(ctx.error.kind == ::hjson::error_unexpected_token);
      assert(ctx.error.message == "Expected 'null', got end of input at index 3. At line 1, column 9");
    }

    {
      ::hjson::Memory_Source msrc("trux", 4);
      ::hjson::Reader rd(ctx, &msrc);
      assert(!rd.expect("true"));
      assert(ctx.error.message == "Expected 'true', got 'x' at index 3. At line 1, column 4");
    }

    {
      ::hjson::Memory_Source msrc("\xE4\xB8\xAD\xE6\x96\x87", 6);
      ::hjson::Reader rd(ctx, &msrc);
      assert(rd.expect(U'中'));
      assert(!rd.expect(U'x'));
      assert(ctx.error.message == "Expected 'x', got '\xE6\x96\x87'. At line 1, column 2");
    }

    {
      // Building a diagnostic doesn't record it.
      ::hjson::Memory_Source msrc("abc", 3);
      ::hjson::Reader rd(ctx, &msrc);
      rd.read();
      ::hjson::Diagnostic diag = rd.error(::hjson::error_unexpected_token, "Something wrong");
      assert(diag);
      assert(diag.kind == ::hjson::error_unexpected_token);
      assert(diag.line == 1);
      assert(diag.column == 1);
      assert(diag.message == "Something wrong. At line 1, column 1");
      assert(!rd.failed());
      assert(!ctx.error);

      // Only the first error is kept.
      assert(!rd.fail(::std::move(diag)));
      rd.read();
      assert(!rd.fail(::hjson::error_malformed_number, "Another"));
      assert(ctx.error.kind == ::hjson::error_unexpected_token);
      assert(ctx.error.message == "Something wrong. At line 1, column 1");
    }

    {
      // A new reader resets the context.
      ::hjson::Memory_Source msrc("", 0);
      ::hjson::Reader rd(ctx, &msrc);
      assert(!rd.failed());
      assert(ctx.error.kind == ::hjson::error_none);
      assert(ctx.error.message.empty());
      assert(rd.line() == 1);
      assert(rd.column() == 0);
      assert(rd.peek() == -1);
    }

    {
      // files
      ::std::FILE* fp = ::std::tmpfile();
      assert(fp);
      ::std::fputs("[1,\n \"a\"]", fp);
      ::std::rewind(fp);

      ::hjson::Reader rd(ctx, fp);
      assert(rd.expect(U'['));
      ::hjson::Number num;
      assert(rd.read_numeric_literal(num));
      assert(num.as_int32() == 1);
      assert(rd.expect(U','));
      rd.skip_whitespace();
      ::hjson::V_string str;
      assert(rd.read_string_literal(str));
      assert(str == u"a");
      assert(rd.line() == 2);
      assert(rd.column() == 4);
      assert(rd.expect(U']'));
      assert(rd.peek() == -1);
      ::std::fclose(fp);
    }
  }
