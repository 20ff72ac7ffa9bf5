// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "hjson.hpp"
#include <rocket/tinybuf.hpp>
#include <rocket/ascii_numput.hpp>
#include <memory>
#include <vector>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <stdexcept>
template class ::rocket::variant<HJSON_TYPES_OOC4EIQU_(::hjson::V)>;
template class ::rocket::cow_vector<::hjson::Value>;
template class ::rocket::cow_hashmap<::hjson::V_string,
    ::hjson::Value, ::hjson::V_string::hash>;
namespace hjson {
namespace {

using bytes_type = ::std::aligned_storage<sizeof(Variant), sizeof(void*)>::type;
using unique_file = ::std::unique_ptr<::std::FILE, int (*)(::std::FILE*)>;

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

template<typename... Ts>
constexpr ROCKET_ALWAYS_INLINE
bool
is_any(int c, Ts... accept_set)
  {
    return (... || (c == accept_set));
  }

// Checks whether the last extension of `path` is `.json`, ignoring case.
bool
do_is_json_path(const char* path)
  {
    const char* name = ::std::strrchr(path, '/');
    name = name ? (name + 1) : path;
    const char* ext = ::std::strrchr(name, '.');
    if(!ext)
      return false;

    static constexpr char s_json[] = ".json";
    if(::std::strlen(ext) != sizeof(s_json) - 1)
      return false;

    for(size_t k = 0;  k != sizeof(s_json) - 1;  ++k) {
      int ch = static_cast<unsigned char>(ext[k]);
      if(is_within(ch, 'A', 'Z'))
        ch |= 0x20;
      if(ch != s_json[k])
        return false;
    }
    return true;
  }

// Reads `key: ` inside an object.
bool
do_read_key(V_string& key, Reader& rd)
  {
    rd.skip_whitespace();
    if(rd.peek() != '\"') {
      rd.read();
      return rd.fail(error_unexpected_token, "Missing key string");
    }

    if(!rd.read_string_literal(key))
      return false;

    rd.skip_whitespace();
    if(rd.read() != ':')
      return rd.fail(error_unexpected_token, "Missing colon");

    return true;
  }

bool
do_read_json(Variant& root, Reader& rd, const Load_Options& opts)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        Variant* target;
        V_array* psa;
        V_object* pso;
      };

    ::std::vector<xFrame> stack;
    V_string key;
    V_string str;
    Number num;
    Variant* pstor = &root;

  do_pack_value_loop_:
    if(stack.size() > opts.nesting_limit)
      return rd.fail(error_unexpected_token, "Nesting limit exceeded");

    rd.skip_whitespace();
    switch(rd.peek())
      {
      case '[':
        rd.read();
        rd.skip_whitespace();
        if(rd.peek() != ']') {
          // open
          auto& frm = stack.emplace_back();
          frm.target = pstor;
          frm.psa = &(pstor->emplace<V_array>());
          frm.pso = nullptr;
          pstor = &(frm.psa->emplace_back().mf_stor());
          goto do_pack_value_loop_;
        }

        rd.read();
        pstor->emplace<V_array>();
        break;

      case '{':
        rd.read();
        rd.skip_whitespace();
        if(rd.peek() != '}') {
          // open
          auto& frm = stack.emplace_back();
          frm.target = pstor;
          frm.psa = nullptr;
          frm.pso = &(pstor->emplace<V_object>());
          if(!do_read_key(key, rd))
            return false;

          // A duplicate key overwrites the previous value.
          pstor = &(frm.pso->try_emplace(key).first->second.mf_stor());
          goto do_pack_value_loop_;
        }

        rd.read();
        pstor->emplace<V_object>();
        break;

      case '\"':
        if(!rd.read_string_literal(str))
          return false;

        pstor->emplace<V_string>(::std::move(str));
        break;

      case '-':
      case '0': case '1': case '2': case '3': case '4':
      case '5': case '6': case '7': case '8': case '9':
        if(!rd.read_numeric_literal(num))
          return false;

        pstor->emplace<V_number>(num);
        break;

      case 't':
        if(!rd.expect("true"))
          return false;

        pstor->emplace<V_boolean>(true);
        break;

      case 'f':
        if(!rd.expect("false"))
          return false;

        pstor->emplace<V_boolean>(false);
        break;

      case 'n':
        if(!rd.expect("null"))
          return false;

        pstor->emplace<V_null>();
        break;

      case -1:
        rd.read();
        return rd.fail(error_unexpected_token, "Missing value");

      default:
        rd.read();
        return rd.fail(error_unexpected_token, "Invalid token");
      }

    while(!stack.empty()) {
      const auto& frm = stack.back();
      rd.skip_whitespace();
      int c = rd.read();
      if(frm.psa) {
        // array
        if(c == ',') {
          // next
          pstor = &(frm.psa->emplace_back().mf_stor());
          goto do_pack_value_loop_;
        }

        if(c != ']')
          return rd.fail(error_unexpected_token, "Missing comma or closed bracket");
      }
      else {
        // object
        if(c == ',') {
          // next
          if(!do_read_key(key, rd))
            return false;

          pstor = &(frm.pso->try_emplace(key).first->second.mf_stor());
          goto do_pack_value_loop_;
        }

        if(c != '}')
          return rd.fail(error_unexpected_token, "Missing comma or closed brace");
      }

      // close
      pstor = frm.target;
      stack.pop_back();
    }

    rd.skip_whitespace();
    if(rd.peek() >= 0) {
      rd.read();
      return rd.fail(error_unexpected_token, "Extra characters after value");
    }
    return true;
  }

bool
do_parse_with(Value& value, Parser_Context& ctx, Unified_Source usrc,
              const Load_Options& opts, Grammar_Reader* grammar)
  {
    Json_Reader json;
    if(!grammar)
      grammar = &json;

    Reader rd(ctx, usrc);
    Value temp;
    if(!grammar->read_document(temp, rd, opts)) {
      // Make sure there is something to report.
      rd.fail(error_unexpected_token, "Invalid document");
      return false;
    }

    value.swap(temp);
    return true;
  }

void
do_escape_string(Unified_Sink usink, const V_string& str)
  {
    char temp[8] = "\\";
    ::rocket::ascii_numput nump;
    for(size_t k = 0;  k != str.size();  ++k) {
      int ch = static_cast<int>(str[k]);
      temp[1] = static_cast<char>(ch);

      if(is_any(ch, '\\', '\"', '/'))
        usink.putn(temp, 2);
      else if(is_within(ch, 0x20, 0x7E))
        usink.putc(temp[1]);
      else if(ch == '\b')
        usink.putn("\\b", 2);
      else if(ch == '\f')
        usink.putn("\\f", 2);
      else if(ch == '\n')
        usink.putn("\\n", 2);
      else if(ch == '\r')
        usink.putn("\\r", 2);
      else if(ch == '\t')
        usink.putn("\\t", 2);
      else {
        // Surrogates are written one by one, so unpaired ones survive.
        nump.put_XU(static_cast<uint32_t>(ch), 4);
        temp[1] = 'u';
        ::std::memcpy(temp + 2, nump.data() + 2, 4);
        usink.putn(temp, 6);
      }
    }
  }

void
do_break_line(Unified_Sink usink, size_t depth, const Save_Options& opts)
  {
    if(opts.inline_layout)
      return;

    usink.putc('\n');
    for(size_t k = 0;  k != depth;  ++k)
      usink.putn("  ", 2);
  }

void
do_put_key(Unified_Sink usink, const V_string& key, const Save_Options& opts)
  {
    usink.putc('\"');
    do_escape_string(usink, key);
    if(opts.inline_layout)
      usink.putn("\":", 2);
    else
      usink.putn("\": ", 3);
  }

void
do_print_json(Unified_Sink usink, const Variant& root, const Save_Options& opts)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        const V_array* psa;
        V_array::const_iterator ita;
        const V_object* pso;
        V_object::const_iterator ito;
      };

    ::std::vector<xFrame> stack;
    ::rocket::cow_string nstr;
    const Variant* pstor = &root;

  do_unpack_loop_:
    switch(static_cast<Type>(pstor->index()))
      {
      case t_null:
        usink.putn("null", 4);
        break;

      case t_array:
        if(!pstor->as<V_array>().empty()) {
          // open
          auto& frm = stack.emplace_back();
          frm.psa = &(pstor->as<V_array>());
          frm.ita = frm.psa->begin();
          usink.putc('[');
          do_break_line(usink, stack.size(), opts);
          pstor = &(frm.ita->mf_stor());
          goto do_unpack_loop_;
        }

        usink.putn("[]", 2);
        break;

      case t_object:
        if(!pstor->as<V_object>().empty()) {
          // open
          auto& frm = stack.emplace_back();
          frm.pso = &(pstor->as<V_object>());
          frm.ito = frm.pso->begin();
          usink.putc('{');
          do_break_line(usink, stack.size(), opts);
          do_put_key(usink, frm.ito->first, opts);
          pstor = &(frm.ito->second.mf_stor());
          goto do_unpack_loop_;
        }

        usink.putn("{}", 2);
        break;

      case t_boolean:
        if(pstor->as<V_boolean>())
          usink.putn("true", 4);
        else
          usink.putn("false", 5);
        break;

      case t_number:
        nstr.clear();
        pstor->as<V_number>().print_to(nstr);
        usink.putn(nstr.data(), nstr.size());
        break;

      case t_string:
        usink.putc('\"');
        do_escape_string(usink, pstor->as<V_string>());
        usink.putc('\"');
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "hjson::Value: unknown type enumeration `%d`",
              static_cast<int>(pstor->index()));
      }

    while(!stack.empty()) {
      auto& frm = stack.back();
      if(frm.psa) {
        // array
        if(++ frm.ita != frm.psa->end()) {
          // next
          usink.putc(',');
          do_break_line(usink, stack.size(), opts);
          pstor = &(frm.ita->mf_stor());
          goto do_unpack_loop_;
        }

        // end
        do_break_line(usink, stack.size() - 1, opts);
        usink.putc(']');
      }
      else {
        // object
        if(++ frm.ito != frm.pso->end()) {
          // next
          usink.putc(',');
          do_break_line(usink, stack.size(), opts);
          do_put_key(usink, frm.ito->first, opts);
          pstor = &(frm.ito->second.mf_stor());
          goto do_unpack_loop_;
        }

        // end
        do_break_line(usink, stack.size() - 1, opts);
        usink.putc('}');
      }

      // close
      stack.pop_back();
    }
  }

}  // namespace

void
Unified_Sink::
putc(char c) const
  {
    if(this->str)
      this->str->push_back(c);
    else if(this->buf)
      this->buf->putc(c);
    else if(this->fp)
      ::fputc(c, this->fp);
    else
      ROCKET_UNREACHABLE();
  }

void
Unified_Sink::
putn(const char* s, size_t n) const
  {
    if(this->str)
      this->str->append(s, n);
    else if(this->buf)
      this->buf->putn(s, n);
    else if(this->fp)
      ::fwrite(s, 1, n, this->fp);
    else
      ROCKET_UNREACHABLE();
  }

void
Value::
do_nonrecursive_destructor() noexcept
  {
    // Break deep recursion with a handwritten stack. The children of a
    // container that is not shared are moved there as raw bytes, and each
    // of them is left behind as null.
    ::std::vector<bytes_type> stack;
    const auto move_children = [&](auto& cont, auto&& value_of)
      {
        if(cont.unique())
          for(auto it = cont.mut_begin();  it != cont.end();  ++it)
            ::std::swap(stack.emplace_back(), reinterpret_cast<bytes_type&>(value_of(*it).m_stor));
      };

  do_unpack_loop_:
    try {
      if(this->m_stor.index() == t_array)
        move_children(this->m_stor.mut<V_array>(), [](Value& elem) -> Value& { return elem;  });
      else if(this->m_stor.index() == t_object)
        move_children(this->m_stor.mut<V_object>(), [](auto& pair) -> Value& { return pair.second;  });
    }
    catch(::std::exception& stdex)
      { ::std::fprintf(stderr, "WARNING: %s\n", stdex.what());  }

    // An all-zero storage is a null value, whose destructor is trivial.
    ::rocket::destroy(&(this->m_stor));
    reinterpret_cast<bytes_type&>(this->m_stor) = bytes_type();

    if(!stack.empty()) {
      reinterpret_cast<bytes_type&>(this->m_stor) = stack.back();
      stack.pop_back();
      goto do_unpack_loop_;
    }
  }

bool
Value::
parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf, const Load_Options& opts,
           Grammar_Reader* grammar)
  {
    return do_parse_with(*this, ctx, &buf, opts, grammar);
  }

bool
Value::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, const Load_Options& opts,
           Grammar_Reader* grammar)
  {
    Memory_Source msrc(str.data(), str.size());
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse_with(Parser_Context& ctx, const char* str, size_t len, const Load_Options& opts,
           Grammar_Reader* grammar)
  {
    Memory_Source msrc(str, len);
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse_with(Parser_Context& ctx, const char* str, const Load_Options& opts,
           Grammar_Reader* grammar)
  {
    Memory_Source msrc(str, ::std::strlen(str));
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse_with(Parser_Context& ctx, ::std::FILE* fp, const Load_Options& opts,
           Grammar_Reader* grammar)
  {
    return do_parse_with(*this, ctx, fp, opts, grammar);
  }

bool
Value::
parse(::rocket::tinybuf& buf, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    return do_parse_with(*this, ctx, &buf, opts, grammar);
  }

bool
Value::
parse(const ::rocket::cow_string& str, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    Memory_Source msrc(str.data(), str.size());
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse(const char* str, size_t len, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    Memory_Source msrc(str, len);
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse(const char* str, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    Memory_Source msrc(str, ::std::strlen(str));
    return do_parse_with(*this, ctx, &msrc, opts, grammar);
  }

bool
Value::
parse(::std::FILE* fp, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    return do_parse_with(*this, ctx, fp, opts, grammar);
  }

bool
Value::
load_with(Parser_Context& ctx, const char* path, const Load_Options& opts,
          Grammar_Reader* grammar)
  {
    unique_file fp(::std::fopen(path, "rb"), ::std::fclose);
    if(!fp)
      ::rocket::sprintf_and_throw<::std::runtime_error>(
            "hjson::Value: could not open file `%s` for reading (errno `%d`)",
            path, errno);

    // JSON files are never parsed with another grammar.
    Json_Reader json;
    if(do_is_json_path(path))
      grammar = &json;

    bool succ = do_parse_with(*this, ctx, fp.get(), opts, grammar);
    if(::std::ferror(fp.get()))
      ::rocket::sprintf_and_throw<::std::runtime_error>(
            "hjson::Value: could not read file `%s`", path);

    if(!succ) {
      ctx.error.message.append(" (in ");
      ctx.error.message.append(path);
      ctx.error.message.push_back(')');
    }

    if(::std::fclose(fp.release()) != 0)
      ::std::fprintf(stderr, "WARNING: could not close file `%s` (errno `%d`)\n",
                     path, errno);
    return succ;
  }

bool
Value::
load_from(const char* path, const Load_Options& opts, Grammar_Reader* grammar)
  {
    Parser_Context ctx;
    return this->load_with(ctx, path, opts, grammar);
  }

void
Value::
print_to(::rocket::tinybuf& buf, const Save_Options& opts) const
  {
    Json_Writer json;
    json.write_document(&buf, *this, opts);
  }

void
Value::
print_to(::rocket::cow_string& str, const Save_Options& opts) const
  {
    Json_Writer json;
    json.write_document(&str, *this, opts);
  }

void
Value::
print_to(::std::FILE* fp, const Save_Options& opts) const
  {
    Json_Writer json;
    json.write_document(fp, *this, opts);
  }

::rocket::cow_string
Value::
to_string(const Save_Options& opts) const
  {
    ::rocket::cow_string str;
    this->print_to(str, opts);
    return str;
  }

void
Value::
print_to_stderr(const Save_Options& opts) const
  {
    this->print_to(stderr, opts);
  }

void
Value::
save_to(const char* path, const Save_Options& opts, Value_Writer* writer) const
  {
    // JSON files are always formatted.
    Json_Writer json;
    Save_Options json_opts;
    const Save_Options* popts = &opts;
    if(do_is_json_path(path)) {
      writer = &json;
      popts = &json_opts;
    }
    else if(!writer)
      writer = &json;

    unique_file fp(::std::fopen(path, "wb"), ::std::fclose);
    if(!fp)
      ::rocket::sprintf_and_throw<::std::runtime_error>(
            "hjson::Value: could not open file `%s` for writing (errno `%d`)",
            path, errno);

    writer->write_document(fp.get(), *this, *popts);
    if(::std::ferror(fp.get()))
      ::rocket::sprintf_and_throw<::std::runtime_error>(
            "hjson::Value: could not write file `%s`", path);

    if(::std::fclose(fp.release()) != 0)
      ::rocket::sprintf_and_throw<::std::runtime_error>(
            "hjson::Value: could not close file `%s` (errno `%d`)",
            path, errno);
  }

Grammar_Reader::
~Grammar_Reader()
  {
  }

Value_Writer::
~Value_Writer()
  {
  }

bool
Json_Reader::
read_document(Value& root, Reader& reader, const Load_Options& opts)
  {
    return do_read_json(root.mf_stor(), reader, opts);
  }

void
Json_Writer::
write_document(Unified_Sink usink, const Value& root, const Save_Options& opts)
  {
    do_print_json(usink, root.mf_stor(), opts);
  }

}  // namespace hjson
