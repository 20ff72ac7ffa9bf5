// This file is part of HJSON.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef HJSON_HJSON_HPP_
#define HJSON_HJSON_HPP_

#include "number.hpp"
#include "reader.hpp"
#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/cow_hashmap.hpp>
#include <rocket/variant.hpp>
#include <rocket/tinybuf.hpp>
#include <cstdio>
namespace hjson {

class Value;
class Grammar_Reader;
class Value_Writer;

// Define aliases and enumerators for data types. `V_string` is defined in
// 'reader.hpp'.
using V_null    = ::std::nullptr_t;
using V_array   = ::rocket::cow_vector<Value>;
using V_object  = ::rocket::cow_hashmap<V_string, Value, V_string::hash>;
using V_boolean = bool;
using V_number  = Number;

// Expand a sequence of alternatives without a trailing comma. This macro is part of
// the ABI.
#define HJSON_TYPES_OOC4EIQU_(U)  \
    /*  0 */  U##_null  \
    /*  1 */, U##_array  \
    /*  2 */, U##_object  \
    /*  3 */, U##_boolean  \
    /*  4 */, U##_number  \
    /*  5 */, U##_string

// Define type enumerators such as `t_null`, `t_array`, `t_number`, and so on.
enum Type : ::std::uint8_t {HJSON_TYPES_OOC4EIQU_(t)};
using Variant = ::rocket::variant<HJSON_TYPES_OOC4EIQU_(V)>;

// These are options for loading. Fields that a grammar reader doesn't support
// are ignored.
struct Load_Options
  {
    // whether whitespace and comments shall be kept for re-serialization; only
    // meaningful to an Hjson grammar reader
    bool keep_wsc = false;

    // maximum depth of nested arrays and objects
    ::std::uint32_t nesting_limit = 32;
  };

// These are options for saving. The JSON writer only honors `inline_layout`;
// the others are for Hjson writers.
struct Save_Options
  {
    // whether numbers may be written in hexadecimal notation
    bool hex_numbers = false;

    // whether everything shall be written on a single line
    bool inline_layout = false;

    // whether all strings and keys shall be quoted
    bool force_quotes = false;

    // whether strings containing line feeds may be written as multiline
    // strings
    bool multiline_strings = true;
  };

// This dispatches output to one of the supported sinks.
struct Unified_Sink
  {
    ::rocket::cow_string* str = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;

    Unified_Sink(::rocket::cow_string* s) noexcept : str(s)  { }
    Unified_Sink(::rocket::tinybuf* b) noexcept : buf(b)  { }
    Unified_Sink(::std::FILE* f) noexcept : fp(f)  { }

    void
    putc(char c) const;

    void
    putn(const char* s, size_t n) const;
  };

// This is the value tree that literal scanners and grammar readers produce. It
// is responsible for storing, loading and saving all the alternatives above.
class Value
  {
  private:
    Variant m_stor;

  private:
    void
    do_nonrecursive_destructor() noexcept;

  public:
    // Initializes a null value.
    Value(V_null = nullptr) noexcept { }

    // Destroys this value. The destructor shall take care of a deep recursion, to
    // avoid running out of the system stack.
    ~Value()
      {
        if((this->m_stor.index() == t_array) || (this->m_stor.index() == t_object))
          this->do_nonrecursive_destructor();
      }

    Value(const Value&) = default;
    Value(Value&&) = default;
    Value& operator=(const Value&) & = default;
    Value& operator=(Value&&) & = default;

    // These are internal functions.
    const Variant&
    mf_stor() const noexcept
      { return this->m_stor;  }

    Variant&
    mf_stor() noexcept
      { return this->m_stor;  }

    // Gets the type of the stored value.
    Type
    type() const noexcept
      { return static_cast<Type>(this->m_stor.index());  }

    // Swaps two values in a smart way.
    Value&
    swap(Value& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Checks whether the stored value is null.
    bool
    is_null() const noexcept
      { return this->m_stor.index() == t_null;  }

    // Sets a null value.
    void
    clear() noexcept
      { this->m_stor.emplace<V_null>();  }

    // Sets a null value.
    Value&
    operator=(V_null) & noexcept
      {
        this->clear();
        return *this;
      }

    // Initializes an array.
    Value(const V_array& val) noexcept
      {
        this->m_stor.emplace<V_array>(val);
      }

    // Checks whether the stored value is an array.
    bool
    is_array() const noexcept
      { return this->m_stor.index() == t_array;  }

    // Gets an array. If the stored value is not an array, an exception is thrown,
    // and there is no effect.
    const V_array&
    as_array() const
      { return this->m_stor.as<V_array>();  }

    size_t
    as_array_size() const
      { return this->as_array().size();  }

    // Gets or creates an array (list). If the stored value is not an array, it is
    // overwritten with an empty array, and a reference to the new value is
    // returned.
    V_array&
    mut_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_array>();
      }

    // Sets an array.
    Value&
    operator=(const V_array& val) & noexcept
      {
        this->mut_array() = val;
        return *this;
      }

    // Initializes an object.
    Value(const V_object& val) noexcept
      {
        this->m_stor.emplace<V_object>(val);
      }

    // Checks whether the stored value is an object.
    bool
    is_object() const noexcept
      { return this->m_stor.index() == t_object;  }

    // Gets an object. If the stored value is not an object, an exception is thrown,
    // and there is no effect.
    const V_object&
    as_object() const
      { return this->m_stor.as<V_object>();  }

    size_t
    as_object_size() const
      { return this->as_object().size();  }

    // Gets or creates an object (dictionary). If the stored value is not an object,
    // it is overwritten with an empty object, and a reference to the new value is
    // returned.
    V_object&
    mut_object() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_object>())
          return *ptr;
        else
          return this->m_stor.emplace<V_object>();
      }

    // Sets an object.
    Value&
    operator=(const V_object& val) & noexcept
      {
        this->mut_object() = val;
        return *this;
      }

    // Initializes a boolean value.
    Value(bool val) noexcept
      {
        this->m_stor.emplace<V_boolean>(val);
      }

    // Checks whether the stored value is a boolean value.
    bool
    is_boolean() const noexcept
      { return this->m_stor.index() == t_boolean;  }

    // Gets a boolean value. If the stored value is not a boolean value, an exception
    // is thrown, and there is no effect.
    V_boolean
    as_boolean() const
      { return this->m_stor.as<V_boolean>();  }

    // Sets a boolean value.
    Value&
    operator=(bool val) & noexcept
      {
        this->m_stor.emplace<V_boolean>(val);
        return *this;
      }

    // Initializes a number. An `int` becomes a 32-bit integer. A `long` or a
    // `long long` becomes a 64-bit integer.
    Value(const Number& val) noexcept
      {
        this->m_stor.emplace<V_number>(val);
      }

    Value(const Decimal& val) noexcept
      {
        this->m_stor.emplace<V_number>(val);
      }

    Value(int val) noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int32>(val));
      }

    Value(long val) noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int64>(val));
      }

    Value(long long val) noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int64>(val));
      }

    // Checks whether the stored value is a number.
    bool
    is_number() const noexcept
      { return this->m_stor.index() == t_number;  }

    // Gets a number. If the stored value is not a number, an exception is
    // thrown, and there is no effect.
    const V_number&
    as_number() const
      { return this->m_stor.as<V_number>();  }

    // Sets a number.
    Value&
    operator=(const Number& val) & noexcept
      {
        this->m_stor.emplace<V_number>(val);
        return *this;
      }

    Value&
    operator=(const Decimal& val) & noexcept
      {
        this->m_stor.emplace<V_number>(val);
        return *this;
      }

    Value&
    operator=(int val) & noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int32>(val));
        return *this;
      }

    Value&
    operator=(long val) & noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int64>(val));
        return *this;
      }

    Value&
    operator=(long long val) & noexcept
      {
        this->m_stor.emplace<V_number>(static_cast<N_int64>(val));
        return *this;
      }

    // Initializes a string of UTF-16 code units.
    Value(const V_string& val) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    // Checks whether the stored value is a string.
    bool
    is_string() const noexcept
      { return this->m_stor.index() == t_string;  }

    // Gets a string. If the stored value is not a string, an exception is
    // thrown, and there is no effect.
    const V_string&
    as_string() const
      { return this->m_stor.as<V_string>();  }

    size_t
    as_string_length() const
      { return this->as_string().length();  }

    // Gets or creates a string. If the stored value is not a string, it is
    // overwritten with an empty string, and a reference to the new value is
    // returned.
    V_string&
    mut_string() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_string>())
          return *ptr;
        else
          return this->m_stor.emplace<V_string>();
      }

    // Sets a string.
    Value&
    operator=(const V_string& val) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    // Parse a source for a value, and store it into the current object. Errors are
    // stored into the `Parser_Context`, which need not be initialized. If no
    // grammar reader is given, the source is parsed as JSON. If parsing fails,
    // the current object is unchanged.
    bool
    parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf,
               const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse_with(Parser_Context& ctx, const char* str, size_t len,
               const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse_with(Parser_Context& ctx, const char* str,
               const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse_with(Parser_Context& ctx, ::std::FILE* fp,
               const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse(::rocket::tinybuf& buf,
          const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse(const ::rocket::cow_string& str,
          const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse(const char* str, size_t len,
          const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse(const char* str,
          const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    parse(::std::FILE* fp,
          const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    // Load a file. If the path ends with `.json`, it is always parsed as JSON;
    // otherwise `grammar` is used, if any. Error messages are suffixed with the
    // path. If the file can't be opened or read, an exception is thrown.
    bool
    load_with(Parser_Context& ctx, const char* path,
              const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    bool
    load_from(const char* path,
              const Load_Options& opts = Load_Options(), Grammar_Reader* grammar = nullptr);

    // Print this value as JSON. This function should not throw exceptions on
    // invalid inputs; only in case of an I/O error or failure to allocate memory.
    void
    print_to(::rocket::tinybuf& buf, const Save_Options& opts = Save_Options()) const;

    void
    print_to(::rocket::cow_string& str, const Save_Options& opts = Save_Options()) const;

    void
    print_to(::std::FILE* fp, const Save_Options& opts = Save_Options()) const;

    ::rocket::cow_string
    to_string(const Save_Options& opts = Save_Options()) const;

    void
    print_to_stderr(const Save_Options& opts = Save_Options()) const;

    // Save this value to a file. If the path ends with `.json`, it is always
    // written as formatted JSON; otherwise `writer` is used, if any. If the file
    // can't be written, an exception is thrown.
    void
    save_to(const char* path, const Save_Options& opts = Save_Options(),
            Value_Writer* writer = nullptr) const;
  };

inline
void
swap(Value& lhs, Value& rhs) noexcept
  {
    lhs.swap(rhs);
  }

// This is the interface of grammar readers, such as an Hjson reader. A grammar
// reader recognizes the structure of a document, and calls the literal scanners
// of `reader` for primitive values. On failure, it shall record an error into
// the context of `reader` and return `false`.
class Grammar_Reader
  {
  public:
    virtual
    ~Grammar_Reader();

    virtual
    bool
    read_document(Value& root, Reader& reader, const Load_Options& opts) = 0;
  };

// This is the interface of writers, such as an Hjson writer.
class Value_Writer
  {
  public:
    virtual
    ~Value_Writer();

    virtual
    void
    write_document(Unified_Sink usink, const Value& root, const Save_Options& opts) = 0;
  };

// This reads strict JSON.
class Json_Reader
  : public Grammar_Reader
  {
  public:
    bool
    read_document(Value& root, Reader& reader, const Load_Options& opts) override;
  };

// This writes JSON, either indented or inline.
class Json_Writer
  : public Value_Writer
  {
  public:
    void
    write_document(Unified_Sink usink, const Value& root, const Save_Options& opts) override;
  };

// Values are reference-counting so all these will not throw exceptions. It is
// recommended that they be passed by value or by const reference.
static_assert(::std::is_nothrow_copy_constructible<Value>::value, "");
static_assert(::std::is_nothrow_copy_assignable<Value>::value, "");
static_assert(::std::is_nothrow_move_constructible<Value>::value, "");
static_assert(::std::is_nothrow_move_assignable<Value>::value, "");

}  // namespace hjson

extern template
class ::rocket::variant<HJSON_TYPES_OOC4EIQU_(::hjson::V)>;

extern template
class ::rocket::cow_vector<::hjson::Value>;

extern template
class ::rocket::cow_hashmap<::hjson::V_string,
  ::hjson::Value, ::hjson::V_string::hash>;
#endif
