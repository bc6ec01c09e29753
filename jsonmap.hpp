#ifndef JSONMAP_HPP_INCLUDED
#define JSONMAP_HPP_INCLUDED

// Copyright (C) 2013 Joshua M. Kriegshauser
//! \file jsonmap.hpp This file contains the jsonmap parser and the json_object container

// Disable warnings for MS VC++
#ifdef _MSC_VER
    #pragma warning (push)
    #pragma warning (disable : 4127) // Conditional expression is constant
    #pragma warning (disable : 4702) // Unreachable code
#endif

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <set>
#include <utility>
#include <stdexcept>
#include <initializer_list>

// Only include streams if not disabled
#ifndef JSONMAP_NO_STREAMS
    #include <istream>
#endif

#define JSONMAP_NOEXCEPT throw()

// Exceptions may be disabled completely by using JSONMAP_NO_EXCEPTIONS,
// however this will cause every decode error to abort().
#if !defined(JSONMAP_NO_EXCEPTIONS)

#include <exception> // For std::exception

namespace jsonmap
{
    //! This exception is thrown by the parser and the mapper when the input cannot be decoded.
    //! Use the what() function to get the human-readable error description.
    //! Use the where() function to get the number of characters consumed from the source
    //! when the error was detected.
    //! <br><br>
    //! If throwing exceptions is undesirable, exceptions can be disabled
    //! by using <tt>\#define JSONMAP_NO_EXCEPTIONS</tt> before jsonmap.hpp is included.
    //! This will change every decode error into a call to \c abort().
    //! <br><br>
    //! This class derives from <tt>std::exception</tt>.
    class decode_error : public std::exception
    {
    public:
        //! Constructor
        decode_error(const std::string& what, std::size_t where)
            : what_(what)
            , where_(where)
        {}

        //! Destructor
        virtual ~decode_error() JSONMAP_NOEXCEPT {}

        //! Gets the human-readable description of the error
        virtual const char* what() const JSONMAP_NOEXCEPT
        {
            return what_.c_str();
        }

        //! Gets the offset of the character at which the error was detected.
        //! Errors raised outside of a parse (for instance by the writer) report zero.
        std::size_t where() const JSONMAP_NOEXCEPT
        {
            return where_;
        }

    private:
        std::string what_;
        std::size_t where_;
    };

    namespace internal
    {
        inline void raise_decode_error(const std::string& what, std::size_t where)
        {
            throw decode_error(what, where);
        }
    }
}

#else

namespace jsonmap
{
    namespace internal
    {
        inline void raise_decode_error(const std::string&, std::size_t)
        {
            abort();
        }
    }
}

#endif

#define JSONMAP_DECODE_ERROR(what, where) do { ::jsonmap::internal::raise_decode_error(what, where); abort(); } while (0)

namespace jsonmap
{

    // Forward declarations and typedefs
    class json_value;
    class json_object;
    class parser;

    //! A json array is an ordinary sequence of values.
    typedef std::vector<json_value> json_array;

    typedef unsigned char byte;
    typedef unsigned int utf32_char;

    //! \brief Enumeration of value types produced by the parser.
    //! Given by the jsonmap::json_value::type() function.
    enum value_type
    {
        value_null,     //!< The json null type. Also used as the neutral absent value.
        value_bool,     //!< A boolean value that may be true/false.
        value_integer,  //!< A number without fraction or exponent that fits a signed 64-bit integer.
        value_number,   //!< A double-precision floating point value.
        value_string,   //!< A UTF-8 encoded string.
        value_array,    //!< An array; see jsonmap::json_array.
        value_object,   //!< An object; see jsonmap::json_object.
    };

    //! Returned by source::next() and source::peek() once the input is exhausted.
    const int end_of_input = -1;

    namespace internal
    {
        //! Lookup tables used to speed lookups. These are defined as a template so that they
        //! may be included in this header file without the linker complaining.
        template<int Dummy>
        struct lookup_tables
        {
            static const bool lookup_whitespace[256];
            static const bool lookup_digit[256];
            static const double lookup_pow10[23];
            static const char lookup_hexchar[16];
        };

        //! Returns an empty string.
        inline const std::string& emptystr() JSONMAP_NOEXCEPT
        {
            static const std::string empty;
            return empty;
        }

        inline const char* nullstr() JSONMAP_NOEXCEPT { return "null"; }
        inline const char* truestr() JSONMAP_NOEXCEPT { return "true"; }
        inline const char* falsestr() JSONMAP_NOEXCEPT { return "false"; }

        //! Measures the length of a NUL-terminated string. A null pointer returns a zero length.
        inline std::size_t length(const char* p) JSONMAP_NOEXCEPT
        {
            const char* end = p;
            if (end)
            {
                while (*end != '\0')
                    ++end;
                return (std::size_t)(end - p);
            }
            return 0;
        }

        //! Predicate for determining if \c ch is whitespace. Uses a look-up-table.
        inline bool is_whitespace(int ch) JSONMAP_NOEXCEPT
        {
            return ch >= 0 && ch < 256 && lookup_tables<0>::lookup_whitespace[ch];
        }

        //! Predicate for determining if \c ch is numeric. Uses a look-up-table.
        inline bool is_digit(int ch) JSONMAP_NOEXCEPT
        {
            return ch >= 0 && ch < 256 && lookup_tables<0>::lookup_digit[ch];
        }

        //! \brief Translates a hex character to its numeric value.
        //! \return the value (0-15), or -1 if \c ch is not a hex character
        inline int hex_value(int ch) JSONMAP_NOEXCEPT
        {
            switch (ch)
            {
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return ch - '0';

            case 'a': case 'A': return 10;
            case 'b': case 'B': return 11;
            case 'c': case 'C': return 12;
            case 'd': case 'D': return 13;
            case 'e': case 'E': return 14;
            case 'f': case 'F': return 15;

            default:
                return -1;
            }
        }

        //! \brief Translates a numeric value to a hex character
        //! \param value The value to translate. Must be less than 16.
        inline char hex_char(byte value)
        {
            assert(value < 16);
            return lookup_tables<0>::lookup_hexchar[value];
        }

        //! \brief Returns 10^exponent. Exact for exponents up to 22.
        inline double pow10(int exponent)
        {
            assert(exponent >= 0);
            if (exponent < 23)
            {
                return lookup_tables<0>::lookup_pow10[exponent];
            }
            return std::pow(10.0, exponent);
        }

        //! \brief Appends the UTF-8 encoding of code point \c c to \c out.
        inline void append_utf8(std::string& out, utf32_char c)
        {
            assert(c <= 0x10ffff);
            if (c <= 0x7f)
            {
                out += char(c);
            }
            else if (c <= 0x7ff)
            {
                out += char(0xc0 + ((c >> 6) & 0x3f));
                out += char(0x80 + ( c       & 0x3f));
            }
            else if (c < 0x10000)
            {
                out += char(0xe0 + ((c >> 12) & 0x0f));
                out += char(0x80 + ((c >> 6)  & 0x3f));
                out += char(0x80 + ( c        & 0x3f));
            }
            else
            {
                out += char(0xf0 + ((c >> 18) & 0x07));
                out += char(0x80 + ((c >> 12) & 0x3f));
                out += char(0x80 + ((c >> 6)  & 0x3f));
                out += char(0x80 + ( c        & 0x3f));
            }
        }
    } // namespace internal

    ///////////////////////////////////////////////////////////////////////////
    // Parsing flags

    //! Parse flags which represent the default behavior of the parser.
    //! This is always zero, so that flags may be or'd together.
    const int parse_default = 0;

    //! Object keys are interned in a symbol table owned by the parser. Callbacks of parser::do_map()
    //! receive a reference to the interned key, so equal keys share one address and a key string
    //! is only allocated the first time its name is seen.
    const int parse_intern_keys = 1 << 0;

    ///////////////////////////////////////////////////////////////////////////
    // Character sources

    //! \brief Minimal pull interface over input text consumed by the parser.
    //! The parser never seeks backward; anything it may reject is peeked first.
    class source
    {
    public:
        virtual ~source() {}

        //! Consumes and returns the next character (0-255), or end_of_input.
        virtual int next() = 0;
        //! Returns the next character without consuming it, or end_of_input.
        virtual int peek() = 0;
        virtual bool at_end() = 0;
        //! Releases the underlying input. The default does nothing.
        virtual void close() {}
    };

    //! \brief A source reading from a character buffer. The buffer is not copied and must outlive the source.
    class string_source : public source
    {
    public:
        explicit string_source(const char* text)
            : pos_(text)
            , end_(text + internal::length(text))
        {}

        string_source(const char* text, std::size_t len)
            : pos_(text)
            , end_(text + len)
        {}

        explicit string_source(const std::string& text)
            : pos_(text.data())
            , end_(text.data() + text.size())
        {}

        virtual int next() { return pos_ < end_ ? int(byte(*pos_++)) : end_of_input; }
        virtual int peek() { return pos_ < end_ ? int(byte(*pos_)) : end_of_input; }
        virtual bool at_end() { return pos_ >= end_; }

    private:
        const char* pos_;
        const char* end_;
    };

#ifndef JSONMAP_NO_STREAMS
    //! \brief A source reading from a std::istream. Blocks on the stream when no input is buffered.
    class stream_source : public source
    {
    public:
        explicit stream_source(std::istream& in)
            : in_(in)
        {}

        virtual int next() { return translate(in_.get()); }
        virtual int peek() { return translate(in_.peek()); }
        virtual bool at_end() { return peek() == end_of_input; }

    private:
        typedef std::istream::traits_type traits_type;

        static int translate(traits_type::int_type c)
        {
            return traits_type::eq_int_type(c, traits_type::eof()) ? end_of_input : int(c);
        }

        std::istream& in_;
    };
#endif

    ///////////////////////////////////////////////////////////////////////////
    // json_value

    //! \brief An instance of a json value.
    //! Strings, arrays and objects are owned by the value and deep-copied with it.
    class json_value
    {
    public:
        //! Constructs the json null value.
        json_value() JSONMAP_NOEXCEPT : type_(value_null) { data_.integer = 0; }

        json_value(bool b) JSONMAP_NOEXCEPT : type_(value_bool) { data_.boolean = b; }
        json_value(int i) JSONMAP_NOEXCEPT : type_(value_integer) { data_.integer = i; }
        json_value(long i) JSONMAP_NOEXCEPT : type_(value_integer) { data_.integer = i; }
        json_value(long long i) JSONMAP_NOEXCEPT : type_(value_integer) { data_.integer = i; }
        json_value(unsigned int i) JSONMAP_NOEXCEPT : type_(value_integer) { data_.integer = i; }
        json_value(unsigned long i) JSONMAP_NOEXCEPT { set_unsigned(i); }
        json_value(unsigned long long i) JSONMAP_NOEXCEPT { set_unsigned(i); }
        json_value(double d) JSONMAP_NOEXCEPT : type_(value_number) { data_.number = d; }
        json_value(const char* s) : type_(value_string) { data_.string = new std::string(s ? s : ""); }
        json_value(const std::string& s) : type_(value_string) { data_.string = new std::string(s); }
        json_value(const json_array& a) : type_(value_array) { data_.array = new json_array(a); }
        json_value(const json_object& o);

        json_value(const json_value& other);
        json_value(json_value&& other) JSONMAP_NOEXCEPT
            : type_(other.type_)
            , data_(other.data_)
        {
            other.type_ = value_null;
            other.data_.integer = 0;
        }

        ~json_value() { destroy(); }

        json_value& operator = (json_value other) JSONMAP_NOEXCEPT
        {
            swap(other);
            return *this;
        }

        void swap(json_value& other) JSONMAP_NOEXCEPT
        {
            std::swap(type_, other.type_);
            std::swap(data_, other.data_);
        }

        //! \brief Returns the value_type of this value.
        value_type type() const JSONMAP_NOEXCEPT { return type_; }

        bool is_null() const JSONMAP_NOEXCEPT { return type_ == value_null; }
        bool is_boolean() const JSONMAP_NOEXCEPT { return type_ == value_bool; }
        bool is_integer() const JSONMAP_NOEXCEPT { return type_ == value_integer; }
        //! \brief Returns true for both integer and floating point values.
        bool is_number() const JSONMAP_NOEXCEPT { return type_ == value_integer || type_ == value_number; }
        bool is_string() const JSONMAP_NOEXCEPT { return type_ == value_string; }
        bool is_array() const JSONMAP_NOEXCEPT { return type_ == value_array; }
        bool is_object() const JSONMAP_NOEXCEPT { return type_ == value_object; }

        //! \brief Attempts to convert the value to a boolean.
        //! Non-zero numbers are true. All other non-boolean values are false.
        bool as_boolean() const JSONMAP_NOEXCEPT
        {
            switch (type_)
            {
            case value_bool: return data_.boolean;
            case value_integer: return data_.integer != 0;
            case value_number: return data_.number != 0.0;
            default: return false;
            }
        }

        //! \brief Attempts to convert the value to an integer. Floating point values are truncated.
        //! Zero is returned for values that are not numbers or booleans.
        long long as_integer() const JSONMAP_NOEXCEPT
        {
            switch (type_)
            {
            case value_bool: return data_.boolean ? 1 : 0;
            case value_integer: return data_.integer;
            case value_number: return (long long)data_.number;
            default: return 0;
            }
        }

        //! \brief Attempts to convert the value to a number.
        //! Zero is returned for values that are not numbers or booleans.
        double as_number() const JSONMAP_NOEXCEPT
        {
            switch (type_)
            {
            case value_bool: return data_.boolean ? 1.0 : 0.0;
            case value_integer: return double(data_.integer);
            case value_number: return data_.number;
            default: return 0.0;
            }
        }

        //! \brief Returns the string value, or an empty string if this is not a string.
        const std::string& as_string() const JSONMAP_NOEXCEPT
        {
            return is_string() ? *data_.string : internal::emptystr();
        }

        //! \brief Queries the array interface. NULL is returned if the value is not an array.
        json_array* as_array() JSONMAP_NOEXCEPT { return is_array() ? data_.array : 0; }
        const json_array* as_array() const JSONMAP_NOEXCEPT { return is_array() ? data_.array : 0; }
        //! \brief Queries the object interface. NULL is returned if the value is not an object.
        json_object* as_object() JSONMAP_NOEXCEPT { return is_object() ? data_.object : 0; }
        const json_object* as_object() const JSONMAP_NOEXCEPT { return is_object() ? data_.object : 0; }

        //! \brief Replaces the value with an empty array and returns it.
        json_array& make_array();
        //! \brief Replaces the value with an empty json_object and returns it.
        json_object& make_object();

        //! \brief Structural equality. Integer and floating point values compare numerically;
        //! objects compare independently of key order.
        bool operator == (const json_value& other) const;
        bool operator != (const json_value& other) const { return !(*this == other); }

        //! Returns a shared json_value that has type value_null. This is the neutral absent value.
        static const json_value& null() JSONMAP_NOEXCEPT
        {
            static const json_value val;
            return val;
        }

    private:
        void set_unsigned(unsigned long long i) JSONMAP_NOEXCEPT
        {
            if (i <= (unsigned long long)std::numeric_limits<long long>::max())
            {
                type_ = value_integer;
                data_.integer = (long long)i;
            }
            else
            {
                type_ = value_number;
                data_.number = double(i);
            }
        }

        void destroy() JSONMAP_NOEXCEPT;

        value_type type_;
        union
        {
            bool boolean;
            long long integer;
            double number;
            std::string* string;
            json_array* array;
            json_object* object;
        } data_;
    };

    ///////////////////////////////////////////////////////////////////////////
    // json_object

    //! \brief An ordered, permissive property bag.
    //! Entries keep their insertion order. Lookups are case-sensitive and have time order O(n).
    //! Reading a missing property never fails; it yields json_value::null().
    //! The container has no internal synchronization.
    class json_object
    {
    public:
        typedef std::pair<std::string, json_value> entry;
        typedef std::vector<entry>::iterator iterator;
        typedef std::vector<entry>::const_iterator const_iterator;
        //! A sequence of keys for get_path() and put_path(), e.g. { "one", "two", "three" }.
        typedef std::vector<std::string> path;

        json_object() {}

        //! \brief Constructs the object from a literal set of pairs. Later duplicates replace earlier ones.
        json_object(std::initializer_list<entry> pairs)
        {
            for (std::initializer_list<entry>::const_iterator it = pairs.begin(); it != pairs.end(); ++it)
            {
                put(it->first, it->second);
            }
        }

        std::size_t size() const JSONMAP_NOEXCEPT { return entries_.size(); }
        bool empty() const JSONMAP_NOEXCEPT { return entries_.empty(); }

        iterator begin() { return entries_.begin(); }
        iterator end() { return entries_.end(); }
        const_iterator begin() const { return entries_.begin(); }
        const_iterator end() const { return entries_.end(); }

        bool contains(const std::string& key) const { return find(key) != 0; }

        //! \brief Accesses a member by name.
        //! \return the stored value, or json_value::null() if the key does not exist.
        const json_value& get(const std::string& key) const
        {
            const json_value* p = find(key);
            return p ? *p : json_value::null();
        }

        //! \brief Sets a member by name. An existing entry keeps its position.
        //! \return the stored value.
        json_value& put(const std::string& key, const json_value& value)
        {
            json_value* p = find(key);
            if (p)
            {
                *p = value;
                return *p;
            }
            entries_.push_back(entry(key, value));
            return entries_.back().second;
        }

        //! \brief Looks \c key up once.
        //! If present, returns <tt>present(stored)</tt>. If absent, stores <tt>absent()</tt> under \c key and returns it.
        //! \c absent must not modify this object.
        template<class Present, class Absent>
        json_value get_or_else(const std::string& key, Present present, Absent absent)
        {
            json_value* p = find(key);
            if (p)
            {
                return present(*p);
            }
            json_value computed(absent());
            entries_.push_back(entry(key, computed));
            return entries_.back().second;
        }

        //! \brief Walks \c keys from this object.
        //! \return the value found at the end of the path, or json_value::null() as soon as a step
        //! is missing or the working value is not an object. An empty path yields json_value::null().
        const json_value& get_path(const path& keys) const
        {
            const json_object* current = this;
            const json_value* result = &json_value::null();
            for (path::const_iterator it = keys.begin(); it != keys.end(); ++it)
            {
                if (current == 0)
                {
                    return json_value::null();
                }
                result = &current->get(*it);
                if (result->is_null())
                {
                    return json_value::null();
                }
                current = result->as_object();
            }
            return *result;
        }

        //! \brief Stores \c value at the end of \c keys, creating empty json_object levels for missing
        //! (or null) intermediate steps.
        //! \return the stored value.
        //! \throws std::invalid_argument if \c keys is empty or an intermediate step holds a value that is not an object.
        json_value& put_path(const path& keys, const json_value& value)
        {
            if (keys.empty())
            {
                throw std::invalid_argument("json_object::put_path: empty path");
            }

            json_object* current = this;
            for (path::const_iterator it = keys.begin(); (it + 1) != keys.end(); ++it)
            {
                json_value* next = current->find(*it);
                if (next == 0 || next->is_null())
                {
                    next = &current->put(*it, json_value());
                    next->make_object();
                }
                current = next->as_object();
                if (current == 0)
                {
                    throw std::invalid_argument("json_object::put_path: '" + *it + "' is not an object");
                }
            }
            return current->put(keys.back(), value);
        }

        //! \brief Generic property read. Same as get().
        const json_value& read_property(const std::string& name) const { return get(name); }

        //! \brief Generic property write. Same as put() but returns this object for chaining.
        json_object& write_property(const std::string& name, const json_value& value)
        {
            put(name, value);
            return *this;
        }

        //! \brief Fixed accessor for the "name" property.
        const json_value& name() const { return get("name"); }
        //! \brief Fixed accessor for the "value" property.
        const json_value& value() const { return get("value"); }

        //! \brief Removes a value from the object.
        //! \return true if \c key existed.
        bool remove(const std::string& key)
        {
            for (std::vector<entry>::iterator it = entries_.begin(); it != entries_.end(); ++it)
            {
                if (it->first == key)
                {
                    entries_.erase(it);
                    return true;
                }
            }
            return false;
        }

        //! \brief Removes all entries.
        void clear() JSONMAP_NOEXCEPT { entries_.clear(); }

        const json_value& operator [] (const std::string& key) const { return get(key); }

        //! \brief Equal when both hold the same keys with equal values, in any order.
        bool operator == (const json_object& other) const
        {
            if (size() != other.size()) return false;
            for (const_iterator it = begin(); it != end(); ++it)
            {
                const json_value* p = other.find(it->first);
                if (p == 0 || *p != it->second) return false;
            }
            return true;
        }
        bool operator != (const json_object& other) const { return !(*this == other); }

    private:
        json_value* find(const std::string& key)
        {
            for (std::vector<entry>::iterator it = entries_.begin(); it != entries_.end(); ++it)
            {
                if (it->first == key) return &it->second;
            }
            return 0;
        }

        const json_value* find(const std::string& key) const
        {
            return const_cast<json_object*>(this)->find(key);
        }

        std::vector<entry> entries_;
    };

    ///////////////////////////////////////////////////////////////////////////
    // json_value implementation (requires json_object)

    inline json_value::json_value(const json_object& o)
        : type_(value_object)
    {
        data_.object = new json_object(o);
    }

    inline json_value::json_value(const json_value& other)
        : type_(other.type_)
        , data_(other.data_)
    {
        switch (type_)
        {
        case value_string: data_.string = new std::string(*other.data_.string); break;
        case value_array: data_.array = new json_array(*other.data_.array); break;
        case value_object: data_.object = new json_object(*other.data_.object); break;
        default: break;
        }
    }

    inline void json_value::destroy() JSONMAP_NOEXCEPT
    {
        switch (type_)
        {
        case value_string: delete data_.string; break;
        case value_array: delete data_.array; break;
        case value_object: delete data_.object; break;
        default: break;
        }
        type_ = value_null;
        data_.integer = 0;
    }

    inline json_array& json_value::make_array()
    {
        json_value empty((json_array()));
        swap(empty);
        return *data_.array;
    }

    inline json_object& json_value::make_object()
    {
        json_value empty((json_object()));
        swap(empty);
        return *data_.object;
    }

    inline bool json_value::operator == (const json_value& other) const
    {
        if (is_number() && other.is_number())
        {
            if (type_ == value_integer && other.type_ == value_integer)
            {
                return data_.integer == other.data_.integer;
            }
            return as_number() == other.as_number();
        }
        if (type_ != other.type_) return false;
        switch (type_)
        {
        case value_null: return true;
        case value_bool: return data_.boolean == other.data_.boolean;
        case value_string: return *data_.string == *other.data_.string;
        case value_array: return *data_.array == *other.data_.array;
        case value_object: return *data_.object == *other.data_.object;
        default: return false;
        }
    }

    ///////////////////////////////////////////////////////////////////////////
    // Decimal conversion

    namespace internal
    {
        //! Significant digits kept by the parser. This is enough to round any double correctly;
        //! digits beyond it only matter as a non-zero marker for exact ties.
        const std::size_t max_significant_digits = 800;

        //! \brief Unsigned integer of arbitrary size, just large enough for exact rounding decisions.
        class big_integer
        {
        public:
            typedef unsigned int limb;

            explicit big_integer(unsigned long long value = 0)
            {
                while (value != 0)
                {
                    limbs_.push_back(limb(value));
                    value >>= 32;
                }
            }

            //! Builds the integer spelled by \c count decimal digits.
            big_integer(const char* digits, std::size_t count)
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    multiply_add(10, limb(digits[i] - '0'));
                }
            }

            void multiply_add(limb factor, limb addend)
            {
                unsigned long long carry = addend;
                for (std::vector<limb>::iterator it = limbs_.begin(); it != limbs_.end(); ++it)
                {
                    const unsigned long long product = (unsigned long long)*it * factor + carry;
                    *it = limb(product);
                    carry = product >> 32;
                }
                if (carry != 0)
                {
                    limbs_.push_back(limb(carry));
                }
            }

            void multiply_pow5(unsigned long n)
            {
                // 5^13 is the largest power of five that fits a limb
                while (n >= 13)
                {
                    multiply_add(1220703125u, 0);
                    n -= 13;
                }
                limb factor = 1;
                while (n-- > 0)
                {
                    factor *= 5;
                }
                multiply_add(factor, 0);
            }

            void shift_left(unsigned long n)
            {
                if (limbs_.empty())
                {
                    return;
                }
                const unsigned bits = unsigned(n % 32);
                if (bits != 0)
                {
                    limb carry = 0;
                    for (std::vector<limb>::iterator it = limbs_.begin(); it != limbs_.end(); ++it)
                    {
                        const limb next = *it >> (32 - bits);
                        *it = (*it << bits) | carry;
                        carry = next;
                    }
                    if (carry != 0)
                    {
                        limbs_.push_back(carry);
                    }
                }
                limbs_.insert(limbs_.begin(), std::size_t(n / 32), limb(0));
            }

            //! \return a negative number, zero or a positive number as this is less than, equal to or greater than \c other.
            int compare(const big_integer& other) const
            {
                if (limbs_.size() != other.limbs_.size())
                {
                    return limbs_.size() < other.limbs_.size() ? -1 : 1;
                }
                for (std::size_t i = limbs_.size(); i-- > 0; )
                {
                    if (limbs_[i] != other.limbs_[i])
                    {
                        return limbs_[i] < other.limbs_[i] ? -1 : 1;
                    }
                }
                return 0;
            }

        private:
            std::vector<limb> limbs_;
        };

        // Splits a finite, non-negative double into m * 2^k with k >= -1074.
        inline void decompose(double d, unsigned long long& m, int& k)
        {
            if (d == 0.0)
            {
                m = 0;
                k = -1074;
                return;
            }
            int e;
            const double f = std::frexp(d, &e);
            m = (unsigned long long)std::ldexp(f, 53);
            k = e - 53;
            if (k < -1074)
            {
                m >>= (-1074 - k);
                k = -1074;
            }
        }

        // Compares digits * 10^scale with the midpoint of m1 * 2^k1 and m2 * 2^k2. Both sides are
        // divided by 2^(k-1) first, k being the smaller binary exponent.
        inline int compare_midpoint(const char* digits, std::size_t count, long scale,
                                    unsigned long long m1, int k1, unsigned long long m2, int k2)
        {
            const int k = k1 < k2 ? k1 : k2;
            big_integer lhs(digits, count);
            big_integer rhs((m1 << (k1 - k)) + (m2 << (k2 - k)));
            if (scale >= 0)
            {
                lhs.multiply_pow5((unsigned long)scale);
            }
            else
            {
                rhs.multiply_pow5((unsigned long)-scale);
            }
            const long e2 = scale - (k - 1);
            if (e2 >= 0)
            {
                lhs.shift_left((unsigned long)e2);
            }
            else
            {
                rhs.shift_left((unsigned long)-e2);
            }
            return lhs.compare(rhs);
        }

        //! \brief Converts <tt>digits * 10^scale</tt> to the nearest double, ties to even.
        //! \param digits \c count decimal digits without leading zeros
        //! \return false if the value is too large for a double. Values too small for a double become zero.
        inline bool decimal_to_double(const char* digits, std::size_t count, long scale, double& out)
        {
            while (count > 0 && digits[count - 1] == '0')
            {
                --count;
                ++scale;
            }
            if (count == 0)
            {
                out = 0.0;
                return true;
            }

            // 10^(magnitude-1) <= value < 10^magnitude
            const long magnitude = long(count) + scale;
            if (magnitude > std::numeric_limits<double>::max_exponent10 + 1)
            {
                return false;
            }
            if (magnitude < -324)
            {
                out = 0.0;
                return true;
            }

            const std::size_t lead = count < 19 ? count : 19;
            unsigned long long mantissa = 0;
            for (std::size_t i = 0; i < lead; ++i)
            {
                mantissa = 10 * mantissa + (unsigned long long)(digits[i] - '0');
            }
            long exponent = scale + long(count - lead);

            // A single multiplication or division of exact operands is correctly rounded
            if (lead == count && mantissa <= (1ULL << 53) && exponent >= -22 && exponent <= 22)
            {
                out = exponent < 0
                    ? double(mantissa) / pow10(int(-exponent))
                    : double(mantissa) * pow10(int(exponent));
                return true;
            }

            // Start close to the result, then walk to the correctly rounded neighbour
            const double largest = std::numeric_limits<double>::max();
            double approx = double(mantissa);
            if (exponent > 0)
            {
                approx *= pow10(int(exponent));
            }
            else
            {
                while (exponent < -300)
                {
                    approx /= pow10(300);
                    exponent += 300;
                }
                approx /= pow10(int(-exponent));
            }
            if (!(approx <= largest))
            {
                approx = largest;
            }

            for (;;)
            {
                unsigned long long m;
                int k;
                decompose(approx, m, k);

                const int above = compare_midpoint(digits, count, scale, m, k, m + 1, k);
                if (above > 0 || (above == 0 && (m & 1) != 0))
                {
                    if (approx == largest)
                    {
                        return false;
                    }
                    approx = std::nextafter(approx, std::numeric_limits<double>::infinity());
                    continue;
                }

                if (m != 0)
                {
                    // The neighbour below a power of two is half as far away
                    const int below = (m == (1ULL << 52) && k > -1074)
                        ? compare_midpoint(digits, count, scale, 2 * m - 1, k - 1, m, k)
                        : compare_midpoint(digits, count, scale, m - 1, k, m, k);
                    if (below < 0 || (below == 0 && (m & 1) != 0))
                    {
                        approx = std::nextafter(approx, 0.0);
                        continue;
                    }
                }
                break;
            }
            out = approx;
            return true;
        }
    }

    ///////////////////////////////////////////////////////////////////////////
    // parser

    namespace internal
    {
        // Callbacks used by parser::parse_list() and parser::parse_map() to build generic containers.
        struct array_builder
        {
            explicit array_builder(json_array& out) : out_(out) {}
            void operator () (parser& p);
            json_array& out_;
        };

        struct object_builder
        {
            explicit object_builder(json_object& out) : out_(out) {}
            void operator () (parser& p, const std::string& key);
            json_object& out_;
        };
    }

    //! \brief Recursive-descent json parser over a jsonmap::source.
    //! Every parse_* function consumes exactly one value followed by any run of whitespace.
    //! Leading whitespace must already be consumed, except for next() which skips it.
    //! The parser keeps a scratch buffer for string decoding and is not safe to share between threads.
    class parser
    {
        //! Disable copy constructor and assignment
        parser(const parser&);
        parser& operator = (const parser&);

    public:
        explicit parser(source& src, int flags = parse_default)
            : source_(src)
            , flags_(flags)
            , consumed_(0)
        {}

        int flags() const JSONMAP_NOEXCEPT { return flags_; }

        //! \brief Number of characters consumed from the source so far.
        std::size_t position() const JSONMAP_NOEXCEPT { return consumed_; }

        bool at_end() { return source_.peek() == end_of_input; }

        void close() { source_.close(); }

        //! \brief Skips leading whitespace and parses one value into the generic containers.
        json_value next()
        {
            skip_whitespace();
            json_value val;
            parse_value(val);
            return val;
        }

        //! \brief Raises a decode error unless the whole source has been consumed.
        void fail_if_not_at_end()
        {
            if (!at_end())
            {
                JSONMAP_DECODE_ERROR("end of input expected", consumed_);
            }
        }

        //! \brief Classifies the upcoming value without consuming anything.
        //! Numbers report value_number whether or not they will parse as integers.
        value_type peek_type()
        {
            switch (source_.peek())
            {
            case '{': return value_object;
            case '[': return value_array;
            case '"': return value_string;
            case 't': case 'f': return value_bool;
            case 'n': return value_null;

            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return value_number;

            case end_of_input:
                JSONMAP_DECODE_ERROR("unexpected end of input", consumed_);
                break;
            }
            JSONMAP_DECODE_ERROR("value expected", consumed_);
            return value_null;
        }

        void parse_value(json_value& out)
        {
            switch (peek_type())
            {
            case value_object:
                parse_map(out.make_object());
                break;

            case value_array:
                parse_list(out.make_array());
                break;

            case value_string:
                out = json_value(parse_string());
                break;

            case value_bool:
                out = json_value(parse_boolean());
                break;

            case value_null:
                parse_null();
                out = json_value();
                break;

            default:
                parse_number(out);
                break;
            }
        }

        //! \brief Consumes a value without keeping it.
        void skip_value()
        {
            json_value discarded;
            parse_value(discarded);
        }

        void parse_null()
        {
            if (source_.peek() != 'n')
            {
                JSONMAP_DECODE_ERROR("null expected", consumed_);
            }
            match_literal(internal::nullstr(), "'null' expected");
        }

        bool parse_boolean()
        {
            switch (source_.peek())
            {
            case 't':
                match_literal(internal::truestr(), "'true' expected");
                return true;

            case 'f':
                match_literal(internal::falsestr(), "'false' expected");
                return false;
            }
            JSONMAP_DECODE_ERROR("boolean expected", consumed_);
            return false;
        }

        //! \brief Parses a number digit by digit.
        //! The result is value_integer when there is neither fraction nor exponent and the value fits
        //! a signed 64-bit integer; otherwise value_number, rounded to the nearest double.
        void parse_number(json_value& out)
        {
            const bool negated = source_.peek() == '-';
            if (negated)
            {
                advance();
            }

            // Significant digits without leading zeros; value = digits_ * 10^scale
            digits_.clear();
            long scale = 0;
            bool sticky = false;

            int c = source_.peek();
            if (!internal::is_digit(c))
            {
                JSONMAP_DECODE_ERROR("digit expected", consumed_);
            }
            if (c == '0')
            {
                advance();
            }
            else
            {
                while (internal::is_digit(source_.peek()))
                {
                    const char digit = char(advance());
                    if (digits_.size() < internal::max_significant_digits)
                    {
                        digits_ += digit;
                    }
                    else
                    {
                        ++scale;
                        sticky = sticky || digit != '0';
                    }
                }
            }

            bool is_float = false;

            // Optional fraction
            if (source_.peek() == '.')
            {
                advance();
                if (!internal::is_digit(source_.peek()))
                {
                    JSONMAP_DECODE_ERROR("fraction digits expected", consumed_);
                }
                while (internal::is_digit(source_.peek()))
                {
                    const char digit = char(advance());
                    if (digits_.empty() && digit == '0')
                    {
                        --scale;
                    }
                    else if (digits_.size() < internal::max_significant_digits)
                    {
                        digits_ += digit;
                        --scale;
                    }
                    else
                    {
                        sticky = sticky || digit != '0';
                    }
                }
                is_float = true;
            }

            // Optional exponent
            c = source_.peek();
            if (c == 'e' || c == 'E')
            {
                advance();
                bool negative_exponent = false;
                c = source_.peek();
                if (c == '+' || c == '-')
                {
                    negative_exponent = (c == '-');
                    advance();
                }
                if (!internal::is_digit(source_.peek()))
                {
                    JSONMAP_DECODE_ERROR("number exponent expected", consumed_);
                }
                long exponent = 0;
                while (internal::is_digit(source_.peek()))
                {
                    const int digit = advance() - '0';
                    if (exponent < 100000)
                    {
                        exponent = 10 * exponent + digit;
                    }
                }
                if (negative_exponent)
                {
                    exponent = -exponent;
                }

                // Range is checked before exponentiation
                if (exponent > std::numeric_limits<double>::max_exponent10)
                {
                    JSONMAP_DECODE_ERROR("number exponent too large", consumed_);
                }
                if (exponent < std::numeric_limits<double>::min_exponent10)
                {
                    JSONMAP_DECODE_ERROR("number exponent too small", consumed_);
                }
                scale += exponent;
                is_float = true;
            }

            if (!is_float && digits_.size() < 20)
            {
                unsigned long long mantissa = 0;
                for (std::string::const_iterator it = digits_.begin(); it != digits_.end(); ++it)
                {
                    mantissa = 10 * mantissa + (unsigned long long)(*it - '0');
                }
                const unsigned long long limit = (unsigned long long)std::numeric_limits<long long>::max();
                if (!negated && mantissa <= limit)
                {
                    out = json_value((long long)mantissa);
                    skip_whitespace();
                    return;
                }
                if (negated && mantissa <= limit + 1)
                {
                    out = json_value(mantissa == limit + 1
                        ? std::numeric_limits<long long>::min()
                        : -(long long)mantissa);
                    skip_whitespace();
                    return;
                }
            }

            // Digits beyond the kept ones only matter for breaking exact ties
            if (sticky)
            {
                digits_ += '1';
                --scale;
            }

            double value;
            if (!internal::decimal_to_double(digits_.data(), digits_.size(), scale, value))
            {
                JSONMAP_DECODE_ERROR("number out of range", consumed_);
            }
            out = json_value(negated ? -value : value);
            skip_whitespace();
        }

        //! \brief Parses a json string.
        //! \return the decoded UTF-8 text. The reference is to the parser's scratch buffer and is only
        //! valid until the next string is parsed.
        const std::string& parse_string()
        {
            if (source_.peek() != '"')
            {
                JSONMAP_DECODE_ERROR("string expected", consumed_);
            }
            advance();

            scratch_.clear();
            for (;;)
            {
                const int c = advance();
                switch (c)
                {
                case end_of_input:
                    JSONMAP_DECODE_ERROR("incomplete string", consumed_);
                    break;

                case '"': // End of string
                    skip_whitespace();
                    return scratch_;

                case '\\': // Escaped character
                    parse_escape();
                    break;

                default:
                    scratch_ += char(c);
                    break;
                }
            }
        }

        void parse_list(json_array& out)
        {
            out.clear();
            do_list(internal::array_builder(out));
        }

        void parse_map(json_object& out)
        {
            out.clear();
            do_map(internal::object_builder(out));
        }

        //! \brief Parses a json array, calling <tt>fn(parser&)</tt> once per element instead of building a container.
        //! \c fn must consume exactly one value.
        template<class Fn>
        void do_list(Fn fn)
        {
            expect('[', "'[' expected");
            if (source_.peek() == ']')
            {
                advance();
                skip_whitespace();
                return;
            }

            for (;;)
            {
                if (at_end())
                {
                    JSONMAP_DECODE_ERROR("incomplete list", consumed_);
                }

                fn(*this);

                switch (source_.peek())
                {
                case ',':
                    advance();
                    skip_whitespace();
                    break;

                case ']':
                    advance();
                    skip_whitespace();
                    return;

                case end_of_input:
                    JSONMAP_DECODE_ERROR("incomplete list", consumed_);
                    break;

                default:
                    JSONMAP_DECODE_ERROR("',' or ']' expected", consumed_);
                    break;
                }
            }
        }

        //! \brief Parses a json object, calling <tt>fn(parser&, const std::string& key)</tt> once per pair
        //! after the key and the name separator have been consumed. \c fn must consume exactly one value.
        template<class Fn>
        void do_map(Fn fn)
        {
            expect('{', "'{' expected");
            if (source_.peek() == '}')
            {
                advance();
                skip_whitespace();
                return;
            }

            std::string local;
            for (;;)
            {
                switch (source_.peek())
                {
                case '"':
                    break;

                case end_of_input:
                    JSONMAP_DECODE_ERROR("incomplete map", consumed_);
                    break;

                default:
                    JSONMAP_DECODE_ERROR("non-string map key", consumed_);
                    break;
                }

                const std::string& key = parse_key(local);

                switch (source_.peek())
                {
                case ':':
                    advance();
                    skip_whitespace();
                    break;

                case end_of_input:
                    JSONMAP_DECODE_ERROR("incomplete map", consumed_);
                    break;

                default:
                    JSONMAP_DECODE_ERROR("':' expected", consumed_);
                    break;
                }

                if (at_end())
                {
                    JSONMAP_DECODE_ERROR("incomplete map", consumed_);
                }

                fn(*this, key);

                switch (source_.peek())
                {
                case ',':
                    advance();
                    skip_whitespace();
                    break;

                case '}':
                    advance();
                    skip_whitespace();
                    return;

                case end_of_input:
                    JSONMAP_DECODE_ERROR("incomplete map", consumed_);
                    break;

                default:
                    JSONMAP_DECODE_ERROR("',' or '}' expected", consumed_);
                    break;
                }
            }
        }

        void skip_whitespace()
        {
            while (internal::is_whitespace(source_.peek()))
            {
                advance();
            }
        }

    private:
        int advance()
        {
            const int c = source_.next();
            if (c != end_of_input)
            {
                ++consumed_;
            }
            return c;
        }

        // Consumes the structural character \c ch and the whitespace following it.
        void expect(int ch, const char* what)
        {
            if (source_.peek() != ch)
            {
                JSONMAP_DECODE_ERROR(what, consumed_);
            }
            advance();
            skip_whitespace();
        }

        // Matches a literal character by character. Characters are only consumed once they match.
        void match_literal(const char* literal, const char* what)
        {
            for (const char* p = literal; *p; ++p)
            {
                if (source_.peek() != int(byte(*p)))
                {
                    JSONMAP_DECODE_ERROR(what, consumed_);
                }
                advance();
            }
            skip_whitespace();
        }

        const std::string& parse_key(std::string& local)
        {
            const std::string& text = parse_string();
            if (flags_ & parse_intern_keys)
            {
                return *symbols_.insert(text).first;
            }
            local.assign(text);
            return local;
        }

        utf32_char parse_hex4()
        {
            utf32_char c = 0;
            for (int i = 0; i < 4; ++i)
            {
                const int ch = advance();
                if (ch == end_of_input)
                {
                    JSONMAP_DECODE_ERROR("incomplete escape sequence", consumed_);
                }
                const int digit = internal::hex_value(ch);
                if (digit < 0)
                {
                    JSONMAP_DECODE_ERROR(std::string("invalid hex digit '") + char(ch) + "'", consumed_ - 1);
                }
                c = (c << 4) | utf32_char(digit);
            }
            return c;
        }

        // Decodes the escape following a backslash into the scratch buffer.
        void parse_escape()
        {
            const int c = advance();
            switch (c)
            {
            case end_of_input:
                JSONMAP_DECODE_ERROR("incomplete escape sequence", consumed_);
                break;

            case '"':
            case '\\':
            case '/':
                scratch_ += char(c);
                break;

            case 'b': scratch_ += '\x08'; break; // Backspace
            case 'f': scratch_ += '\x0c'; break; // Form feed
            case 'n': scratch_ += '\x0a'; break; // Line feed
            case 'r': scratch_ += '\x0d'; break; // Carriage return
            case 't': scratch_ += '\x09'; break; // Tab

            case 'u': // UTF-16 character
                {
                    utf32_char cp = parse_hex4();
                    if (cp >= 0xd800 && cp <= 0xdbff)
                    {
                        // A high surrogate must be followed immediately by a low surrogate escape
                        if (source_.peek() != '\\')
                        {
                            JSONMAP_DECODE_ERROR("high surrogate not followed by low surrogate", consumed_);
                        }
                        advance();
                        if (source_.peek() != 'u')
                        {
                            JSONMAP_DECODE_ERROR("high surrogate not followed by low surrogate", consumed_);
                        }
                        advance();
                        const utf32_char low = parse_hex4();
                        if (low < 0xdc00 || low > 0xdfff)
                        {
                            JSONMAP_DECODE_ERROR("high surrogate not followed by low surrogate", consumed_ - 6);
                        }
                        cp = 0x10000 + (cp - 0xd800) * 0x400 + (low - 0xdc00);
                    }
                    else if (cp >= 0xdc00 && cp <= 0xdfff)
                    {
                        JSONMAP_DECODE_ERROR("unexpected low surrogate", consumed_ - 6);
                    }
                    internal::append_utf8(scratch_, cp);
                }
                break;

            default:
                JSONMAP_DECODE_ERROR(std::string("invalid escape character '") + char(c) + "'", consumed_ - 1);
                break;
            }
        }

        source& source_;
        int flags_;
        std::size_t consumed_;
        std::string scratch_;           //!< Reused by every parse_string() call; cleared, never reallocated.
        std::string digits_;            //!< Significant digits of the number being parsed.
        std::set<std::string> symbols_; //!< Interned object keys when parse_intern_keys is set.
    };

    ///////////////////////////////////////////////////////////////////////////
    // Implementation

    namespace internal
    {
        inline void array_builder::operator () (parser& p)
        {
            out_.push_back(json_value());
            p.parse_value(out_.back());
        }

        inline void object_builder::operator () (parser& p, const std::string& key)
        {
            // Duplicate keys replace the earlier value in place
            p.parse_value(out_.put(key, json_value()));
        }

        template<int Dummy>
        const bool lookup_tables<Dummy>::lookup_whitespace[256] =
        {
          // 0   1   2   3   4   5   6   7   8   9   A   B   C   D   E   F
             0,  0,  0,  0,  0,  0,  0,  0,  0,  1,  1,  0,  0,  1,  0,  0,  // 0
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 1
             1,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 2
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 3
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 4
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 5
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 6
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 7
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 8
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 9
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // A
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // B
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // C
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // D
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // E
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0   // F
        };

        template<int Dummy>
        const bool lookup_tables<Dummy>::lookup_digit[256] =
        {
          // 0   1   2   3   4   5   6   7   8   9   A   B   C   D   E   F
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 0
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 1
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 2
             1,  1,  1,  1,  1,  1,  1,  1,  1,  1,  0,  0,  0,  0,  0,  0,  // 3
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 4
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 5
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 6
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 7
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 8
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // 9
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // A
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // B
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // C
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // D
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  // E
             0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0,  0   // F
        };

        template<int Dummy>
        const double lookup_tables<Dummy>::lookup_pow10[23] =
        {
            1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11,
            1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22
        };

        template<int Dummy>
        const char lookup_tables<Dummy>::lookup_hexchar[16] =
        {
            '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
        };
    }
}

#ifdef _MSC_VER
#pragma warning (pop)
#endif

#endif // JSONMAP_HPP_INCLUDED
