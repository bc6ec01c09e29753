#ifndef JSONMAP_PRINT_HPP_INCLUDED
#define JSONMAP_PRINT_HPP_INCLUDED

// Copyright (C) 2013 Joshua M. Kriegshauser
//! \file jsonmap_print.hpp This file contains the jsonmap print utility

#include "jsonmap.hpp"

#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <type_traits>

// Only include streams if not disabled
#ifndef JSONMAP_NO_STREAMS
    #include <ostream>
#endif

namespace jsonmap
{
    ///////////////////////////////////////////////////////////////////////////
    // Printing flags

    //! Prints with as little whitespace as possible
    const int no_whitespace = 0x10;

    //! Prefer spaces to tabs
    const int use_spaces = 0x20;

    //! Non-ASCII characters are printed as \\uXXXX escapes. Characters outside the
    //! basic multilingual plane are printed as surrogate pairs. A string that is not valid UTF-8
    //! cannot be escaped and raises a decode_error.
    const int escape_unicode = 0x40;

    const int indent_1_space  = 0x1; //!< Indent 1 space if spaces are preferred to tabs. Can be combined (OR'd) with other indent flag values.
    const int indent_2_spaces = 0x2; //!< Indent 2 spaces if spaces are preferred to tabs. Can be combined (OR'd) with other indent flag values.
    const int indent_4_spaces = 0x4; //!< Indent 4 spaces if spaces are preferred to tabs. Can be combined (OR'd) with other indent flag values. This is the default.
    const int indent_8_spaces = 0x8; //!< Indent 8 spaces if spaces are preferred to tabs. Can be combined (OR'd) with other indent flag values.

    ///////////////////////////////////////////////////////////////////////////
    // Internal

    //! \cond internal
    namespace internal
    {
        // Keeps streams (which are not copyable) away from the output iterator overload of print()
        template<class OutputIterator>
        struct enable_if_iterator
#ifndef JSONMAP_NO_STREAMS
            : std::enable_if<!std::is_base_of<std::ios_base, OutputIterator>::value, OutputIterator>
#else
            : std::enable_if<true, OutputIterator>
#endif
        {
        };

        template<class OutputIterator>
        inline OutputIterator copy_chars(OutputIterator out, const char* begin, const char* end)
        {
            while (begin != end)
            {
                *out++ = *begin++;
            }
            return out;
        }

        template<class OutputIterator>
        inline OutputIterator emit_indent(OutputIterator out, int flags, int indent)
        {
            if ((flags & no_whitespace) == 0)
            {
                char c;
                if ((flags & use_spaces) == use_spaces)
                {
                    int spaces = (flags & 0xf);
                    if (spaces == 0) spaces = indent_4_spaces;
                    indent *= spaces;
                    c = ' ';
                }
                else
                {
                    c = '\t';
                }
                while (indent-- > 0)
                {
                    *out++ = c;
                }
            }
            return out;
        }

        template<class OutputIterator>
        inline OutputIterator emit_utf16(OutputIterator out, utf32_char c) JSONMAP_NOEXCEPT
        {
            *out++ = '\\';
            *out++ = 'u';
            *out++ = hex_char(byte((c >> 12) & 0xf));
            *out++ = hex_char(byte((c >>  8) & 0xf));
            *out++ = hex_char(byte((c >>  4) & 0xf));
            *out++ = hex_char(byte((c      ) & 0xf));
            return out;
        }

        //! Sequence lengths indexed by the upper six bits of a UTF-8 lead byte. Zero marks a byte that cannot start a sequence.
        template<int Dummy>
        struct utf8_tables
        {
            static const std::size_t lengths[64];
        };

        template<int Dummy>
        const std::size_t utf8_tables<Dummy>::lengths[64] = {
            1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
            1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
            0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // invalid
            2, 2, 2, 2, 2, 2, 2, 2, 3, 3, 3, 3, 4, 4, 0, 0,
        };

        //! \brief Converts one UTF-8 sequence to \\uXXXX escapes and advances \c begin past it.
        //! Truncated sequences, stray continuation bytes, overlong forms, surrogates and code points
        //! above 0x10FFFF raise "invalid UTF-8".
        template<class OutputIterator>
        inline OutputIterator to_utf16(OutputIterator out, const char*& begin, const char* end)
        {
            const byte* p = (const byte*)begin;
            const std::size_t len = utf8_tables<0>::lengths[*p >> 2];
            if (len == 0 || std::size_t(end - begin) < len)
            {
                JSONMAP_DECODE_ERROR("invalid UTF-8", 0);
            }
            for (std::size_t i = 1; i < len; ++i)
            {
                if ((p[i] & 0xc0) != 0x80)
                {
                    JSONMAP_DECODE_ERROR("invalid UTF-8", 0);
                }
            }

            utf32_char c;
            utf32_char lowest;
            switch (len)
            {
            case 1:
                c = p[0];
                lowest = 0;
                break;

            case 2:
                c = utf32_char((p[0] & 0x1f) << 6);
                c |= (p[1] & 0x3f);
                lowest = 0x80;
                break;

            case 3:
                c = utf32_char((p[0] & 0xf) << 12);
                c |= ((p[1] & 0x3f) << 6);
                c |= ((p[2] & 0x3f));
                lowest = 0x800;
                break;

            default:
                c = utf32_char((p[0] & 0x7) << 18);
                c |= ((p[1] & 0x3f) << 12);
                c |= ((p[2] & 0x3f) << 6);
                c |= ((p[3] & 0x3f));
                lowest = 0x10000;
                break;
            }
            if (c < lowest || c > 0x10ffff || (c >= 0xd800 && c <= 0xdfff))
            {
                JSONMAP_DECODE_ERROR("invalid UTF-8", 0);
            }
            begin += len;

            if (c < 0x10000)
            {
                return emit_utf16(out, c);
            }

            // Emit surrogate pair
            c -= 0x10000;
            out = emit_utf16(out, utf32_char(0xd800 | (c >> 10)));
            return emit_utf16(out, utf32_char(0xdc00 | (c & 0x3ff)));
        }

        template<class OutputIterator>
        inline OutputIterator emit_string(OutputIterator out, const std::string& str, int flags)
        {
            const char* begin = str.data();
            const char* end = begin + str.size();

            *out++ = '"';
            while (begin < end)
            {
                switch (*begin)
                {
                case '\\':
                case '"':
                    *out++ = '\\'; *out++ = *begin++;
                    break;

                case '\x08': // backspace
                    *out++ = '\\'; *out++ = 'b';
                    ++begin;
                    break;

                case '\x0c': // form feed
                    *out++ = '\\'; *out++ = 'f';
                    ++begin;
                    break;

                case '\r': // carriage return
                    *out++ = '\\'; *out++ = 'r';
                    ++begin;
                    break;

                case '\n': // newline/line feed
                    *out++ = '\\'; *out++ = 'n';
                    ++begin;
                    break;

                case '\t': // tab
                    *out++ = '\\'; *out++ = 't';
                    ++begin;
                    break;

                // Values that must be escaped
                case '\x00': case '\x01': case '\x02': case '\x03': case '\x04': case '\x05': case '\x06': case '\x07':
                                                       case '\x0B':                           case '\x0E': case '\x0F':
                case '\x10': case '\x11': case '\x12': case '\x13': case '\x14': case '\x15': case '\x16': case '\x17':
                case '\x18': case '\x19': case '\x1A': case '\x1B': case '\x1C': case '\x1D': case '\x1E': case '\x1F':
                    out = emit_utf16(out, utf32_char(byte(*begin++)));
                    break;

                default:
                    if (byte(*begin) > 0x7f && (flags & escape_unicode) != 0)
                    {
                        out = to_utf16(out, begin, end); // Advances begin
                    }
                    else
                    {
                        *out++ = *begin++;
                    }
                }
            }
            *out++ = '"';
            return out;
        }

        template<class OutputIterator>
        inline OutputIterator emit_integer(OutputIterator out, long long i)
        {
            char buffer[24];
            const int len = std::snprintf(buffer, sizeof(buffer), "%lld", i);
            return copy_chars(out, buffer, buffer + len);
        }

        //! Prints a double with the fewest digits that jsonmap's parser reads back as the same value.
        //! The text always contains a '.' or an exponent so that it parses back as value_number.
        //! Exponents below the parser's limit are written with leading fraction zeros instead.
        template<class OutputIterator>
        inline OutputIterator emit_number(OutputIterator out, double d)
        {
            if (!std::isfinite(d))
            {
                JSONMAP_DECODE_ERROR("number is not finite", 0);
            }

            const double magnitude = std::fabs(d);
            char buffer[40];
            char digits[24];
            std::size_t count = 0;
            long exponent = 0;
            int precision = 15;
            for (; precision <= 17; ++precision)
            {
                // d.ddde[+-]xx
                const int len = std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, magnitude);
                count = 0;
                int i = 0;
                for (; i < len && buffer[i] != 'e'; ++i)
                {
                    if (is_digit(buffer[i]))
                    {
                        digits[count++] = buffer[i];
                    }
                }
                exponent = std::strtol(buffer + i + 1, 0, 10);

                std::size_t first = 0;
                while (first < count && digits[first] == '0')
                {
                    ++first;
                }
                double back = 0.0;
                if (decimal_to_double(digits + first, count - first, exponent - long(count - 1), back) && back == magnitude)
                {
                    break;
                }
            }
            if (precision > 17)
            {
                precision = 17;
            }

            if (magnitude != 0.0 && exponent < std::numeric_limits<double>::min_exponent10)
            {
                // 0.00ddd with the exponent at the lower limit
                while (count > 1 && digits[count - 1] == '0')
                {
                    --count;
                }
                if (d < 0)
                {
                    *out++ = '-';
                }
                *out++ = '0';
                *out++ = '.';
                for (long z = std::numeric_limits<double>::min_exponent10 - 1 - exponent; z > 0; --z)
                {
                    *out++ = '0';
                }
                out = copy_chars(out, digits, digits + count);
                const int len = std::snprintf(buffer, sizeof(buffer), "e%d", std::numeric_limits<double>::min_exponent10);
                return copy_chars(out, buffer, buffer + len);
            }

            const int len = std::snprintf(buffer, sizeof(buffer), "%.*g", precision, d);
            bool has_marker = false;
            for (int i = 0; i < len; ++i)
            {
                if (buffer[i] == '.' || buffer[i] == 'e')
                {
                    has_marker = true;
                    break;
                }
            }
            out = copy_chars(out, buffer, buffer + len);
            if (!has_marker)
            {
                *out++ = '.';
                *out++ = '0';
            }
            return out;
        }

        template<class OutputIterator>
        inline OutputIterator print_value(OutputIterator out, const json_value& val, int flags, int indent)
        {
            switch (val.type())
            {
            case value_null:
                out = copy_chars(out, nullstr(), nullstr() + 4);
                break;

            case value_bool:
                if (val.as_boolean())
                    out = copy_chars(out, truestr(), truestr() + 4);
                else
                    out = copy_chars(out, falsestr(), falsestr() + 5);
                break;

            case value_integer:
                out = emit_integer(out, val.as_integer());
                break;

            case value_number:
                out = emit_number(out, val.as_number());
                break;

            case value_string:
                out = emit_string(out, val.as_string(), flags);
                break;

            case value_array:
                {
                    const json_array& arr = *val.as_array();
                    *out++ = '[';
                    for (json_array::const_iterator it = arr.begin(); it != arr.end(); ++it)
                    {
                        if (it != arr.begin())
                        {
                            *out++ = ',';
                            if ((flags & no_whitespace) == 0)
                            {
                                *out++ = ' ';
                            }
                        }
                        out = print_value(out, *it, flags, indent);
                    }
                    *out++ = ']';
                }
                break;

            case value_object:
                {
                    const json_object& obj = *val.as_object();
                    *out++ = '{';
                    bool first = true;
                    for (json_object::const_iterator it = obj.begin(); it != obj.end(); ++it)
                    {
                        if (!first)
                        {
                            *out++ = ',';
                        }

                        if ((flags & no_whitespace) == 0)
                        {
                            *out++ = '\n';
                        }

                        out = emit_indent(out, flags, indent + 1);
                        out = emit_string(out, it->first, flags);
                        *out++ = ':';
                        if ((flags & no_whitespace) == 0)
                        {
                            *out++ = ' ';
                        }
                        out = print_value(out, it->second, flags, indent + 1);
                        first = false;
                    }

                    if (!first && (flags & no_whitespace) == 0)
                    {
                        *out++ = '\n';
                        out = emit_indent(out, flags, indent);
                    }
                    *out++ = '}';
                }
                break;
            }
            return out;
        }
    }
    //! \endcond

    ///////////////////////////////////////////////////////////////////////////
    // Printing

    //! \brief Prints json to given output iterator
    //! \param out Output iterator to print to.
    //! \param value Value to be printed
    //! \param flags Flags controlling how json is printed
    //! \return Output iterator pointing to position immediately after last character of printed text
    template<class OutputIterator>
    inline typename internal::enable_if_iterator<OutputIterator>::type print(OutputIterator out, const json_value& value, int flags = 0)
    {
        return internal::print_value(out, value, flags, 0);
    }

    //! \brief Renders a value as a json string.
    inline std::string to_json(const json_value& value, int flags = 0)
    {
        std::string result;
        print(std::back_inserter(result), value, flags);
        return result;
    }

    //! \brief Renders an object for display. A value that cannot be printed is described
    //! rather than raising a decode_error.
    inline std::string to_string(const json_object& obj)
    {
#ifndef JSONMAP_NO_EXCEPTIONS
        try
        {
            return to_json(json_value(obj));
        }
        catch (const decode_error& e)
        {
            return std::string("an unprintable json_object (") + e.what() + ")";
        }
#else
        return to_json(json_value(obj));
#endif
    }

#ifndef JSONMAP_NO_STREAMS
    //! \brief Prints json to given output stream.
    //! \param out Output stream to print to.
    //! \param value Value to be printed
    //! \param flags Flags controlling how json is printed
    //! \return Output stream.
    inline std::ostream& print(std::ostream& out, const json_value& value, int flags = 0)
    {
        std::ostream_iterator<char> iter(out);
        print(iter, value, flags);
        return out;
    }

    //! \brief Prints formatted json to given output stream. Uses default printing flags. Use print() function to customize printing process.
    //! \param out Output stream to print to.
    //! \param value Value to be printed.
    //! \return Output stream.
    inline std::ostream& operator << (std::ostream& out, const json_value& value)
    {
        return print(out, value);
    }

    //! \brief Prints the formatted json object to the given output stream.
    inline std::ostream& operator << (std::ostream& out, const json_object& value)
    {
        return print(out, json_value(value));
    }
#endif
}

#endif // JSONMAP_PRINT_HPP_INCLUDED
