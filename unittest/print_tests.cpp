#include "gtest/gtest.h"
#include "../jsonmap.hpp"
#include "../jsonmap_print.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <random>
#include <sstream>

using namespace jsonmap;

static const char text[] =
"{\n"
"    \"num1\":\t0.123556426,\n"
"    \"int1\":  9007199254740993,\n"
"    \"bool1\": true,\n"
"    \"null1\": null,\n"
"    \"test1\": \"hello world\",\n"
"    \"test2\": \"hello\\u0020world\",\n"
"    \"test3\": \"hello\\n\\tworld\\u0001\",\n"
"    \"test4\": \"hello \\ud800\\udc00 caf\\u00e9\",\n"
"    \"array1\": [ true, false, 0.1, \"hello\", [], {} ],\n"
"    \"obj1\": { \"sub1\": -123.456e-7, \"bool2\":\tfalse, \"big\": 1e300 }\n"
"}";

static json_value parse(const std::string& data)
{
    string_source src(data);
    parser p(src);
    json_value v = p.next();
    p.fail_if_not_at_end();
    return v;
}

static void round_trip(int flags)
{
    json_value v = parse(text);
    std::string printed = to_json(v, flags);
    json_value back;
    try
    {
        back = parse(printed);
    }
    catch (const decode_error& e)
    {
        ADD_FAILURE() << "Unexpected parse error: " << e.what() << " at offset " << e.where() << " in " << printed;
        return;
    }
    EXPECT_EQ(v, back) << "Flags(" << flags << ") printed " << printed;
    EXPECT_EQ(printed, to_json(back, flags));
}

TEST(print_tests, round_trip_default)
{
    round_trip(0);
}

TEST(print_tests, round_trip_compact)
{
    round_trip(no_whitespace);
}

TEST(print_tests, round_trip_spaces)
{
    round_trip(use_spaces | indent_2_spaces);
}

TEST(print_tests, round_trip_escaped)
{
    round_trip(escape_unicode | no_whitespace);
}

TEST(print_tests, layout)
{
    json_value v = parse("{\"a\":1,\"b\":[true,null],\"o\":{\"k\":\"v\"},\"e\":{}}");
    EXPECT_EQ("{\"a\":1,\"b\":[true,null],\"o\":{\"k\":\"v\"},\"e\":{}}", to_json(v, no_whitespace));
    EXPECT_EQ("{\n\t\"a\": 1,\n\t\"b\": [true, null],\n\t\"o\": {\n\t\t\"k\": \"v\"\n\t},\n\t\"e\": {}\n}", to_json(v));
    EXPECT_EQ("{\n  \"a\": 1,\n  \"b\": [true, null],\n  \"o\": {\n    \"k\": \"v\"\n  },\n  \"e\": {}\n}", to_json(v, use_spaces | indent_2_spaces));
    EXPECT_EQ("{\n    \"o\": {\n        \"k\": \"v\"\n    }\n}", to_json(parse("{\"o\":{\"k\":\"v\"}}"), use_spaces));
    EXPECT_EQ("[]", to_json(parse("[]")));
    EXPECT_EQ("{}", to_json(parse("{}")));
}

TEST(print_tests, numbers)
{
    EXPECT_EQ("-42", to_json(json_value(-42)));
    EXPECT_EQ("-9223372036854775808", to_json(json_value(std::numeric_limits<long long>::min())));
    EXPECT_EQ("0.5", to_json(json_value(0.5)));
    EXPECT_EQ("2.0", to_json(json_value(2.0)));
    EXPECT_EQ("1e+20", to_json(json_value(1e20)));
    EXPECT_EQ(value_number, parse(to_json(json_value(2.0))).type());
    EXPECT_EQ(0.1, parse(to_json(json_value(0.1))).as_number());
    EXPECT_EQ(1.0 / 3.0, parse(to_json(json_value(1.0 / 3.0))).as_number());
    EXPECT_EQ(-3.1656550389409077e-137, parse(to_json(json_value(-3.1656550389409077e-137))).as_number());
    EXPECT_EQ(std::numeric_limits<double>::max(), parse(to_json(json_value(std::numeric_limits<double>::max()))).as_number());
    EXPECT_EQ("-0.0", to_json(json_value(-0.0)));
}

TEST(print_tests, small_exponents)
{
    const double values[] =
    {
        std::numeric_limits<double>::min(),
        std::numeric_limits<double>::denorm_min(),
        -std::numeric_limits<double>::denorm_min(),
        8.651472899065772e-308,
        1e-320,
        std::numeric_limits<double>::min() - std::numeric_limits<double>::denorm_min(),
    };
    for (std::size_t i = 0; i < sizeof(values) / sizeof(values[0]); ++i)
    {
        const std::string printed = to_json(json_value(values[i]));
        EXPECT_NE(std::string::npos, printed.find("e-307")) << printed;
        EXPECT_EQ(values[i], parse(printed).as_number()) << printed;
    }
    EXPECT_EQ("0.1e-307", to_json(json_value(1e-308)));
    EXPECT_EQ("-0.00001e-307", to_json(json_value(-1e-312)));
    EXPECT_EQ("1e-307", to_json(json_value(1e-307)));
}

TEST(print_tests, random_round_trip)
{
    std::mt19937_64 generator(20130921);
    int tested = 0;
    for (int i = 0; i < 20000; ++i)
    {
        const unsigned long long bits = generator();
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        if (!std::isfinite(d))
        {
            continue;
        }
        ++tested;

        const std::string printed = to_json(json_value(d));
        json_value back;
        try
        {
            back = parse(printed);
        }
        catch (const decode_error& e)
        {
            ADD_FAILURE() << "Unexpected parse error: " << e.what() << " in " << printed;
            continue;
        }
        ASSERT_EQ(value_number, back.type()) << printed;
        EXPECT_EQ(d, back.as_number()) << printed;
        EXPECT_EQ(std::signbit(d), std::signbit(back.as_number())) << printed;
    }
    EXPECT_GT(tested, 19000);
}

TEST(print_tests, non_finite)
{
    try
    {
        to_json(json_value(std::numeric_limits<double>::infinity()));
        ADD_FAILURE() << "Printed an infinite number";
    }
    catch (const decode_error& e)
    {
        EXPECT_STREQ("number is not finite", e.what());
        EXPECT_EQ(0u, e.where());
    }
}

TEST(print_tests, strings)
{
    EXPECT_EQ("\"a\\\"b\\\\c/\\b\\f\\n\\r\\t\\u0001\\u001f\"", to_json(json_value("a\"b\\c/\b\f\n\r\t\x01\x1f")));
    EXPECT_EQ("\"caf\xc3\xa9\"", to_json(json_value("caf\xc3\xa9")));
    EXPECT_EQ("\"caf\\u00e9\"", to_json(json_value("caf\xc3\xa9"), escape_unicode));
    EXPECT_EQ("\"\\u20ac\"", to_json(json_value("\xe2\x82\xac"), escape_unicode));
    EXPECT_EQ("\"\\ud834\\udd1e\"", to_json(json_value("\xf0\x9d\x84\x9e"), escape_unicode));
    EXPECT_EQ("\"\\u0024\\u00a2\\u20ac\\ud800\\udf48\"", to_json(json_value("\x24\xc2\xa2\xe2\x82\xac\xf0\x90\x8d\x88"), escape_unicode));
    EXPECT_EQ("\"\xff\"", to_json(json_value("\xff")));
}

TEST(print_tests, invalid_utf8)
{
    const char* const invalid[] =
    {
        "\xff",                // not a lead byte
        "\x80",                // stray continuation byte
        "a\xe2\x82",            // truncated
        "\xe0\x41\x42",         // continuation byte expected
        "\xc0\xaf",             // overlong '/'
        "\xe0\x80\xaf",         // overlong '/'
        "\xed\xa0\x80",         // surrogate
        "\xf4\x90\x80\x80",     // above 0x10FFFF
        "\xf7\xbf\xbf\xbf",     // above 0x10FFFF
    };
    for (std::size_t i = 0; i < sizeof(invalid) / sizeof(invalid[0]); ++i)
    {
        try
        {
            to_json(json_value(invalid[i]), escape_unicode);
            ADD_FAILURE() << "Escaped invalid UTF-8 at index " << i;
        }
        catch (const decode_error& e)
        {
            EXPECT_STREQ("invalid UTF-8", e.what()) << i;
        }
        // Without escaping the bytes are copied through
        EXPECT_EQ(std::string("\"") + invalid[i] + "\"", to_json(json_value(invalid[i]))) << i;
    }
}

TEST(print_tests, streams)
{
    json_object obj{ { "k", json_array(2, json_value(1)) } };
    std::ostringstream out;
    out << obj;
    EXPECT_EQ("{\n\t\"k\": [1, 1]\n}", out.str());

    std::ostringstream compact;
    print(compact, json_value(obj), no_whitespace);
    EXPECT_EQ("{\"k\":[1,1]}", compact.str());

    std::ostringstream value;
    value << json_value("x");
    EXPECT_EQ("\"x\"", value.str());
}
