#include "gtest/gtest.h"

#if !defined(JSONMAP_NO_EXCEPTIONS)
#include "../jsonmap.hpp"

#include <string>

using namespace jsonmap;

class test_parse_failure_except
{
public:
    void test(const char* data, const char* errorString, std::size_t offset, bool expectSuccess = false)
    {
        string_source src(data);
        parser p(src);
        try
        {
            p.next();
            p.fail_if_not_at_end();
            EXPECT_TRUE(expectSuccess) << "Parse succeeded unexpectedly for text: " << data;
        }
        catch (const decode_error& e)
        {
            EXPECT_FALSE(expectSuccess) << "Parse failed unexpectedly for text: " << data << " (" << e.what() << ")";
            EXPECT_EQ(offset, e.where()) << "For error (" << errorString << ") and text: " << data;
            EXPECT_STREQ(errorString, e.what()) << "For text: " << data;
        }
    }
};

TEST(with_exceptions, lists)
{
    test_parse_failure_except tester;
    tester.test("", "unexpected end of input", 0);
    tester.test(" ", "unexpected end of input", 1);
    tester.test(" [ ", "incomplete list", 3);
    tester.test(" [\n] ", "", 0, true);
    tester.test(" [ \"", "incomplete string", 4);
    tester.test(" [ \"\"", "incomplete list", 5);
    tester.test(" [ \"\"   \t \n", "incomplete list", 11);
    tester.test(" [ 0,     \t", "incomplete list", 11);
    tester.test(" [ 0, ] ", "value expected", 6);
    tester.test(" [\t\n[\t\n]\t\n] ", "", 0, true);
    tester.test(" [[[[[[[[[[[[[]]]]]]]]]]]]] ", "", 0, true);
    tester.test(" [ [], [], [], [], [  ], [], [], [], [] ] \t\n", "", 0, true);
    tester.test(" [] [] ", "end of input expected", 4);
    tester.test("[1 2]", "',' or ']' expected", 3);
    tester.test("[1,2,", "incomplete list", 5);
}

TEST(with_exceptions, literals)
{
    test_parse_failure_except tester;
    tester.test(" [ t ]", "'true' expected", 4);
    tester.test(" [ true ] ", "", 0, true);
    tester.test(" [ TRUE ] ", "value expected", 3);
    tester.test(" [ fal ]", "'false' expected", 6);
    tester.test(" [ false ] ", "", 0, true);
    tester.test(" [ FALSE ] ", "value expected", 3);
    tester.test(" [ n ] ", "'null' expected", 4);
    tester.test(" [ null ] ", "", 0, true);
    tester.test(" [ NULL ] ", "value expected", 3);
    tester.test(" null ", "", 0, true);
    tester.test(" truex", "end of input expected", 5);
}

TEST(with_exceptions, numbers)
{
    test_parse_failure_except tester;
    tester.test(" [ Inf ] ", "value expected", 3);
    tester.test(" [ -Inf ] ", "digit expected", 4);
    tester.test(" [ NaN ] ", "value expected", 3);
    tester.test(" [ 0", "incomplete list", 4);
    tester.test(" [ -0", "incomplete list", 5);
    tester.test(" [ 0 ] ", "", 0, true);
    tester.test(" [ -0 ] ", "", 0, true);
    tester.test(" [ 01 ] ", "',' or ']' expected", 4);
    tester.test(" [ 01.123 ] ", "',' or ']' expected", 4);
    tester.test(" [ .132 ] ", "value expected", 3);
    tester.test(" [ -.123 ] ", "digit expected", 4);
    tester.test(" [ 123", "incomplete list", 6);
    tester.test(" [ 123 ] ", "", 0, true);
    tester.test(" [ -123 ] ", "", 0, true);
    tester.test(" [ - 123 ] ", "digit expected", 4);
    tester.test(" [ 123d ] ", "',' or ']' expected", 6);
    tester.test(" [ 123.", "fraction digits expected", 7);
    tester.test(" [ 123. ] ", "fraction digits expected", 7);
    tester.test(" [ -123.", "fraction digits expected", 8);
    tester.test(" [ 0. ]", "fraction digits expected", 5);
    tester.test(" [ 0.0 ] ", "", 0, true);
    tester.test(" [ -0.0 ] ", "", 0, true);
    tester.test(" [ 123e", "number exponent expected", 7);
    tester.test(" [ 123e+", "number exponent expected", 8);
    tester.test(" [ 123e-", "number exponent expected", 8);
    tester.test(" [ -123E+", "number exponent expected", 9);
    tester.test(" [ 123E-", "number exponent expected", 8);
    tester.test(" [ 123e0 ] ", "", 0, true);
    tester.test(" [ 123e+0 ] ", "", 0, true);
    tester.test(" [ 123e-0123 ] ", "", 0, true);
    tester.test(" [ 123e0. ] ", "',' or ']' expected", 8);
    tester.test(" [ 1e308 ] ", "", 0, true);
    tester.test(" [ 1e309 ] ", "number exponent too large", 8);
    tester.test(" [ 1e-307 ] ", "", 0, true);
    tester.test(" [ 1e-308 ] ", "number exponent too small", 9);
    tester.test("1e400", "number exponent too large", 5);
    tester.test("1e-400", "number exponent too small", 6);
    tester.test("1e99999999999", "number exponent too large", 13);
    tester.test("100e308", "number out of range", 7);
    tester.test("-1.8e308", "number out of range", 8);
    tester.test("1.7976931348623157e308", "", 0, true);
    tester.test("0.0000000000000000049406564584124654e-306", "", 0, true);

    // Long digit runs are range checked as a whole
    std::string digits(400, '0');
    digits[0] = '1';
    tester.test(digits.c_str(), "number out of range", 400);
    tester.test(("-" + digits).c_str(), "number out of range", 401);
    tester.test(("0." + digits).c_str(), "", 0, true);
    tester.test(("0." + digits + "e308").c_str(), "", 0, true);
    tester.test(("[" + digits + ".5]").c_str(), "number out of range", 403);
}

TEST(with_exceptions, strings)
{
    test_parse_failure_except tester;
    tester.test(" [ \" ]", "incomplete string", 6);
    tester.test(" [ \"", "incomplete string", 4);
    tester.test(" [ \"\\", "incomplete escape sequence", 5);
    tester.test(" [ \"\\x\" ] ", "invalid escape character 'x'", 5);
    tester.test(" [ \"\\\"\\\\\\/\\b\\f\\n\\r\\t\" ] ", "", 0, true);
    tester.test(" [ \"\\u12\" ] ", "invalid hex digit '\"'", 8);
    tester.test(" [ \"\\u12", "incomplete escape sequence", 8);
    tester.test(" [ \"\\u00aF\" ] ", "", 0, true);
    tester.test(" [ \"\\ud834\" ] ", "high surrogate not followed by low surrogate", 10);
    tester.test(" [ \"\\ud834x\" ] ", "high surrogate not followed by low surrogate", 10);
    tester.test(" [ \"\\ud834\\n\" ] ", "high surrogate not followed by low surrogate", 11);
    tester.test(" [ \"\\ud834\\u0041\" ] ", "high surrogate not followed by low surrogate", 10);
    tester.test(" [ \"\\udd1e\" ] ", "unexpected low surrogate", 4);
    tester.test(" [ \"\\ud834\\udd1e\" ] ", "", 0, true);
}

TEST(with_exceptions, maps)
{
    test_parse_failure_except tester;
    tester.test(" { ", "incomplete map", 3);
    tester.test(" { } ", "", 0, true);
    tester.test(" { 1: 2 } ", "non-string map key", 3);
    tester.test("{1:2}", "non-string map key", 1);
    tester.test(" { \"a\" 2 } ", "':' expected", 7);
    tester.test(" { \"a\": ", "incomplete map", 8);
    tester.test(" { \"a\": 1 ", "incomplete map", 10);
    tester.test(" { \"a\": 1 ] ", "',' or '}' expected", 10);
    tester.test(" { \"a\": 1, } ", "non-string map key", 11);
    tester.test(" {\"a\":1,\"b\":{\"c\":[]}} ", "", 0, true);
}

#endif
