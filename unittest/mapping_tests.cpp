#include "gtest/gtest.h"

#include "../jsonmap_mapping.hpp"

#include <deque>
#include <list>
#include <map>
#include <string>
#include <vector>

using namespace jsonmap;

namespace
{
    struct point
    {
        int x;
        int y;
    };

    struct shape
    {
        shape() : visible(false) {}

        std::string name;
        std::vector<point> points;
        std::map<std::string, double> attrs;
        json_object extra;
        bool visible;
    };

    struct box
    {
        point corner;
        std::list<point> marks;
    };

    struct color
    {
        unsigned char r, g, b;
    };

    class account
    {
    public:
        account() : balance_(0) {}

        const std::string& owner() const { return owner_; }
        void set_owner(const std::string& owner) { owner_ = owner; }

        long long balance() const { return balance_; }
        void set_balance(long long balance) { balance_ = balance; }

    private:
        std::string owner_;
        long long balance_;
    };

    void register_point(registry& reg)
    {
        reg.add<point>()
            .field("x", &point::x)
            .field("y", &point::y);
    }

    void register_all(registry& reg)
    {
        register_point(reg);
        reg.add<point>("swapped")
            .field("x", &point::y)
            .field("y", &point::x);
        reg.add<shape>()
            .field("name", &shape::name)
            .field("points", &shape::points)
            .field("attrs", &shape::attrs)
            .field("extra", &shape::extra)
            .field("visible", &shape::visible);
        reg.add<box>()
            .field("corner", &box::corner, "swapped")
            .field("marks", &box::marks, "swapped");
        reg.add<account>()
            .property("owner", &account::owner, &account::set_owner)
            .property("balance", &account::balance, &account::set_balance);
    }

    template<class T>
    T decode(registry& reg, const char* data)
    {
        string_source src(data);
        parser p(src);
        mapper m(p, reg);
        T result = m.next_as<T>();
        m.fail_if_not_at_end();
        return result;
    }

    template<class T>
    void expect_failure(registry& reg, const char* data, const std::string& message, std::size_t where)
    {
        string_source src(data);
        parser p(src);
        mapper m(p, reg);
        T target = T();
        try
        {
            m.next_as(target);
            ADD_FAILURE() << "Decode succeeded unexpectedly for text: " << data;
        }
        catch (const decode_error& e)
        {
            EXPECT_EQ(message, e.what()) << "For text: " << data;
            EXPECT_EQ(where, e.where()) << "For text: " << data;
        }
    }
}

namespace jsonmap
{
    template<>
    struct describe<color>
    {
        static const bool available = true;

        static void fields(mapping<color>& m)
        {
            m.field("r", &color::r).field("g", &color::g).field("b", &color::b);
        }
    };
}

TEST(mapping_tests, simple_class)
{
    registry reg;
    register_all(reg);

    point p = decode<point>(reg, " { \"x\": 1, \"y\": -2 } ");
    EXPECT_EQ(1, p.x);
    EXPECT_EQ(-2, p.y);
}

TEST(mapping_tests, unknown_keys_are_ignored)
{
    registry reg;
    register_all(reg);

    point p = decode<point>(reg, "{\"z\": {\"deep\": [1, 2, {\"x\": 99}]}, \"x\": 3, \"label\": \"ignored\", \"y\": 4}");
    EXPECT_EQ(3, p.x);
    EXPECT_EQ(4, p.y);
}

TEST(mapping_tests, nested_schemas)
{
    registry reg;
    register_all(reg);

    shape s = decode<shape>(reg,
        "{\"name\": \"triangle\","
        " \"points\": [{\"x\": 0, \"y\": 0}, {\"x\": 4, \"y\": 0}, {\"x\": 0, \"y\": 3}],"
        " \"attrs\": {\"area\": 6, \"ratio\": 0.75},"
        " \"extra\": {\"tags\": [\"a\", \"b\"]},"
        " \"visible\": true}");

    EXPECT_EQ("triangle", s.name);
    ASSERT_EQ(3u, s.points.size());
    EXPECT_EQ(4, s.points[1].x);
    EXPECT_EQ(3, s.points[2].y);
    ASSERT_EQ(2u, s.attrs.size());
    EXPECT_EQ(6.0, s.attrs["area"]);
    EXPECT_EQ(0.75, s.attrs["ratio"]);
    EXPECT_EQ(2u, s.extra.get("tags").as_array()->size());
    EXPECT_TRUE(s.visible);
}

TEST(mapping_tests, named_schema)
{
    registry reg;
    register_all(reg);

    box b = decode<box>(reg, "{\"corner\": {\"x\": 1, \"y\": 2}, \"marks\": [{\"x\": 5, \"y\": 6}]}");
    EXPECT_EQ(2, b.corner.x);
    EXPECT_EQ(1, b.corner.y);
    ASSERT_EQ(1u, b.marks.size());
    EXPECT_EQ(6, b.marks.front().x);
    EXPECT_EQ(5, b.marks.front().y);

    string_source src("{\"x\": 7, \"y\": 8}");
    parser p(src);
    mapper m(p, reg);
    point swapped = point();
    m.next_as(swapped, "swapped");
    EXPECT_EQ(8, swapped.x);
    EXPECT_EQ(7, swapped.y);
}

TEST(mapping_tests, accessors)
{
    registry reg;
    register_all(reg);

    account a = decode<account>(reg, "{\"owner\": \"ada\", \"balance\": 1200}");
    EXPECT_EQ("ada", a.owner());
    EXPECT_EQ(1200, a.balance());
    EXPECT_EQ("{\"owner\":\"ada\",\"balance\":1200}", to_json(reg, a, no_whitespace));
}

TEST(mapping_tests, derived_mapping)
{
    registry reg;
    EXPECT_FALSE(reg.contains<color>());

    color c = decode<color>(reg, "{\"r\": 255, \"g\": 128, \"b\": 0}");
    EXPECT_EQ(255, c.r);
    EXPECT_EQ(128, c.g);
    EXPECT_EQ(0, c.b);
    EXPECT_TRUE(reg.contains<color>());
    EXPECT_EQ(3u, reg.mapping_for<color>().size());

    // Deriving up front registers before any decoding
    registry eager;
    const mapping<color>& derived = eager.derive<color>();
    EXPECT_TRUE(eager.contains<color>());
    EXPECT_EQ(3u, derived.size());
    EXPECT_EQ(&derived, &eager.mapping_for<color>());
    EXPECT_TRUE(derived.find("g") != 0);
}

TEST(mapping_tests, containers)
{
    registry reg;
    register_all(reg);

    std::vector<int> v = decode<std::vector<int> >(reg, "[1, 2, 3]");
    ASSERT_EQ(3u, v.size());
    EXPECT_EQ(3, v[2]);

    std::deque<std::string> d = decode<std::deque<std::string> >(reg, "[\"a\", \"b\"]");
    ASSERT_EQ(2u, d.size());
    EXPECT_EQ("b", d.back());

    std::list<std::vector<bool> > l = decode<std::list<std::vector<bool> > >(reg, "[[true], [false, true], []]");
    ASSERT_EQ(3u, l.size());
    EXPECT_EQ(2u, (++l.begin())->size());
    EXPECT_TRUE(l.back().empty());

    std::map<std::string, point> pm = decode<std::map<std::string, point> >(reg, "{\"origin\": {\"x\": 0, \"y\": 0}, \"p\": {\"x\": 1, \"y\": 1}}");
    ASSERT_EQ(2u, pm.size());
    EXPECT_EQ(1, pm["p"].y);

    json_value any = decode<json_value>(reg, "[1, {\"a\": null}]");
    EXPECT_TRUE(any.is_array());
}

TEST(mapping_tests, scalars)
{
    registry reg;
    EXPECT_EQ(100, decode<int>(reg, "1e2"));
    EXPECT_EQ(-5, decode<short>(reg, "-5"));
    EXPECT_EQ(4000000000u, decode<unsigned int>(reg, "4000000000"));
    EXPECT_EQ(0.5f, decode<float>(reg, "0.5"));
    EXPECT_EQ(7.0, decode<double>(reg, "7"));
    EXPECT_TRUE(decode<bool>(reg, "true"));
    EXPECT_EQ("text", decode<std::string>(reg, "\"text\""));
}

TEST(mapping_tests, null_handling)
{
    registry reg;
    register_all(reg);

    string_source src("[null, null, null]");
    parser p(src);
    mapper m(p, reg);

    point pt = { 1, 2 };
    std::vector<int> v(2, 9);
    json_object obj{ { "kept", true } };

    int index = 0;
    p.do_list([&](parser&)
    {
        switch (index++)
        {
        case 0: m.read(pt); break;
        case 1: m.read(v); break;
        default: m.read(obj); break;
        }
    });
    EXPECT_EQ(3, index);

    EXPECT_EQ(1, pt.x);
    EXPECT_EQ(2u, v.size());
    EXPECT_TRUE(obj.get("kept").as_boolean());

    expect_failure<int>(reg, "null", "number expected", 0);
    expect_failure<bool>(reg, "null", "boolean expected", 0);
    expect_failure<std::string>(reg, "null", "string expected", 0);
}

TEST(mapping_tests, type_errors)
{
    registry reg;
    register_all(reg);

    expect_failure<point>(reg, "{\"x\": true}", "number expected", 6);
    expect_failure<point>(reg, "{\"x\": 1.5}", "integer expected", 6);
    expect_failure<point>(reg, "[1, 2]", "object expected", 0);
    expect_failure<std::vector<int> >(reg, "{}", "array expected", 0);
    expect_failure<std::map<std::string, int> >(reg, "[]", "object expected", 0);
    expect_failure<unsigned char>(reg, "300", "number out of range", 0);
    expect_failure<unsigned int>(reg, "-1", "number out of range", 0);
    expect_failure<int>(reg, "1e30", "number out of range", 0);
    expect_failure<float>(reg, "1e300", "number out of range", 0);
    expect_failure<float>(reg, " -3.5e38", "number out of range", 1);
    EXPECT_FLOAT_EQ(3.4e38f, decode<float>(reg, "3.4e38"));
    expect_failure<double>(reg, "1e309", "number exponent too large", 5);
    expect_failure<std::string>(reg, " 12", "string expected", 1);
    expect_failure<shape>(reg, "{\"name\": \"a\", \"points\": [{\"x\": 1, \"y\": ]}", "value expected", 39);
}

TEST(mapping_tests, schema_resolution_errors)
{
    registry reg;
    register_all(reg);

    try
    {
        decode<std::vector<std::map<std::string, std::list<int> > > >(reg, "[{\"a\": [1]}]");
    }
    catch (const decode_error& e)
    {
        ADD_FAILURE() << "Built-in schemas need no registration: " << e.what();
    }

    struct unregistered { int a; };
    try
    {
        decode<unregistered>(reg, "{\"a\": 1}");
        ADD_FAILURE() << "Decoding an unregistered type succeeded";
    }
    catch (const decode_error& e)
    {
        EXPECT_EQ(0u, std::string(e.what()).find("no mapping registered for "));
    }
    EXPECT_FALSE(reg.contains<unregistered>());

    string_source src("  {\"x\": 1}");
    parser p(src);
    mapper m(p, reg);
    point pt = point();
    try
    {
        m.next_as(pt, "nope");
        ADD_FAILURE() << "Unknown schema name resolved";
    }
    catch (const decode_error& e)
    {
        EXPECT_STREQ("no mapping registered for 'nope'", e.what());
        EXPECT_EQ(2u, e.where());
    }

    try
    {
        reg.add<shape>("triangle");
        m.next_as(pt, "triangle");
        ADD_FAILURE() << "Schema of another type resolved";
    }
    catch (const decode_error& e)
    {
        EXPECT_STREQ("mapping 'triangle' does not describe the requested type", e.what());
    }
}

TEST(mapping_tests, reregistration)
{
    const char* data = "{\"x\": 10, \"y\": 20}";

    registry reg;
    register_point(reg);
    point first = decode<point>(reg, data);

    register_point(reg);
    EXPECT_EQ(2u, reg.mapping_for<point>().size());
    point second = decode<point>(reg, data);

    EXPECT_EQ(first.x, second.x);
    EXPECT_EQ(first.y, second.y);

    // Re-registration starts from an empty mapping
    reg.add<point>().field("x", &point::x);
    point partial = point();
    partial.y = -1;
    string_source src(data);
    parser p(src);
    mapper m(p, reg);
    m.next_as(partial);
    EXPECT_EQ(10, partial.x);
    EXPECT_EQ(-1, partial.y);

    // Binding a field name again replaces the earlier binding
    reg.add<point>()
        .field("x", &point::x)
        .field("y", &point::y)
        .field("x", &point::y);
    EXPECT_EQ(2u, reg.mapping_for<point>().size());
    point rebound = decode<point>(reg, "{\"x\": 7}");
    EXPECT_EQ(7, rebound.y);
}

TEST(mapping_tests, generic_next)
{
    registry reg;
    string_source src("{\"foo\": 1, \"bar\": -2} [1, 2, 3]");
    parser p(src);
    mapper m(p, reg);

    json_value first = m.next();
    EXPECT_EQ(1, first.as_object()->read_property("foo").as_integer());
    EXPECT_EQ(-2, first.as_object()->read_property("bar").as_integer());

    std::vector<long long> second = m.next_as<std::vector<long long> >();
    ASSERT_EQ(3u, second.size());
    EXPECT_EQ(2, second[1]);
    m.fail_if_not_at_end();
}

TEST(mapping_tests, write_path)
{
    registry reg;
    register_all(reg);

    point pt = { 1, 2 };
    EXPECT_EQ("{\"x\":1,\"y\":2}", to_json(reg, pt, no_whitespace));
    EXPECT_EQ("{\"x\":2,\"y\":1}", to_json(to_value(reg, pt, "swapped"), no_whitespace));

    shape s;
    s.name = "line";
    point a = { 0, 0 };
    point b = { 3, 4 };
    s.points.push_back(a);
    s.points.push_back(b);
    s.attrs["length"] = 5.0;
    s.extra.put("note", "hi");
    s.visible = true;

    json_value v = to_value(reg, s);
    ASSERT_TRUE(v.is_object());
    const json_object& obj = *v.as_object();
    json_object::const_iterator it = obj.begin();
    EXPECT_EQ("name", (it++)->first);
    EXPECT_EQ("points", (it++)->first);
    EXPECT_EQ("attrs", (it++)->first);
    EXPECT_EQ("extra", (it++)->first);
    EXPECT_EQ("visible", (it++)->first);

    // What the mapping writes, it reads back
    const std::string text = to_json(reg, s);
    shape back = decode<shape>(reg, text.c_str());
    EXPECT_EQ(s.name, back.name);
    ASSERT_EQ(2u, back.points.size());
    EXPECT_EQ(4, back.points[1].y);
    EXPECT_EQ(5.0, back.attrs["length"]);
    EXPECT_EQ(s.extra, back.extra);
    EXPECT_TRUE(back.visible);

    box bx;
    bx.corner = a;
    bx.marks.push_back(b);
    EXPECT_EQ("{\"corner\":{\"x\":0,\"y\":0},\"marks\":[{\"x\":4,\"y\":3}]}", to_json(reg, bx, no_whitespace));
}
