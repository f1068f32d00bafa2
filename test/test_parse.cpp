#include <catch2/catch_all.hpp>
#include <bon/parser.h>
#include <cmath>
#include <limits>

using namespace bon;
using namespace bon::literals;

TEST_CASE("Numeric literals are classified once, by their text", "[parse]") {
    auto ten = parse("10");
    REQUIRE(ten.is_int());
    REQUIRE(ten.as_int() == 10);

    auto ten_f = parse("10.0");
    REQUIRE(ten_f.is_float());
    REQUIRE(ten_f.as_float() == 10.0);

    auto five = parse("5f");
    REQUIRE(five.is_float());
    REQUIRE(five.as_float() == 5.0);

    auto g = parse("6.67e-11");
    REQUIRE(g.is_float());
    REQUIRE(g.as_float() == 6.67e-11);

    auto neg = parse("-3");
    REQUIRE(neg.is_int());
    REQUIRE(neg.as_int() == -3);

    REQUIRE(parse("1e5f").as_float() == 1e5);
    REQUIRE(parse("2E3").is_float());
}

TEST_CASE("Integer limits parse exactly", "[parse]") {
    REQUIRE(parse("9223372036854775807").as_int() == std::numeric_limits<int64_t>::max());
    REQUIRE(parse("-9223372036854775808").as_int() == std::numeric_limits<int64_t>::min());
}

TEST_CASE("Float literals past the double range become infinity", "[parse]") {
    auto v = parse("[1e999, -1e999]");
    REQUIRE(std::isinf(v[0].as_float()));
    REQUIRE(v[0].as_float() > 0);
    REQUIRE(v[1].as_float() < 0);
}

TEST_CASE("Empty containers", "[parse]") {
    auto obj = parse("{}");
    REQUIRE(obj.is_object());
    REQUIRE(obj.empty());

    auto list = parse("[]");
    REQUIRE(list.is_list());
    REQUIRE(list.empty());

    REQUIRE(parse("{ \n }").is_object());
    REQUIRE(parse("[\t]").is_list());
}

TEST_CASE("Nested objects", "[parse]") {
    auto v = parse("{object: {sub_value: \"hello, world\";};}");
    REQUIRE(v.size() == 1);
    REQUIRE(v.as_object()[0].key == "object");
    auto const& inner = v.at("object");
    REQUIRE(inner.is_object());
    REQUIRE(inner.size() == 1);
    REQUIRE(inner.at("sub_value").as_string() == "hello, world");
}

TEST_CASE("Layout between tokens carries no meaning", "[parse]") {
    REQUIRE(deep_equals(parse("{ key:1 ; }"), parse("{key:1;}")));
    REQUIRE(parse("{\n\tkey\n:\n1\n;\n}") == parse("{key: 1;}"));
    REQUIRE(parse("[ 1 ,2,   3 ]") == parse("[1,2,3]"));
}

TEST_CASE("Lists hold mixed values in order", "[parse]") {
    auto v = R"({value: "data"; list: [1, 2e-5, 3.5, 4f, "5", {key: "value";} ]; nested_object: { hello: "world"; }; })"_bon;
    auto const& list = v.at("list");
    REQUIRE(list.size() == 6);
    REQUIRE(list[0].as_int() == 1);
    REQUIRE(list[1].as_float() == 2e-5);
    REQUIRE(list[2].as_float() == 3.5);
    REQUIRE(list[3].as_float() == 4.0);
    REQUIRE(list[4].as_string() == "5");
    REQUIRE(list[5].at("key").as_string() == "value");
    REQUIRE(v["nested_object"]["hello"].as_string() == "world");
    REQUIRE(v["value"].as_string() == "data");
}

TEST_CASE("Any value is accepted as the document", "[parse]") {
    REQUIRE(parse("\"just a string\"").as_string() == "just a string");
    REQUIRE(parse("'single'").as_string() == "single");
    REQUIRE(parse("  42  ").as_int() == 42);
    REQUIRE(parse("[[1], [2, [3]]]")[1][1][0].as_int() == 3);
}

TEST_CASE("Repeated keys are preserved in document order", "[parse]") {
    auto v = parse("{k: 1; k: 2; j: 3; k: 4;}");
    REQUIRE(v.size() == 4);
    REQUIRE(v.count("k") == 3);
    REQUIRE(v.keys() == std::vector<std::string>{"k", "k", "j", "k"});
    auto all = v.find_all("k");
    REQUIRE(all[2]->as_int() == 4);
}

TEST_CASE("String contents are unescaped", "[parse]") {
    auto v = parse(R"({a: "say \"hi\""; b: 'it\'s'; c: "back\\slash"; d: "multi
line";})");
    REQUIRE(v.at("a").as_string() == "say \"hi\"");
    REQUIRE(v.at("b").as_string() == "it's");
    REQUIRE(v.at("c").as_string() == "back\\slash");
    REQUIRE(v.at("d").as_string() == "multi\nline");
}

TEST_CASE("Identifiers that look numeric after the first character are keys", "[parse]") {
    auto v = parse("{value_1: 1; _2: 2; e5: 3;}");
    REQUIRE(v.at("value_1").as_int() == 1);
    REQUIRE(v.at("_2").as_int() == 2);
    REQUIRE(v.at("e5").as_int() == 3);
}

TEST_CASE("try_parse reports instead of throwing", "[parse]") {
    auto ok = try_parse("{a: 1;}");
    REQUIRE(ok);
    REQUIRE(ok.value->at("a").as_int() == 1);
    REQUIRE_FALSE(ok.error.has_value());

    auto bad = try_parse("{a: 1}");
    REQUIRE_FALSE(bad);
    REQUIRE_FALSE(bad.value.has_value());
    REQUIRE(bad.error.has_value());
    REQUIRE(bad.error->kind() == ErrorKind::UnexpectedToken);
}

TEST_CASE("Verbose parsing returns the same tree", "[parse]") {
    ParseOptions options;
    options.verbose = true;
    REQUIRE(parse("{a: [1, 2];}", options) == parse("{a: [1, 2];}"));
    REQUIRE_THROWS_AS(parse("{a: [1, 2]}", options), ParseError);
}

TEST_CASE("Nesting depth limit", "[parse]") {
    ParseOptions options;
    options.max_depth = 3;
    REQUIRE_NOTHROW(parse("[[[1]]]", options));
    REQUIRE_NOTHROW(parse("{a: {b: [1];};}", options));
    REQUIRE_THROWS_AS(parse("[[[[1]]]]", options), ParseError);

    std::string deep(600, '[');
    deep += std::string(600, ']');
    REQUIRE_THROWS_AS(parse(deep), ParseError);
}
