#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/shell/value_literal.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <string_view>

using namespace rynamo;
using namespace rynamo::shell;
using Catch::Matchers::ContainsSubstring;

namespace {

AttributeValue parse_ok(std::string_view text)
{
    AttributeValue value{};
    std::string message;
    const auto error = parse_value_literal(text, value, message);
    INFO(message);
    REQUIRE_FALSE(error);
    return value;
}

std::string parse_error_message(std::string_view text)
{
    AttributeValue value{};
    std::string message;
    const auto error = parse_value_literal(text, value, message);
    REQUIRE(error == Errc::ParseError);
    return message;
}

AttributeValue num(std::int64_t value)
{
    return AttributeValue::number(Decimal::from_integer(value));
}

}  // namespace

TEST_CASE("Scalar literals carry their type tag")
{
    CHECK(parse_ok(R"(S"hello")") == AttributeValue::string("hello"));
    CHECK(parse_ok(R"(N"42")") == num(42));
    CHECK(parse_ok(R"(B"aGk=")") == AttributeValue::binary("hi"));
    CHECK(parse_ok("BOOL true") == AttributeValue::boolean(true));
    CHECK(parse_ok("BOOL false") == AttributeValue::boolean(false));
    CHECK(parse_ok("NULL") == AttributeValue::null());
    CHECK(parse_ok(R"(  S"padded"  )") == AttributeValue::string("padded"));
}

TEST_CASE("String literals understand escapes")
{
    CHECK(parse_ok(R"(S"say \"hi\"\n")") == AttributeValue::string("say \"hi\"\n"));
    CHECK(parse_ok(R"(S"back\\slash")") == AttributeValue::string("back\\slash"));
}

TEST_CASE("Collection literals nest")
{
    const auto value = parse_ok(R"(M{name: S"Ann", "full name": S"Ann Lee", tags: SS["b", "a", "b"], scores: L[N"1", [N"2"]], meta: {}})");
    REQUIRE(value.type() == AttributeType::Map);
    const auto& map = value.as_map();
    CHECK(map.at("name") == AttributeValue::string("Ann"));
    CHECK(map.at("full name") == AttributeValue::string("Ann Lee"));
    CHECK(map.at("tags") == AttributeValue::string_set({"a", "b"}));
    CHECK(map.at("scores") == AttributeValue::list({num(1), AttributeValue::list({num(2)})}));
    CHECK(map.at("meta") == AttributeValue::map({}));
}

TEST_CASE("Set literals build sorted sets")
{
    CHECK(parse_ok(R"(NS["10", "2"])") == AttributeValue::number_set({Decimal::from_integer(2), Decimal::from_integer(10)}));
    CHECK(parse_ok(R"(BS["aGk=", "eW8="])") == AttributeValue::binary_set({"hi", "yo"}));
    CHECK(parse_ok("[]") == AttributeValue::list({}));
}

TEST_CASE("Malformed literals report a parse error")
{
    CHECK_THAT(parse_error_message(R"(S"open)"), ContainsSubstring("closing"));
    CHECK_THAT(parse_error_message(R"(L[S"a")"), ContainsSubstring("']'"));
    CHECK_THAT(parse_error_message(R"(M{a S"x"})"), ContainsSubstring("':'"));
    CHECK_THAT(parse_error_message("BOOL maybe"), ContainsSubstring("true or false"));
    CHECK_THAT(parse_error_message(R"(B"***")"), ContainsSubstring("base64"));
    CHECK_THAT(parse_error_message(R"(S"a" S"b")"), ContainsSubstring("invalid value literal"));
    parse_error_message(R"(N"abc")");
    parse_error_message("plain");
}

TEST_CASE("Item literals must be maps")
{
    Item item{};
    std::string message;
    REQUIRE_FALSE(parse_item_literal(R"({id: S"1", n: N"2"})", item, message));
    CHECK(item == Item{{"id", AttributeValue::string("1")}, {"n", num(2)}});

    CHECK(parse_item_literal(R"(S"1")", item, message) == Errc::ParseError);
    CHECK(message == "expected a map literal for the item");
}

TEST_CASE("Rendering produces parseable literals")
{
    const Item item{
        {"id", AttributeValue::string("a\"b")},
        {"n", AttributeValue::number(Decimal::from_integer(-7))},
        {"odd key", AttributeValue::boolean(true)},
        {"raw", AttributeValue::binary("hi")},
        {"set", AttributeValue::string_set({"x", "y"})},
        {"nums", AttributeValue::number_set({Decimal::from_integer(3)})},
        {"nested", AttributeValue::map({{"empty", AttributeValue::null()}})},
        {"list", AttributeValue::list({AttributeValue::string("v")})},
    };

    const auto text = render_item(item);
    CHECK_THAT(text, ContainsSubstring(R"(id: S"a\"b")"));
    CHECK_THAT(text, ContainsSubstring(R"("odd key": BOOL true)"));
    CHECK_THAT(text, ContainsSubstring(R"(raw: B"aGk=")"));
    CHECK_THAT(text, ContainsSubstring(R"(set: SS["x", "y"])"));
    CHECK_THAT(text, ContainsSubstring(R"(nested: M{empty: NULL})"));

    Item parsed{};
    std::string message;
    REQUIRE_FALSE(parse_item_literal(text, parsed, message));
    CHECK(parsed == item);
}

TEST_CASE("Map keys render bare only when plain")
{
    CHECK(render_key("plain_key-1.x") == "plain_key-1.x");
    CHECK(render_key("has space") == "\"has space\"");
    CHECK(render_key("") == "\"\"");
}
