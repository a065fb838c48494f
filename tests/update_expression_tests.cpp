#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/expression/update_applier.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

using namespace rynamo;
using namespace rynamo::expression;
using Catch::Matchers::ContainsSubstring;

namespace {

AttributeValue num(std::int64_t value)
{
    return AttributeValue::number(Decimal::from_integer(value));
}

AttributeValue str(std::string value)
{
    return AttributeValue::string(std::move(value));
}

struct Applied final {
    std::error_code error{};
    std::string message{};
    Item item{};
};

Applied apply(const std::string& text, Item item, const PlaceholderBindings& bindings)
{
    auto parsed = parse_update_expression(text);
    INFO(text << ": " << summarize_diagnostics(parsed.diagnostics));
    REQUIRE(parsed.success());

    Applied result{};
    result.error = apply_update(*parsed.expression, bindings, item, result.message);
    result.item = std::move(item);
    return result;
}

Item apply_ok(const std::string& text, Item item, const PlaceholderBindings& bindings)
{
    auto result = apply(text, std::move(item), bindings);
    INFO(text << ": " << result.message);
    REQUIRE_FALSE(result.error);
    return std::move(result.item);
}

Item base_item()
{
    return Item{
        {"pk", str("k1")},
        {"count", num(5)},
        {"tags", AttributeValue::string_set({"a", "b"})},
        {"list", AttributeValue::list({num(1), num(2)})},
        {"doc", AttributeValue::map({{"inner", str("x")}})},
    };
}

}  // namespace

TEST_CASE("SET assigns top-level and nested attributes")
{
    const PlaceholderBindings bindings{.names = {{"#d", "doc"}}, .values = {{":v", str("hello")}, {":y", str("y")}}};

    const auto item = apply_ok("SET greeting = :v, #d.added = :y, list[0] = :v", base_item(), bindings);
    CHECK(item.at("greeting") == str("hello"));
    CHECK(item.at("doc").as_map().at("added") == str("y"));
    CHECK(item.at("doc").as_map().at("inner") == str("x"));
    CHECK(item.at("list").as_list().front() == str("hello"));
}

TEST_CASE("SET past the end of a list appends")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":v", num(9)}}};

    const auto item = apply_ok("SET list[10] = :v", base_item(), bindings);
    REQUIRE(item.at("list").as_list().size() == 3U);
    CHECK(item.at("list").as_list().back() == num(9));
}

TEST_CASE("SET arithmetic uses the values before the update")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":one", num(1)}}};

    const auto item = apply_ok("SET count = count + :one, previous = count", base_item(), bindings);
    CHECK(item.at("count") == num(6));
    CHECK(item.at("previous") == num(5));

    const auto lowered = apply_ok("SET count = count - :one", base_item(), bindings);
    CHECK(lowered.at("count") == num(4));
}

TEST_CASE("if_not_exists keeps existing values")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":zero", num(0)}, {":one", num(1)}}};

    const auto item = apply_ok("SET count = if_not_exists(count, :zero) + :one, fresh = if_not_exists(fresh, :zero)",
                               base_item(),
                               bindings);
    CHECK(item.at("count") == num(6));
    CHECK(item.at("fresh") == num(0));
}

TEST_CASE("list_append concatenates lists")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":more", AttributeValue::list({num(3)})}}};

    const auto item = apply_ok("SET list = list_append(list, :more), front = list_append(:more, list)", base_item(), bindings);
    REQUIRE(item.at("list").as_list().size() == 3U);
    CHECK(item.at("list").as_list().back() == num(3));
    CHECK(item.at("front").as_list().front() == num(3));
}

TEST_CASE("REMOVE deletes attributes and list elements")
{
    const PlaceholderBindings bindings{};

    const auto item = apply_ok("REMOVE count, list[0], doc.inner, missing", base_item(), bindings);
    CHECK_FALSE(item.contains("count"));
    REQUIRE(item.at("list").as_list().size() == 1U);
    CHECK(item.at("list").as_list().front() == num(2));
    CHECK(item.at("doc").as_map().empty());
}

TEST_CASE("REMOVE of several list elements uses the original positions")
{
    const PlaceholderBindings bindings{};
    auto item = base_item();
    item["letters"] = AttributeValue::list({str("a"), str("b"), str("c"), str("d")});
    item["nested"] = AttributeValue::list({
        str("first"),
        AttributeValue::map({{"inner", AttributeValue::list({num(7), num(8)})}}),
    });

    const auto updated = apply_ok("REMOVE letters[1], letters[2], nested[0], nested[1].inner[0]", item, bindings);
    CHECK(updated.at("letters") == AttributeValue::list({str("a"), str("d")}));
    REQUIRE(updated.at("nested").as_list().size() == 1U);
    CHECK(updated.at("nested").as_list().front()
          == AttributeValue::map({{"inner", AttributeValue::list({num(8)})}}));

    const auto reversed = apply_ok("REMOVE letters[2], letters[0]", item, bindings);
    CHECK(reversed.at("letters") == AttributeValue::list({str("b"), str("d")}));
}

TEST_CASE("ADD increments numbers and unions sets")
{
    const PlaceholderBindings bindings{
        .names = {},
        .values = {{":n", num(10)}, {":tags", AttributeValue::string_set({"b", "c"})}},
    };

    const auto item = apply_ok("ADD count :n, tags :tags, created :n", base_item(), bindings);
    CHECK(item.at("count") == num(15));
    CHECK(item.at("tags") == AttributeValue::string_set({"a", "b", "c"}));
    CHECK(item.at("created") == num(10));
}

TEST_CASE("ADD rejects operands that are not numbers or sets")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":s", str("x")}}};

    const auto result = apply("ADD count :s", base_item(), bindings);
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("operator: ADD, operand type: S"));
    CHECK(result.item == base_item());
}

TEST_CASE("DELETE subtracts set elements and drops empty sets")
{
    const PlaceholderBindings bindings{
        .names = {},
        .values = {{":a", AttributeValue::string_set({"a"})}, {":all", AttributeValue::string_set({"a", "b"})}},
    };

    const auto partial = apply_ok("DELETE tags :a", base_item(), bindings);
    CHECK(partial.at("tags") == AttributeValue::string_set({"b"}));

    const auto emptied = apply_ok("DELETE tags :all", base_item(), bindings);
    CHECK_FALSE(emptied.contains("tags"));

    const auto untouched = apply_ok("DELETE absent :a", base_item(), bindings);
    CHECK(untouched == base_item());
}

TEST_CASE("DELETE requires a set operand")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":n", num(1)}}};

    const auto result = apply("DELETE tags :n", base_item(), bindings);
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("operator: DELETE, operand type: N"));
}

TEST_CASE("Mismatched operand types leave the item untouched")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":one", num(1)}, {":s", str("x")}}};

    const auto arithmetic = apply("SET greeting = :s, pk = pk + :one", base_item(), bindings);
    CHECK(arithmetic.error == Errc::ValidationError);
    CHECK(arithmetic.message == "An operand in the update expression has an incorrect data type");
    CHECK(arithmetic.item == base_item());

    const auto append = apply("SET list = list_append(count, list)", base_item(), bindings);
    CHECK(append.error == Errc::ValidationError);
}

TEST_CASE("Reading a missing attribute on the right-hand side fails")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":one", num(1)}}};

    const auto result = apply("SET total = missing + :one", base_item(), bindings);
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("refers to an attribute that does not exist"));
}

TEST_CASE("Overlapping document paths are rejected")
{
    const PlaceholderBindings bindings{.names = {{"#d", "doc"}}, .values = {{":v", num(1)}}};

    const auto same = apply("SET a = :v REMOVE a", base_item(), bindings);
    CHECK(same.error == Errc::ValidationError);
    CHECK_THAT(same.message, ContainsSubstring("Two document paths overlap"));

    const auto nested = apply("SET doc.inner = :v REMOVE #d", base_item(), bindings);
    CHECK(nested.error == Errc::ValidationError);
    CHECK_THAT(nested.message, ContainsSubstring("path one: [doc, inner], path two: [doc]"));
}

TEST_CASE("Setting below a missing parent is an invalid path")
{
    const PlaceholderBindings bindings{.names = {}, .values = {{":v", num(1)}}};

    const auto result = apply("SET nothing.here = :v", base_item(), bindings);
    CHECK(result.error == Errc::ValidationError);
    CHECK(result.message == "The document path provided in the update expression is invalid for update");
}

TEST_CASE("Undefined placeholders fail before any change")
{
    const PlaceholderBindings bindings{};

    const auto value = apply("SET a = :missing", base_item(), bindings);
    CHECK(value.error == Errc::UnresolvedPlaceholder);
    CHECK_THAT(value.message, ContainsSubstring("attribute value: :missing"));

    const auto name = apply("REMOVE #gone", base_item(), bindings);
    CHECK(name.error == Errc::UnresolvedPlaceholder);
    CHECK_THAT(name.message, ContainsSubstring("attribute name: #gone"));
}
