#include "rynamo/common/error.hpp"
#include "rynamo/expression/grammar.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using namespace rynamo::expression;
using rynamo::Errc;
using Catch::Matchers::ContainsSubstring;

namespace {

std::string describe_condition(const std::string& text)
{
    auto result = parse_condition_expression(text);
    INFO(text << ": " << summarize_diagnostics(result.diagnostics));
    REQUIRE(result.success());
    return describe(*result.condition);
}

std::string describe_update(const std::string& text)
{
    auto result = parse_update_expression(text);
    INFO(text << ": " << summarize_diagnostics(result.diagnostics));
    REQUIRE(result.success());
    return describe(*result.expression);
}

}  // namespace

TEST_CASE("Condition parser builds comparisons")
{
    CHECK(describe_condition("a = :v") == "a = :v");
    CHECK(describe_condition("a<>:v") == "a <> :v");
    CHECK(describe_condition("  price >= :min ") == "price >= :min");
    CHECK(describe_condition("#n < :v") == "#n < :v");
    CHECK(describe_condition("size(tags) > :count") == "size(tags) > :count");
}

TEST_CASE("Condition parser handles nested document paths")
{
    CHECK(describe_condition("info.rating[2].score = :v") == "info.rating[2].score = :v");
    CHECK(describe_condition("#a.#b[0] = :v") == "#a.#b[0] = :v");
}

TEST_CASE("Condition keywords are case insensitive")
{
    CHECK(describe_condition("a between :lo and :hi") == "a BETWEEN :lo AND :hi");
    CHECK(describe_condition("a = :x AnD b = :y") == "(a = :x AND b = :y)");
}

TEST_CASE("AND chains fold from the left")
{
    CHECK(describe_condition("a = :a AND b = :b AND c = :c") == "((a = :a AND b = :b) AND c = :c)");
}

TEST_CASE("Condition parser recognises every function")
{
    CHECK(describe_condition("attribute_exists(a)") == "attribute_exists(a)");
    CHECK(describe_condition("attribute_not_exists(#k)") == "attribute_not_exists(#k)");
    CHECK(describe_condition("attribute_type(a, :t)") == "attribute_type(a, :t)");
    CHECK(describe_condition("begins_with(sk, :prefix)") == "begins_with(sk, :prefix)");
    CHECK(describe_condition("contains(tags, :tag)") == "contains(tags, :tag)");
    CHECK(describe_condition("begins_with ( sk , :p ) AND a = :v") == "(begins_with(sk, :p) AND a = :v)");
}

TEST_CASE("Attribute names that start with a function name stay paths")
{
    CHECK(describe_condition("sizes = :v") == "sizes = :v");
    CHECK(describe_condition("contains_all = :v") == "contains_all = :v");
    CHECK(describe_condition("android = :v AND order = :w") == "(android = :v AND order = :w)");
}

TEST_CASE("Missing operand reports a parse diagnostic")
{
    const auto result = parse_condition_expression("a = ");
    REQUIRE_FALSE(result.success());
    CHECK(result.error == Errc::ParseError);
    REQUIRE(result.diagnostics.size() == 1U);

    const auto& diagnostic = result.diagnostics.front();
    CHECK(diagnostic.severity == ParserSeverity::Error);
    CHECK(diagnostic.message == "Missing operand at end of input");
    CHECK(diagnostic.line == 1U);
    CHECK(diagnostic.column == 5U);
    CHECK(diagnostic.expression == "a =");
    CHECK_FALSE(diagnostic.remediation_hints.empty());
    CHECK(summarize_diagnostics(result.diagnostics) == "Missing operand at end of input (column 5)");
}

TEST_CASE("Trailing input is rejected with its fragment")
{
    const auto result = parse_condition_expression("a = :v extra");
    REQUIRE_FALSE(result.success());
    CHECK(result.error == Errc::ParseError);
    REQUIRE_FALSE(result.diagnostics.empty());
    CHECK(result.diagnostics.front().fragment == "extra");
    CHECK_THAT(result.diagnostics.front().message, ContainsSubstring("unexpected trailing input near 'extra'"));
}

TEST_CASE("Condition parser rejects malformed input")
{
    CHECK(parse_condition_expression("").error == Errc::ParseError);
    CHECK(parse_condition_expression("a").error == Errc::ParseError);
    CHECK(parse_condition_expression("a BETWEEN :lo").error == Errc::ParseError);
    CHECK(parse_condition_expression("begins_with(a, :p").error == Errc::ParseError);
    CHECK(parse_condition_expression("a = :v OR b = :w").error == Errc::ParseError);
    CHECK(parse_condition_expression("a[x] = :v").error == Errc::ParseError);
}

TEST_CASE("Function arity is checked after parsing")
{
    const auto result = parse_condition_expression("attribute_exists(a, b)");
    REQUIRE_FALSE(result.success());
    CHECK(result.error == Errc::TypeMismatch);
    REQUIRE_FALSE(result.diagnostics.empty());
    CHECK(result.diagnostics.front().message
          == "Invalid ConditionExpression: Incorrect number of operands for operator or function; "
             "operator or function: attribute_exists, number of operands: 2");
}

TEST_CASE("Functions reject size() operands and placeholder paths")
{
    const auto sized = parse_condition_expression("begins_with(size(a), :v)");
    CHECK(sized.error == Errc::TypeMismatch);
    REQUIRE_FALSE(sized.diagnostics.empty());
    CHECK_THAT(sized.diagnostics.front().message, ContainsSubstring("operand type: N"));

    const auto value_operand = parse_condition_expression("attribute_exists(:v)");
    CHECK(value_operand.error == Errc::TypeMismatch);
    REQUIRE_FALSE(value_operand.diagnostics.empty());
    CHECK_THAT(value_operand.diagnostics.front().message, ContainsSubstring("requires a document path"));

    const auto type_name = parse_condition_expression("attribute_type(a, b)");
    CHECK(type_name.error == Errc::TypeMismatch);
}

TEST_CASE("Update parser collects every clause")
{
    CHECK(describe_update("SET a = :v, b = b + :one REMOVE c ADD d :n DELETE e :s")
          == "SET a = :v, b = b + :one REMOVE c ADD d :n DELETE e :s");
    CHECK(describe_update("remove c set a = :v") == "SET a = :v REMOVE c");
    CHECK(describe_update("SET counter = counter - :step") == "SET counter = counter - :step");
}

TEST_CASE("Update parser accepts update functions")
{
    CHECK(describe_update("SET a = if_not_exists(a, :zero)") == "SET a = if_not_exists(a, :zero)");
    CHECK(describe_update("SET l = list_append(l, :more)") == "SET l = list_append(l, :more)");
    CHECK(describe_update("SET n = if_not_exists(n, :zero) + :one") == "SET n = if_not_exists(n, :zero) + :one");
}

TEST_CASE("Update clauses may only appear once")
{
    const auto result = parse_update_expression("SET a = :v SET b = :w");
    REQUIRE_FALSE(result.success());
    CHECK(result.error == Errc::ParseError);
    REQUIRE_FALSE(result.diagnostics.empty());
    CHECK_THAT(result.diagnostics.front().message,
               ContainsSubstring("The \"SET\" section can only be used once in an update expression"));
}

TEST_CASE("Update parser rejects malformed clauses")
{
    CHECK(parse_update_expression("").error == Errc::ParseError);
    CHECK(parse_update_expression("SET").error == Errc::ParseError);
    CHECK(parse_update_expression("SET a :v").error == Errc::ParseError);
    CHECK(parse_update_expression("ADD a b").error == Errc::ParseError);
    CHECK(parse_update_expression("UPSERT a = :v").error == Errc::ParseError);
}
