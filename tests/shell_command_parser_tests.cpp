#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/shell/command_parser.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <string_view>
#include <utility>

using namespace rynamo;
using namespace rynamo::shell;
using Catch::Matchers::ContainsSubstring;

namespace {

ShellCommand parse_ok(std::string_view text)
{
    auto result = parse_command(text);
    INFO((result.diagnostics.empty() ? std::string{} : result.diagnostics.front().message));
    REQUIRE(result.success());
    return std::move(*result.command);
}

expression::ParserDiagnostic parse_fails(std::string_view text)
{
    const auto result = parse_command(text);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.error == Errc::ParseError);
    REQUIRE_FALSE(result.diagnostics.empty());
    return result.diagnostics.front();
}

}  // namespace

TEST_CASE("Table commands parse their key definitions")
{
    const auto create = parse_ok("CREATE TABLE Orders HASH customer S RANGE placed N");
    CHECK(create.kind == CommandKind::CreateTable);
    CHECK(create.table_name == "Orders");
    REQUIRE(create.hash_key.has_value());
    CHECK(create.hash_key->name == "customer");
    CHECK(create.hash_key->type == catalog::ScalarAttributeType::String);
    REQUIRE(create.range_key.has_value());
    CHECK(create.range_key->name == "placed");
    CHECK(create.range_key->type == catalog::ScalarAttributeType::Number);

    const auto hash_only = parse_ok("create table users hash id B;");
    CHECK(hash_only.kind == CommandKind::CreateTable);
    CHECK(hash_only.hash_key->type == catalog::ScalarAttributeType::Binary);
    CHECK_FALSE(hash_only.range_key.has_value());

    CHECK(parse_ok("DESCRIBE TABLE Orders").kind == CommandKind::DescribeTable);
    CHECK(parse_ok("DROP TABLE Orders").kind == CommandKind::DropTable);

    const auto list = parse_ok("LIST TABLES LIMIT 2 FROM alpha");
    CHECK(list.kind == CommandKind::ListTables);
    CHECK(list.limit == 2U);
    CHECK(list.from_table == "alpha");
}

TEST_CASE("Item commands carry literals, expressions and bindings")
{
    const auto put = parse_ok(R"(PUT Orders {customer: S"c1", placed: N"5"} IF 'attribute_not_exists(customer)')");
    CHECK(put.kind == CommandKind::Put);
    CHECK(put.item.at("placed") == AttributeValue::number(Decimal::from_integer(5)));
    CHECK(put.condition == "attribute_not_exists(customer)");

    const auto get = parse_ok(R"(GET Orders {customer: S"c1", placed: N"5"})");
    CHECK(get.kind == CommandKind::Get);
    CHECK(get.item.size() == 2U);

    const auto del = parse_ok(R"(DELETE Orders {customer: S"c1", placed: N"5"} IF '#s = :s' USING {#s: "status", :s: S"open"})");
    CHECK(del.kind == CommandKind::Delete);
    CHECK(del.bindings.names.at("#s") == "status");
    CHECK(del.bindings.values.at(":s") == AttributeValue::string("open"));

    const auto update = parse_ok(
        R"(UPDATE Orders {customer: S"c1", placed: N"5"} 'SET total = total + :n' USING {:n: N"1"} RETURN ALL_NEW)");
    CHECK(update.kind == CommandKind::Update);
    CHECK(update.expression == "SET total = total + :n");
    CHECK(update.return_values == storage::ReturnValues::AllNew);
}

TEST_CASE("Query and scan accept their clauses in any order")
{
    const auto query = parse_ok(
        R"(QUERY Orders 'customer = :c' LIMIT 10 DESC FILTER 'total > :t' USING {:c: S"c1", :t: N"3"} FROM {customer: S"c1", placed: N"2"})");
    CHECK(query.kind == CommandKind::Query);
    CHECK(query.expression == "customer = :c");
    CHECK(query.filter == "total > :t");
    CHECK(query.limit == 10U);
    CHECK_FALSE(query.scan_forward);
    REQUIRE(query.start_key.has_value());
    CHECK(query.start_key->at("placed") == AttributeValue::number(Decimal::from_integer(2)));
    CHECK(query.bindings.values.size() == 2U);

    const auto scan = parse_ok("SCAN Orders");
    CHECK(scan.kind == CommandKind::Scan);
    CHECK(scan.scan_forward);
    CHECK_FALSE(scan.limit.has_value());
}

TEST_CASE("Doubled single quotes stay inside expression text")
{
    const auto put = parse_ok(R"(PUT t {id: S"1"} IF 'note <> :v')");
    CHECK(put.condition == "note <> :v");

    const auto scan = parse_ok("SCAN t FILTER 'it''s = :v' USING {:v: NULL}");
    CHECK(scan.filter == "it's = :v");
}

TEST_CASE("Parse failures point at the offending input")
{
    SECTION("unknown statement")
    {
        const auto diagnostic = parse_fails("SELECT * FROM t");
        CHECK_THAT(diagnostic.message, ContainsSubstring("expected CREATE TABLE"));
        CHECK_THAT(diagnostic.message, ContainsSubstring("near 'SELECT'"));
        CHECK(diagnostic.column == 1U);
        CHECK(diagnostic.fragment == "SELECT");
        CHECK_FALSE(diagnostic.remediation_hints.empty());
    }

    SECTION("bad key type")
    {
        CHECK_THAT(parse_fails("CREATE TABLE t HASH id BOOL").message, ContainsSubstring("expected key type S, N or B"));
    }

    SECTION("missing item")
    {
        CHECK_THAT(parse_fails("PUT t").message, ContainsSubstring("expected item literal at end of input"));
    }

    SECTION("item that is not a map")
    {
        CHECK_THAT(parse_fails(R"(PUT t S"x")").message, ContainsSubstring("expected a map literal for the item"));
    }

    SECTION("unterminated expression")
    {
        CHECK_THAT(parse_fails("SCAN t FILTER 'a = :v").message, ContainsSubstring("expected closing quote"));
    }

    SECTION("trailing input")
    {
        CHECK_THAT(parse_fails("DROP TABLE t extra").message, ContainsSubstring("unexpected trailing input"));
    }

    SECTION("bad return mode")
    {
        CHECK_THAT(parse_fails(R"(UPDATE t {id: S"1"} 'REMOVE a' RETURN EVERYTHING)").message,
                   ContainsSubstring("expected ALL_NEW, ALL_OLD or NONE"));
    }
}

TEST_CASE("Command kinds have stable names")
{
    CHECK(std::string{to_string(CommandKind::Put)} == "put_item");
    CHECK(std::string{to_string(CommandKind::Query)} == "query");
    CHECK(std::string{to_string(CommandKind::DropTable)} == "drop_table");
}
