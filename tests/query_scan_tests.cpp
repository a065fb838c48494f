#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/executor/executor_telemetry.hpp"
#include "rynamo/executor/key_condition.hpp"
#include "rynamo/executor/query_executor.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/storage/item_store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace rynamo;
using namespace rynamo::executor;
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

catalog::TableSchema orders_schema()
{
    catalog::TableSchema schema{};
    schema.table_name = "Orders";
    schema.partition_key = {"customer", catalog::ScalarAttributeType::String};
    schema.sort_key = catalog::KeyAttribute{"order_id", catalog::ScalarAttributeType::String};
    return schema;
}

void put_order(storage::ItemStore& store, const std::string& customer, const std::string& order_id, std::int64_t total)
{
    REQUIRE(store.put_item(Item{{"customer", str(customer)}, {"order_id", str(order_id)}, {"total", num(total)}}).success());
}

KeyConditionPlan plan_for(const storage::ItemStore& store,
                          const std::string& text,
                          const expression::PlaceholderBindings& bindings)
{
    auto parsed = expression::parse_condition_expression(text);
    REQUIRE(parsed.success());
    KeyConditionPlan plan{};
    std::string message;
    const auto ec = plan_key_condition(*parsed.condition, store.schema(), bindings, plan, message);
    INFO(message);
    REQUIRE_FALSE(ec);
    return plan;
}

std::vector<std::string> order_ids(const QueryPage& page)
{
    std::vector<std::string> ids;
    for (const auto& item : page.items) {
        ids.push_back(item.at("order_id").as_string());
    }
    return ids;
}

storage::PrimaryKey key_of(const storage::ItemStore& store, const Item& key_attributes)
{
    storage::PrimaryKey key{};
    std::string message;
    REQUIRE_FALSE(store.parse_key(key_attributes, key, message));
    return key;
}

}  // namespace

TEST_CASE("Query returns a partition in sort-key order")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* id : {"o3", "o1", "o5", "o2", "o4"}) {
        put_order(store, "alice", id, 10);
    }
    put_order(store, "bob", "o1", 99);

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);

    const auto forward = run_query(store, plan, PageOptions{.bindings = &bindings});
    REQUIRE(forward.success());
    CHECK(order_ids(*forward.value) == std::vector<std::string>{"o1", "o2", "o3", "o4", "o5"});
    CHECK(forward.value->count == 5U);
    CHECK(forward.value->scanned_count == 5U);
    CHECK_FALSE(forward.value->last_evaluated_key.has_value());

    const auto backward = run_query(store, plan, PageOptions{.bindings = &bindings, .scan_forward = false});
    REQUIRE(backward.success());
    CHECK(order_ids(*backward.value) == std::vector<std::string>{"o5", "o4", "o3", "o2", "o1"});
}

TEST_CASE("Query pages with a limit and resumes from last_evaluated_key")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* id : {"o1", "o2", "o3", "o4", "o5"}) {
        put_order(store, "alice", id, 10);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);

    std::vector<std::vector<std::string>> pages;
    PageOptions options{.bindings = &bindings, .limit = 2U};
    for (int guard = 0; guard < 10; ++guard) {
        const auto page = run_query(store, plan, options);
        REQUIRE(page.success());
        pages.push_back(order_ids(*page.value));
        if (!page.value->last_evaluated_key) {
            break;
        }
        CHECK(page.value->last_evaluated_key->size() == 2U);
        options.exclusive_start_key = key_of(store, *page.value->last_evaluated_key);
    }

    REQUIRE(pages.size() == 3U);
    CHECK(pages[0] == std::vector<std::string>{"o1", "o2"});
    CHECK(pages[1] == std::vector<std::string>{"o3", "o4"});
    CHECK(pages[2] == std::vector<std::string>{"o5"});
}

TEST_CASE("Backward pagination walks the partition in reverse")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* id : {"o1", "o2", "o3"}) {
        put_order(store, "alice", id, 10);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);

    PageOptions options{.bindings = &bindings, .scan_forward = false, .limit = 2U};
    const auto first = run_query(store, plan, options);
    REQUIRE(first.success());
    CHECK(order_ids(*first.value) == std::vector<std::string>{"o3", "o2"});
    REQUIRE(first.value->last_evaluated_key.has_value());

    options.exclusive_start_key = key_of(store, *first.value->last_evaluated_key);
    const auto second = run_query(store, plan, options);
    REQUIRE(second.success());
    CHECK(order_ids(*second.value) == std::vector<std::string>{"o1"});
    CHECK_FALSE(second.value->last_evaluated_key.has_value());
}

TEST_CASE("Filters reduce count but not scanned_count")
{
    storage::ItemStore store{orders_schema()};
    for (std::int64_t index = 0; index < 10; ++index) {
        put_order(store, "alice", "o" + std::to_string(index), index);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}, {":min", num(6)}}};
    const auto plan = plan_for(store, "customer = :c", bindings);
    auto filter = expression::parse_condition_expression("total >= :min");
    REQUIRE(filter.success());

    const auto page = run_query(store, plan, PageOptions{.filter = filter.condition, .bindings = &bindings});
    REQUIRE(page.success());
    CHECK(page.value->count == 4U);
    CHECK(page.value->scanned_count == 10U);
    CHECK(page.value->items.size() == 4U);
}

TEST_CASE("Limit counts items read before the filter")
{
    storage::ItemStore store{orders_schema()};
    for (std::int64_t index = 0; index < 6; ++index) {
        put_order(store, "alice", "o" + std::to_string(index), index);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}, {":min", num(4)}}};
    const auto plan = plan_for(store, "customer = :c", bindings);
    auto filter = expression::parse_condition_expression("total >= :min");
    REQUIRE(filter.success());

    const auto page = run_query(store, plan, PageOptions{.filter = filter.condition, .bindings = &bindings, .limit = 3U});
    REQUIRE(page.success());
    CHECK(page.value->count == 0U);
    CHECK(page.value->scanned_count == 3U);
    REQUIRE(page.value->last_evaluated_key.has_value());
    CHECK(page.value->last_evaluated_key->at("order_id") == str("o2"));
}

TEST_CASE("begins_with narrows the sort-key range")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* id : {"2023-12-31", "2024-01-05", "2024-02-10", "2024-12-31", "2025-01-01"}) {
        put_order(store, "alice", id, 1);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}, {":y", str("2024-")}}};
    const auto plan = plan_for(store, "customer = :c AND begins_with(order_id, :y)", bindings);

    const auto page = run_query(store, plan, PageOptions{.bindings = &bindings});
    REQUIRE(page.success());
    CHECK(order_ids(*page.value) == std::vector<std::string>{"2024-01-05", "2024-02-10", "2024-12-31"});
    CHECK(page.value->scanned_count == 3U);
}

TEST_CASE("Page byte budget truncates a page")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* id : {"o1", "o2", "o3", "o4"}) {
        put_order(store, "alice", id, 1);
    }

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);
    const auto one_item = item_size(Item{{"customer", str("alice")}, {"order_id", str("o1")}, {"total", num(1)}});

    const auto page = run_query(store, plan, PageOptions{.bindings = &bindings, .max_page_bytes = one_item * 2U});
    REQUIRE(page.success());
    CHECK(order_ids(*page.value) == std::vector<std::string>{"o1", "o2"});
    REQUIRE(page.value->last_evaluated_key.has_value());
    CHECK(page.value->last_evaluated_key->at("order_id") == str("o2"));
}

TEST_CASE("Count-only pages and projections")
{
    storage::ItemStore store{orders_schema()};
    put_order(store, "alice", "o1", 5);
    put_order(store, "alice", "o2", 6);

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);

    const auto counted = run_query(store, plan, PageOptions{.bindings = &bindings, .count_only = true});
    REQUIRE(counted.success());
    CHECK(counted.value->count == 2U);
    CHECK(counted.value->items.empty());

    const auto projected =
        run_query(store, plan, PageOptions{.bindings = &bindings, .attributes_to_get = {"total", "missing"}});
    REQUIRE(projected.success());
    REQUIRE(projected.value->items.size() == 2U);
    CHECK(projected.value->items.front() == Item{{"total", num(5)}});
}

TEST_CASE("Query rejects a zero limit and a foreign start key")
{
    storage::ItemStore store{orders_schema()};
    put_order(store, "alice", "o1", 5);
    put_order(store, "bob", "o1", 5);

    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":c", str("alice")}}};
    const auto plan = plan_for(store, "customer = :c", bindings);

    const auto zero = run_query(store, plan, PageOptions{.bindings = &bindings, .limit = 0U});
    CHECK(zero.error == Errc::ValidationError);
    CHECK_THAT(zero.message, ContainsSubstring("at 'limit'"));

    PageOptions foreign{.bindings = &bindings};
    foreign.exclusive_start_key = key_of(store, Item{{"customer", str("bob")}, {"order_id", str("o1")}});
    const auto result = run_query(store, plan, foreign);
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("The provided starting key is invalid"));
}

TEST_CASE("Filter placeholders must be bound")
{
    storage::ItemStore store{orders_schema()};
    put_order(store, "alice", "o1", 5);

    auto filter = expression::parse_condition_expression("total > :absent");
    REQUIRE(filter.success());
    const expression::PlaceholderBindings bindings{};

    const auto page = run_scan(store, PageOptions{.filter = filter.condition, .bindings = &bindings});
    CHECK(page.error == Errc::UnresolvedPlaceholder);
}

TEST_CASE("Scan visits every partition and paginates across them")
{
    storage::ItemStore store{orders_schema()};
    for (const auto* customer : {"carol", "alice", "bob"}) {
        put_order(store, customer, "o1", 1);
        put_order(store, customer, "o2", 2);
    }

    const auto all = run_scan(store, PageOptions{});
    REQUIRE(all.success());
    CHECK(all.value->count == 6U);
    CHECK_FALSE(all.value->last_evaluated_key.has_value());

    std::vector<std::string> seen;
    PageOptions options{.limit = 4U};
    for (int guard = 0; guard < 5; ++guard) {
        const auto page = run_scan(store, options);
        REQUIRE(page.success());
        for (const auto& item : page.value->items) {
            seen.push_back(item.at("customer").as_string() + "/" + item.at("order_id").as_string());
        }
        if (!page.value->last_evaluated_key) {
            break;
        }
        options.exclusive_start_key = key_of(store, *page.value->last_evaluated_key);
    }
    CHECK(seen == std::vector<std::string>{"alice/o1", "alice/o2", "bob/o1", "bob/o2", "carol/o1", "carol/o2"});
}

TEST_CASE("Scan always runs forward and feeds telemetry")
{
    storage::ItemStore store{orders_schema()};
    put_order(store, "alice", "o1", 1);
    put_order(store, "alice", "o2", 2);
    ExecutorTelemetry telemetry;

    const auto page = run_scan(store, PageOptions{.scan_forward = false, .telemetry = &telemetry});
    REQUIRE(page.success());
    CHECK(order_ids(*page.value) == std::vector<std::string>{"o1", "o2"});
    CHECK(telemetry.snapshot().range_scan_rows_read == 2U);
}

TEST_CASE("project_item keeps only the named attributes")
{
    const Item item{{"a", num(1)}, {"b", num(2)}, {"c", num(3)}};
    CHECK(project_item(item, {}) == item);
    CHECK(project_item(item, {"c", "a", "zzz"}) == Item{{"a", num(1)}, {"c", num(3)}});
}
