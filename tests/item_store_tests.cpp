#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/common/validation.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/storage/item_store.hpp"
#include "rynamo/storage/key_value.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace rynamo;
using namespace rynamo::storage;
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

catalog::TableSchema composite_schema()
{
    catalog::TableSchema schema{};
    schema.table_name = "Events";
    schema.partition_key = {"pk", catalog::ScalarAttributeType::String};
    schema.sort_key = catalog::KeyAttribute{"sk", catalog::ScalarAttributeType::Number};
    schema.attribute_definitions = {{"pk", catalog::ScalarAttributeType::String},
                                    {"sk", catalog::ScalarAttributeType::Number}};
    return schema;
}

catalog::TableSchema simple_schema()
{
    catalog::TableSchema schema{};
    schema.table_name = "Users";
    schema.partition_key = {"id", catalog::ScalarAttributeType::String};
    schema.attribute_definitions = {{"id", catalog::ScalarAttributeType::String}};
    return schema;
}

Item event(const std::string& pk, std::int64_t sk, const std::string& payload)
{
    return Item{{"pk", str(pk)}, {"sk", num(sk)}, {"payload", str(payload)}};
}

Item event_key(const std::string& pk, std::int64_t sk)
{
    return Item{{"pk", str(pk)}, {"sk", num(sk)}};
}

}  // namespace

TEST_CASE("KeyValue orders numbers numerically and strings bytewise")
{
    const auto two = KeyValue::from_attribute(num(2));
    const auto ten = KeyValue::from_attribute(num(10));
    REQUIRE(two.has_value());
    REQUIRE(ten.has_value());
    CHECK(*two < *ten);

    const auto upper = KeyValue::from_attribute(str("Z"));
    const auto lower = KeyValue::from_attribute(str("a"));
    const auto high_byte = KeyValue::from_attribute(str("\xc3\xa9"));
    REQUIRE(upper.has_value());
    REQUIRE(lower.has_value());
    REQUIRE(high_byte.has_value());
    CHECK(*upper < *lower);
    CHECK(*lower < *high_byte);

    CHECK_FALSE(KeyValue::from_attribute(AttributeValue::boolean(true)).has_value());
    CHECK(ten->to_attribute() == num(10));
}

TEST_CASE("put_item then get_item returns the stored item")
{
    ItemStore store{composite_schema()};

    REQUIRE(store.put_item(event("a", 1, "first")).success());
    const auto fetched = store.get_item(event_key("a", 1));
    REQUIRE(fetched.success());
    REQUIRE(fetched.value->has_value());
    CHECK(**fetched.value == event("a", 1, "first"));

    const auto missing = store.get_item(event_key("a", 2));
    REQUIRE(missing.success());
    CHECK_FALSE(missing.value->has_value());

    const auto statistics = store.statistics();
    CHECK(statistics.item_count == 1U);
    CHECK(statistics.size_bytes == item_size(event("a", 1, "first")));
}

TEST_CASE("put_item replaces and can return the old item")
{
    ItemStore store{composite_schema()};
    REQUIRE(store.put_item(event("a", 1, "first")).success());

    WriteOptions options{};
    options.return_values = ReturnValues::AllOld;
    const auto replaced = store.put_item(event("a", 1, "second"), options);
    REQUIRE(replaced.success());
    REQUIRE(replaced.value->has_value());
    CHECK((*replaced.value)->at("payload") == str("first"));

    CHECK(store.statistics().item_count == 1U);
    CHECK(store.statistics().size_bytes == item_size(event("a", 1, "second")));
}

TEST_CASE("Putting the same item twice leaves the store unchanged")
{
    ItemStore store{composite_schema()};
    const auto item = event("a", 1, "first");

    REQUIRE(store.put_item(item).success());
    const auto before = store.statistics();
    REQUIRE(store.put_item(item).success());
    const auto after = store.statistics();

    const auto fetched = store.get_item(event_key("a", 1));
    REQUIRE(fetched.success());
    REQUIRE(fetched.value->has_value());
    CHECK(**fetched.value == item);

    CHECK(after.item_count == before.item_count);
    CHECK(after.size_bytes == before.size_bytes);
    CHECK(after.item_count == 1U);
}

TEST_CASE("Key validation rejects malformed keys")
{
    ItemStore store{composite_schema()};

    SECTION("missing sort key")
    {
        const auto result = store.put_item(Item{{"pk", str("a")}});
        CHECK(result.error == Errc::ValidationError);
        CHECK(result.message == "One or more parameter values were invalid: Missing the key sk in the item");
    }

    SECTION("wrong key type")
    {
        const auto result = store.put_item(Item{{"pk", num(1)}, {"sk", num(1)}});
        CHECK(result.error == Errc::ValidationError);
        CHECK_THAT(result.message, ContainsSubstring("Type mismatch for key pk expected: S actual: N"));
    }

    SECTION("empty string key")
    {
        const auto result = store.put_item(Item{{"pk", str("")}, {"sk", num(1)}});
        CHECK(result.error == Errc::ValidationError);
        CHECK_THAT(result.message, ContainsSubstring("cannot contain an empty string value. Key: pk"));
    }

    SECTION("key with extra attributes")
    {
        const auto result = store.get_item(event("a", 1, "x"));
        CHECK(result.error == Errc::ValidationError);
        CHECK(result.message == "The provided key element does not match the schema");
    }

    SECTION("key missing an attribute")
    {
        CHECK(store.delete_item(Item{{"pk", str("a")}}).error == Errc::ValidationError);
    }

    CHECK(store.statistics().item_count == 0U);
}

TEST_CASE("Items must pass value validation")
{
    ItemStore store{simple_schema()};

    auto empty_set = Item{{"id", str("u1")}, {"tags", AttributeValue::string_set({})}};
    const auto result = store.put_item(std::move(empty_set));
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("string set  may not be empty"));

    auto oversized = Item{{"id", str("u1")}, {"blob", AttributeValue::binary(std::string(kMaxItemSizeBytes, 'x'))}};
    const auto too_big = store.put_item(std::move(oversized));
    CHECK(too_big.error == Errc::ValidationError);
    CHECK(too_big.message == "Item size has exceeded the maximum allowed size");
}

TEST_CASE("Conditional put fails without writing")
{
    ItemStore store{simple_schema()};
    REQUIRE(store.put_item(Item{{"id", str("u1")}, {"version", num(1)}}).success());

    auto parsed = expression::parse_condition_expression("attribute_not_exists(id)");
    REQUIRE(parsed.success());
    WriteOptions options{};
    options.condition = parsed.condition;

    const auto result = store.put_item(Item{{"id", str("u1")}, {"version", num(2)}}, options);
    CHECK(result.error == Errc::ConditionalCheckFailed);
    CHECK(result.message == "The conditional request failed");

    const auto current = store.get_item(Item{{"id", str("u1")}});
    REQUIRE(current.success());
    CHECK((*current.value)->at("version") == num(1));
}

TEST_CASE("Conditions see an empty item when the key is absent")
{
    ItemStore store{simple_schema()};

    auto parsed = expression::parse_condition_expression("version = :v");
    REQUIRE(parsed.success());
    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":v", num(1)}}};
    WriteOptions options{};
    options.condition = parsed.condition;
    options.bindings = &bindings;

    CHECK(store.delete_item(Item{{"id", str("ghost")}}, options).error == Errc::ConditionalCheckFailed);
}

TEST_CASE("Condition evaluation errors propagate")
{
    ItemStore store{simple_schema()};

    auto parsed = expression::parse_condition_expression("version = :missing");
    REQUIRE(parsed.success());
    WriteOptions options{};
    options.condition = parsed.condition;

    const auto result = store.put_item(Item{{"id", str("u1")}}, options);
    CHECK(result.error == Errc::UnresolvedPlaceholder);
    CHECK(store.statistics().item_count == 0U);
}

TEST_CASE("delete_item removes the item and returns it on request")
{
    ItemStore store{composite_schema()};
    REQUIRE(store.put_item(event("a", 1, "first")).success());

    WriteOptions options{};
    options.return_values = ReturnValues::AllOld;
    const auto deleted = store.delete_item(event_key("a", 1), options);
    REQUIRE(deleted.success());
    REQUIRE(deleted.value->has_value());
    CHECK(**deleted.value == event("a", 1, "first"));
    CHECK(store.statistics().item_count == 0U);
    CHECK(store.statistics().size_bytes == 0U);

    const auto again = store.delete_item(event_key("a", 1), options);
    REQUIRE(again.success());
    CHECK_FALSE(again.value->has_value());
}

TEST_CASE("update_item creates missing items from the key")
{
    ItemStore store{composite_schema()};

    auto parsed = expression::parse_update_expression("SET payload = :p");
    REQUIRE(parsed.success());
    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":p", str("made")}}};
    WriteOptions options{};
    options.bindings = &bindings;
    options.return_values = ReturnValues::AllNew;

    const auto updated = store.update_item(event_key("b", 7), parsed.expression, options);
    REQUIRE(updated.success());
    REQUIRE(updated.value->has_value());
    CHECK(**updated.value == event("b", 7, "made"));

    const auto without_expression = store.update_item(event_key("c", 1), nullptr);
    REQUIRE(without_expression.success());
    const auto stored = store.get_item(event_key("c", 1));
    REQUIRE(stored.success());
    CHECK(**stored.value == event_key("c", 1));
}

TEST_CASE("update_item returns the old image on request")
{
    ItemStore store{composite_schema()};
    REQUIRE(store.put_item(event("a", 1, "first")).success());

    auto parsed = expression::parse_update_expression("REMOVE payload");
    REQUIRE(parsed.success());
    WriteOptions options{};
    options.return_values = ReturnValues::AllOld;

    const auto updated = store.update_item(event_key("a", 1), parsed.expression, options);
    REQUIRE(updated.success());
    REQUIRE(updated.value->has_value());
    CHECK(**updated.value == event("a", 1, "first"));
    CHECK(**store.get_item(event_key("a", 1)).value == event_key("a", 1));
}

TEST_CASE("update_item cannot modify key attributes")
{
    ItemStore store{composite_schema()};
    REQUIRE(store.put_item(event("a", 1, "first")).success());

    auto parsed = expression::parse_update_expression("SET pk = :other");
    REQUIRE(parsed.success());
    const expression::PlaceholderBindings bindings{.names = {}, .values = {{":other", str("b")}}};
    WriteOptions options{};
    options.bindings = &bindings;

    const auto result = store.update_item(event_key("a", 1), parsed.expression, options);
    CHECK(result.error == Errc::ValidationError);
    CHECK_THAT(result.message, ContainsSubstring("Cannot update attribute pk. This attribute is part of the key"));
    CHECK(**store.get_item(event_key("a", 1)).value == event("a", 1, "first"));
}

TEST_CASE("Partitions keep items ordered by sort key")
{
    ItemStore store{composite_schema()};
    for (const std::int64_t sk : {30, 4, 100, -2}) {
        REQUIRE(store.put_item(event("a", sk, "x")).success());
    }
    REQUIRE(store.put_item(event("b", 1, "x")).success());

    const auto view = store.read();
    REQUIRE(view.partitions().size() == 2U);
    const auto& partition = view.partitions().begin()->second;

    std::vector<std::string> order;
    for (const auto& [sort, item] : partition) {
        order.push_back(item.at("sk").as_number().to_string());
    }
    CHECK(order == std::vector<std::string>{"-2", "4", "30", "100"});
}

TEST_CASE("Concurrent conditional puts create an item exactly once")
{
    ItemStore store{simple_schema()};
    auto parsed = expression::parse_condition_expression("attribute_not_exists(id)");
    REQUIRE(parsed.success());

    constexpr int kWriters = 8;
    std::atomic<int> successes{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> writers;
    writers.reserve(kWriters);
    for (int writer = 0; writer < kWriters; ++writer) {
        writers.emplace_back([&, writer] {
            WriteOptions options{};
            options.condition = parsed.condition;
            const auto result = store.put_item(Item{{"id", str("shared")}, {"writer", num(writer)}}, options);
            if (result.success()) {
                successes.fetch_add(1);
            } else if (result.error == Errc::ConditionalCheckFailed) {
                conflicts.fetch_add(1);
            }
        });
    }
    for (auto& thread : writers) {
        thread.join();
    }

    CHECK(successes.load() == 1);
    CHECK(conflicts.load() == kWriters - 1);
    CHECK(store.statistics().item_count == 1U);
}
