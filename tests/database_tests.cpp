#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/database/database.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace rynamo;
using namespace rynamo::database;
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

catalog::CreateTableRequest thread_table()
{
    catalog::CreateTableRequest request{};
    request.table_name = "Threads";
    request.attribute_definitions = {{"forum", catalog::ScalarAttributeType::String},
                                     {"subject", catalog::ScalarAttributeType::String}};
    request.key_schema = {{"forum", catalog::KeyType::Hash}, {"subject", catalog::KeyType::Range}};
    return request;
}

Item thread_item(const std::string& forum, const std::string& subject, std::int64_t views)
{
    return Item{{"forum", str(forum)}, {"subject", str(subject)}, {"views", num(views)}};
}

Item thread_key(const std::string& forum, const std::string& subject)
{
    return Item{{"forum", str(forum)}, {"subject", str(subject)}};
}

struct Fixture {
    Fixture()
    {
        REQUIRE(db.create_table(thread_table()).success());
    }

    void put(const Item& item)
    {
        REQUIRE(db.put_item(PutItemRequest{.table_name = "Threads", .item = item}).success());
    }

    Database db{Database::Config{.operation_logger = [this](const OperationTrace& trace) { traces.push_back(trace); }}};
    std::vector<OperationTrace> traces{};
};

}  // namespace

TEST_CASE_METHOD(Fixture, "Items round-trip through put and get")
{
    put(thread_item("S3", "Tuning", 10));

    const auto found = db.get_item(GetItemRequest{.table_name = "Threads", .key = thread_key("S3", "Tuning")});
    REQUIRE(found.success());
    REQUIRE(found.value->item.has_value());
    CHECK(*found.value->item == thread_item("S3", "Tuning", 10));

    const auto projected = db.get_item(
        GetItemRequest{.table_name = "Threads", .key = thread_key("S3", "Tuning"), .attributes_to_get = {"views"}});
    REQUIRE(projected.success());
    CHECK(*projected.value->item == Item{{"views", num(10)}});

    const auto missing = db.get_item(GetItemRequest{.table_name = "Threads", .key = thread_key("S3", "Other")});
    REQUIRE(missing.success());
    CHECK_FALSE(missing.value->item.has_value());
}

TEST_CASE_METHOD(Fixture, "Unknown tables report ResourceNotFound")
{
    const auto result = db.put_item(PutItemRequest{.table_name = "Nope", .item = thread_item("a", "b", 1)});
    CHECK(result.error == Errc::ResourceNotFound);
    CHECK(std::string{exception_name(result.error)} == "ResourceNotFoundException");
    CHECK(db.scan(ScanRequest{.table_name = "Nope"}).error == Errc::ResourceNotFound);
}

TEST_CASE_METHOD(Fixture, "Conditional writes respect their expressions")
{
    put(thread_item("S3", "Tuning", 10));

    PutItemRequest guarded{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 11),
        .condition_expression = "attribute_not_exists(forum)",
    };
    const auto refused = db.put_item(guarded);
    CHECK(refused.error == Errc::ConditionalCheckFailed);
    CHECK(std::string{exception_name(refused.error)} == "ConditionalCheckFailedException");

    DeleteItemRequest conditional_delete{
        .table_name = "Threads",
        .key = thread_key("S3", "Tuning"),
        .condition_expression = "#v > :limit",
        .bindings = {.names = {{"#v", "views"}}, .values = {{":limit", num(5)}}},
        .return_values = ReturnValues::AllOld,
    };
    const auto deleted = db.delete_item(conditional_delete);
    REQUIRE(deleted.success());
    REQUIRE(deleted.value->attributes.has_value());
    CHECK(deleted.value->attributes->at("views") == num(10));

    const auto telemetry = db.telemetry().snapshot();
    CHECK(telemetry.failures.conditional_check_failures == 1U);
    CHECK(telemetry.operation(Operation::PutItem).failures == 1U);
}

TEST_CASE_METHOD(Fixture, "Every binding must be used by an expression")
{
    PutItemRequest request{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 1),
        .condition_expression = "attribute_not_exists(forum)",
        .bindings = {.names = {{"#unused", "x"}}, .values = {}},
    };
    const auto names = db.put_item(request);
    CHECK(names.error == Errc::ValidationError);
    CHECK(names.message == "Value provided in ExpressionAttributeNames unused in expressions: keys: {#unused}");

    request.bindings = {.names = {}, .values = {{":a", num(1)}, {":b", num(2)}}};
    const auto values = db.put_item(request);
    CHECK(values.error == Errc::ValidationError);
    CHECK(values.message == "Value provided in ExpressionAttributeValues unused in expressions: keys: {:a, :b}");

    request.condition_expression.reset();
    request.bindings = {.names = {}, .values = {{":a", num(1)}}};
    CHECK(db.put_item(request).error == Errc::ValidationError);
}

TEST_CASE_METHOD(Fixture, "Undefined placeholders and bad syntax are rejected")
{
    const auto undefined = db.put_item(PutItemRequest{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 1),
        .condition_expression = "views = :missing",
    });
    CHECK(undefined.error == Errc::UnresolvedPlaceholder);
    CHECK(std::string{exception_name(undefined.error)} == "ValidationException");

    const auto syntax = db.put_item(PutItemRequest{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 1),
        .condition_expression = "views = ",
    });
    CHECK(syntax.error == Errc::ParseError);
    CHECK_THAT(syntax.message, ContainsSubstring("Invalid ConditionExpression: Missing operand"));

    const auto empty = db.put_item(PutItemRequest{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 1),
        .condition_expression = "",
    });
    CHECK(empty.error == Errc::ValidationError);
    CHECK_THAT(empty.message, ContainsSubstring("The expression can not be empty"));
}

TEST_CASE_METHOD(Fixture, "ReturnValues ALL_NEW is limited to UpdateItem")
{
    const auto put = db.put_item(PutItemRequest{
        .table_name = "Threads",
        .item = thread_item("S3", "Tuning", 1),
        .return_values = ReturnValues::AllNew,
    });
    CHECK(put.error == Errc::ValidationError);
    CHECK(put.message == "ReturnValues can only be ALL_OLD or NONE");

    const auto del = db.delete_item(DeleteItemRequest{
        .table_name = "Threads",
        .key = thread_key("S3", "Tuning"),
        .return_values = ReturnValues::AllNew,
    });
    CHECK(del.error == Errc::ValidationError);
}

TEST_CASE_METHOD(Fixture, "UpdateItem applies expressions and returns images")
{
    put(thread_item("S3", "Tuning", 10));

    UpdateItemRequest increment{
        .table_name = "Threads",
        .key = thread_key("S3", "Tuning"),
        .update_expression = "SET views = views + :one, tags = :tags",
        .condition_expression = "views >= :min",
        .bindings = {.names = {},
                     .values = {{":one", num(1)}, {":min", num(10)}, {":tags", AttributeValue::string_set({"perf"})}}},
        .return_values = ReturnValues::AllNew,
    };
    const auto updated = db.update_item(increment);
    REQUIRE(updated.success());
    REQUIRE(updated.value->attributes.has_value());
    CHECK(updated.value->attributes->at("views") == num(11));
    CHECK(updated.value->attributes->at("tags") == AttributeValue::string_set({"perf"}));

    increment.return_values = ReturnValues::AllOld;
    const auto again = db.update_item(increment);
    REQUIRE(again.success());
    CHECK(again.value->attributes->at("views") == num(11));

    increment.return_values = ReturnValues::None;
    const auto quiet = db.update_item(increment);
    REQUIRE(quiet.success());
    CHECK_FALSE(quiet.value->attributes.has_value());
}

TEST_CASE_METHOD(Fixture, "UpdateItem without an expression creates a key-only item")
{
    const auto created = db.update_item(UpdateItemRequest{.table_name = "Threads", .key = thread_key("S9", "New")});
    REQUIRE(created.success());

    const auto found = db.get_item(GetItemRequest{.table_name = "Threads", .key = thread_key("S9", "New")});
    REQUIRE(found.success());
    CHECK(*found.value->item == thread_key("S9", "New"));
}

TEST_CASE_METHOD(Fixture, "Query plans keys, filters and pages")
{
    for (int index = 1; index <= 5; ++index) {
        put(thread_item("S3", "topic-" + std::to_string(index), index));
    }
    put(thread_item("EC2", "topic-1", 100));

    QueryRequest request{
        .table_name = "Threads",
        .key_condition_expression = "forum = :f AND begins_with(subject, :p)",
        .filter_expression = "#v > :min",
        .bindings = {.names = {{"#v", "views"}}, .values = {{":f", str("S3")}, {":p", str("topic-")}, {":min", num(2)}}},
        .limit = 4U,
    };
    const auto first = db.query(request);
    REQUIRE(first.success());
    CHECK(first.value->count == 2U);
    CHECK(first.value->scanned_count == 4U);
    REQUIRE(first.value->last_evaluated_key.has_value());
    CHECK(*first.value->last_evaluated_key == thread_key("S3", "topic-4"));

    request.exclusive_start_key = first.value->last_evaluated_key;
    const auto second = db.query(request);
    REQUIRE(second.success());
    CHECK(second.value->count == 1U);
    CHECK(second.value->items.front().at("views") == num(5));
    CHECK_FALSE(second.value->last_evaluated_key.has_value());
}

TEST_CASE_METHOD(Fixture, "Query validates its request")
{
    SECTION("missing key condition")
    {
        const auto result = db.query(QueryRequest{.table_name = "Threads"});
        CHECK(result.error == Errc::ValidationError);
        CHECK_THAT(result.message, ContainsSubstring("KeyConditionExpression parameter must be specified"));
    }

    SECTION("filter on a key attribute")
    {
        const auto result = db.query(QueryRequest{
            .table_name = "Threads",
            .key_condition_expression = "forum = :f",
            .filter_expression = "subject = :s",
            .bindings = {.names = {}, .values = {{":f", str("S3")}, {":s", str("x")}}},
        });
        CHECK(result.error == Errc::ValidationError);
        CHECK(result.message
              == "Filter Expression can only contain non-primary key attributes: Primary key attribute: subject");
    }

    SECTION("count with projection")
    {
        const auto result = db.query(QueryRequest{
            .table_name = "Threads",
            .key_condition_expression = "forum = :f",
            .bindings = {.names = {}, .values = {{":f", str("S3")}}},
            .attributes_to_get = {"views"},
            .count_only = true,
        });
        CHECK(result.error == Errc::ValidationError);
    }

    SECTION("malformed start key")
    {
        const auto result = db.query(QueryRequest{
            .table_name = "Threads",
            .key_condition_expression = "forum = :f",
            .bindings = {.names = {}, .values = {{":f", str("S3")}}},
            .exclusive_start_key = Item{{"forum", str("S3")}},
        });
        CHECK(result.error == Errc::ValidationError);
        CHECK_THAT(result.message, ContainsSubstring("The provided starting key is invalid"));
    }
}

TEST_CASE_METHOD(Fixture, "Scan counts scanned and returned items")
{
    for (int index = 0; index < 10; ++index) {
        put(thread_item("F" + std::to_string(index), "s", index));
    }

    const auto result = db.scan(ScanRequest{
        .table_name = "Threads",
        .filter_expression = "views >= :six",
        .bindings = {.names = {}, .values = {{":six", num(6)}}},
    });
    REQUIRE(result.success());
    CHECK(result.value->count == 4U);
    CHECK(result.value->scanned_count == 10U);

    const auto counted = db.scan(ScanRequest{.table_name = "Threads", .count_only = true});
    REQUIRE(counted.success());
    CHECK(counted.value->count == 10U);
    CHECK(counted.value->items.empty());
}

TEST_CASE("Pages stop at the configured byte budget")
{
    Database db{Database::Config{.max_page_bytes = 64U}};
    REQUIRE(db.create_table(thread_table()).success());
    for (int index = 0; index < 4; ++index) {
        const auto item = Item{{"forum", str("F")}, {"subject", str("s" + std::to_string(index))}, {"body", str(std::string(40, 'x'))}};
        REQUIRE(db.put_item(PutItemRequest{.table_name = "Threads", .item = item}).success());
    }

    const auto page = db.scan(ScanRequest{.table_name = "Threads"});
    REQUIRE(page.success());
    CHECK(page.value->count == 2U);
    REQUIRE(page.value->last_evaluated_key.has_value());
    CHECK(*page.value->last_evaluated_key == thread_key("F", "s1"));
}

TEST_CASE_METHOD(Fixture, "BatchWriteItem writes and reports unknown tables")
{
    put(thread_item("S3", "old", 1));

    BatchWriteItemRequest request{};
    request.request_items["Threads"] = {
        WriteRequest{.put_item = thread_item("S3", "a", 1)},
        WriteRequest{.put_item = thread_item("S3", "b", 2)},
        WriteRequest{.delete_key = thread_key("S3", "old")},
    };
    request.request_items["Missing"] = {WriteRequest{.put_item = thread_item("x", "y", 1)}};

    const auto result = db.batch_write_item(request);
    REQUIRE(result.success());
    REQUIRE(result.value->unprocessed_items.size() == 1U);
    CHECK(result.value->unprocessed_items.begin()->first == "Missing");

    const auto scan = db.scan(ScanRequest{.table_name = "Threads"});
    REQUIRE(scan.success());
    CHECK(scan.value->count == 2U);
}

TEST_CASE_METHOD(Fixture, "BatchWriteItem validates every request before writing")
{
    BatchWriteItemRequest duplicates{};
    duplicates.request_items["Threads"] = {
        WriteRequest{.put_item = thread_item("S3", "a", 1)},
        WriteRequest{.delete_key = thread_key("S3", "a")},
    };
    const auto result = db.batch_write_item(duplicates);
    CHECK(result.error == Errc::ValidationError);
    CHECK(result.message == "Provided list of item keys contains duplicates");

    BatchWriteItemRequest malformed{};
    malformed.request_items["Threads"] = {
        WriteRequest{.put_item = thread_item("S3", "ok", 1)},
        WriteRequest{.put_item = Item{{"forum", str("S3")}}},
    };
    CHECK(db.batch_write_item(malformed).error == Errc::ValidationError);
    CHECK(db.scan(ScanRequest{.table_name = "Threads"}).value->count == 0U);

    BatchWriteItemRequest both{};
    both.request_items["Threads"] = {
        WriteRequest{.put_item = thread_item("S3", "a", 1), .delete_key = thread_key("S3", "a")},
    };
    CHECK(db.batch_write_item(both).error == Errc::ValidationError);

    CHECK(db.batch_write_item(BatchWriteItemRequest{}).error == Errc::ValidationError);

    BatchWriteItemRequest oversized{};
    for (std::size_t index = 0; index <= kMaxBatchWriteRequests; ++index) {
        oversized.request_items["Threads"].push_back(WriteRequest{.put_item = thread_item("S3", std::to_string(index), 1)});
    }
    CHECK(db.batch_write_item(oversized).error == Errc::ValidationError);
}

TEST_CASE_METHOD(Fixture, "BatchGetItem returns found items per table")
{
    put(thread_item("S3", "a", 1));
    put(thread_item("S3", "b", 2));

    BatchGetItemRequest request{};
    request.request_items["Threads"] = KeysAndAttributes{
        .keys = {thread_key("S3", "a"), thread_key("S3", "b"), thread_key("S3", "zzz")},
        .attributes_to_get = {"subject"},
    };
    request.request_items["Ghost"] = KeysAndAttributes{.keys = {thread_key("x", "y")}};

    const auto result = db.batch_get_item(request);
    REQUIRE(result.success());
    REQUIRE(result.value->responses.contains("Threads"));
    const auto& items = result.value->responses.at("Threads");
    REQUIRE(items.size() == 2U);
    CHECK(items[0] == Item{{"subject", str("a")}});
    CHECK(items[1] == Item{{"subject", str("b")}});
    CHECK(result.value->unprocessed_keys.contains("Ghost"));
}

TEST_CASE_METHOD(Fixture, "Operations are traced and counted")
{
    put(thread_item("S3", "a", 1));
    CHECK(db.describe_table(TableRequest{.table_name = "Nope"}).error == Errc::ResourceNotFound);

    REQUIRE(traces.size() == 3U);
    CHECK(traces[0].operation == Operation::CreateTable);
    CHECK(traces[1].operation == Operation::PutItem);
    CHECK(traces[1].table_name == "Threads");
    CHECK(traces[1].success);
    CHECK(traces[2].operation == Operation::DescribeTable);
    CHECK_FALSE(traces[2].success);
    CHECK(traces[2].error == Errc::ResourceNotFound);

    const auto snapshot = db.telemetry().snapshot();
    CHECK(snapshot.operation(Operation::PutItem).attempts == 1U);
    CHECK(snapshot.operation(Operation::PutItem).successes == 1U);
    CHECK(snapshot.operation(Operation::DescribeTable).failures == 1U);
    CHECK(snapshot.failures.not_found_failures == 1U);
}

TEST_CASE_METHOD(Fixture, "Deleting a table drops its items")
{
    put(thread_item("S3", "a", 1));

    const auto described = db.describe_table(TableRequest{.table_name = "Threads"});
    REQUIRE(described.success());
    CHECK(described.value->item_count == 1U);

    const auto deleted = db.delete_table(TableRequest{.table_name = "Threads"});
    REQUIRE(deleted.success());
    CHECK(deleted.value->status == catalog::TableStatus::Deleting);
    CHECK(db.get_item(GetItemRequest{.table_name = "Threads", .key = thread_key("S3", "a")}).error == Errc::ResourceNotFound);

    const auto listed = db.list_tables();
    REQUIRE(listed.success());
    CHECK(listed.value->table_names.empty());
}
