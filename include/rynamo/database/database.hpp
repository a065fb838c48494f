#pragma once

#include "rynamo/catalog/table_catalog.hpp"
#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/database/operation_telemetry.hpp"
#include "rynamo/executor/executor_telemetry.hpp"
#include "rynamo/executor/query_executor.hpp"
#include "rynamo/expression/bindings.hpp"
#include "rynamo/storage/item_store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rynamo::database {

using storage::ReturnValues;

inline constexpr std::size_t kMaxBatchWriteRequests = 25U;
inline constexpr std::size_t kMaxBatchGetKeys = 100U;

struct TableRequest final {
    std::string table_name{};
};

struct PutItemRequest final {
    std::string table_name{};
    Item item{};
    std::optional<std::string> condition_expression{};
    expression::PlaceholderBindings bindings{};
    ReturnValues return_values = ReturnValues::None;
};

struct GetItemRequest final {
    std::string table_name{};
    Item key{};
    std::vector<std::string> attributes_to_get{};
};

struct GetItemResponse final {
    std::optional<Item> item{};
};

struct DeleteItemRequest final {
    std::string table_name{};
    Item key{};
    std::optional<std::string> condition_expression{};
    expression::PlaceholderBindings bindings{};
    ReturnValues return_values = ReturnValues::None;
};

struct UpdateItemRequest final {
    std::string table_name{};
    Item key{};
    std::optional<std::string> update_expression{};
    std::optional<std::string> condition_expression{};
    expression::PlaceholderBindings bindings{};
    ReturnValues return_values = ReturnValues::None;
};

// Put, delete and update responses carry the attributes selected by ReturnValues.
struct WriteItemResponse final {
    std::optional<Item> attributes{};
};

struct QueryRequest final {
    std::string table_name{};
    std::string key_condition_expression{};
    std::optional<std::string> filter_expression{};
    expression::PlaceholderBindings bindings{};
    bool scan_forward = true;
    std::optional<std::uint32_t> limit{};
    std::optional<Item> exclusive_start_key{};
    std::vector<std::string> attributes_to_get{};
    bool count_only = false;
};

struct ScanRequest final {
    std::string table_name{};
    std::optional<std::string> filter_expression{};
    expression::PlaceholderBindings bindings{};
    std::optional<std::uint32_t> limit{};
    std::optional<Item> exclusive_start_key{};
    std::vector<std::string> attributes_to_get{};
    bool count_only = false;
};

using QueryResponse = executor::QueryPage;

// Exactly one of put_item and delete_key is set.
struct WriteRequest final {
    std::optional<Item> put_item{};
    std::optional<Item> delete_key{};
};

struct BatchWriteItemRequest final {
    std::map<std::string, std::vector<WriteRequest>> request_items{};
};

struct BatchWriteItemResponse final {
    std::map<std::string, std::vector<WriteRequest>> unprocessed_items{};
};

struct KeysAndAttributes final {
    std::vector<Item> keys{};
    std::vector<std::string> attributes_to_get{};
};

struct BatchGetItemRequest final {
    std::map<std::string, KeysAndAttributes> request_items{};
};

struct BatchGetItemResponse final {
    std::map<std::string, std::vector<Item>> responses{};
    std::map<std::string, KeysAndAttributes> unprocessed_keys{};
};

struct OperationTrace final {
    Operation operation = Operation::GetItem;
    std::string table_name{};
    bool success = false;
    std::error_code error{};
    std::string message{};
    std::chrono::nanoseconds duration{};
};

class Database final {
public:
    using OperationLogger = std::function<void(const OperationTrace&)>;

    struct Config final {
        std::string region = "us-east-1";
        std::string account_id = "000000000000";
        catalog::TableCatalog::Clock clock{};
        catalog::TableCatalog::IdGenerator id_generator{};
        OperationLogger operation_logger{};
        std::size_t max_page_bytes = executor::kDefaultMaxPageBytes;
    };

    Database();
    explicit Database(Config config);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    OperationResult<catalog::TableDescription> create_table(const catalog::CreateTableRequest& request);
    OperationResult<catalog::TableDescription> describe_table(const TableRequest& request);
    OperationResult<catalog::TableDescription> delete_table(const TableRequest& request);
    OperationResult<catalog::ListTablesResponse> list_tables(const catalog::ListTablesRequest& request = {});

    OperationResult<WriteItemResponse> put_item(const PutItemRequest& request);
    OperationResult<GetItemResponse> get_item(const GetItemRequest& request);
    OperationResult<WriteItemResponse> delete_item(const DeleteItemRequest& request);
    OperationResult<WriteItemResponse> update_item(const UpdateItemRequest& request);
    OperationResult<QueryResponse> query(const QueryRequest& request);
    OperationResult<QueryResponse> scan(const ScanRequest& request);
    OperationResult<BatchWriteItemResponse> batch_write_item(const BatchWriteItemRequest& request);
    OperationResult<BatchGetItemResponse> batch_get_item(const BatchGetItemRequest& request);

    [[nodiscard]] const catalog::TableCatalog& catalog() const noexcept;
    [[nodiscard]] const OperationTelemetry& telemetry() const noexcept;
    [[nodiscard]] const executor::ExecutorTelemetry& executor_telemetry() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;

private:
    template <typename T, typename Handler>
    OperationResult<T> instrument(Operation operation, std::string_view table_name, Handler&& handler);

    Config config_{};
    catalog::TableCatalog catalog_;
    OperationTelemetry telemetry_{};
    executor::ExecutorTelemetry executor_telemetry_{};
};

}  // namespace rynamo::database
