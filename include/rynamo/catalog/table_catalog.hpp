#pragma once

#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/storage/item_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rynamo::catalog {

class Table final {
public:
    explicit Table(TableDescription description);

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const TableSchema& schema() const noexcept;
    [[nodiscard]] TableStatus status() const noexcept;
    void set_status(TableStatus status) noexcept;

    [[nodiscard]] storage::ItemStore& store() noexcept;
    [[nodiscard]] const storage::ItemStore& store() const noexcept;

    // Snapshot of the metadata with the current item count and size.
    [[nodiscard]] TableDescription describe() const;

private:
    TableDescription description_;
    std::atomic<TableStatus> status_;
    storage::ItemStore store_;
};

using TablePtr = std::shared_ptr<Table>;

struct ListTablesRequest final {
    std::optional<std::string> exclusive_start_table_name{};
    std::optional<std::uint32_t> limit{};
};

struct ListTablesResponse final {
    std::vector<std::string> table_names{};
    std::optional<std::string> last_evaluated_table_name{};
};

inline constexpr std::uint32_t kMaxListTablesLimit = 100U;

class TableCatalog final {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using IdGenerator = std::function<std::string()>;

    struct Config final {
        std::string region = "us-east-1";
        std::string account_id = "000000000000";
        Clock clock{};
        IdGenerator id_generator{};
    };

    TableCatalog();
    explicit TableCatalog(Config config);

    TableCatalog(const TableCatalog&) = delete;
    TableCatalog& operator=(const TableCatalog&) = delete;

    OperationResult<TableDescription> create_table(const CreateTableRequest& request);
    OperationResult<TableDescription> describe_table(std::string_view name) const;
    OperationResult<TableDescription> delete_table(std::string_view name);
    OperationResult<ListTablesResponse> list_tables(const ListTablesRequest& request = {}) const;

    // Resolves a table for an item operation. The pointer keeps the table alive
    // after a concurrent delete.
    [[nodiscard]] TablePtr find_table(std::string_view name) const;
    OperationResult<TablePtr> open_table(std::string_view name) const;

    [[nodiscard]] std::size_t table_count() const;
    [[nodiscard]] const Config& config() const noexcept;

    [[nodiscard]] std::string table_arn(std::string_view name) const;

private:
    Config config_{};
    mutable std::shared_mutex mutex_;
    std::map<std::string, TablePtr, std::less<>> tables_{};
};

// Random RFC 4122 version 4 identifier.
std::string generate_table_id();

}  // namespace rynamo::catalog
