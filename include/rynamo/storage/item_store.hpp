#pragma once

#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"
#include "rynamo/expression/ast.hpp"
#include "rynamo/expression/bindings.hpp"
#include "rynamo/storage/key_value.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>

namespace rynamo::storage {

enum class ReturnValues : std::uint8_t {
    None = 0,
    AllOld,
    AllNew
};

struct WriteOptions final {
    const expression::Condition* condition = nullptr;
    const expression::PlaceholderBindings* bindings = nullptr;
    ReturnValues return_values = ReturnValues::None;
};

struct StoreStatistics final {
    std::uint64_t item_count = 0U;
    std::uint64_t size_bytes = 0U;
};

// Items of one table, grouped by partition key and ordered by sort key inside a
// partition. Writers hold the table lock exclusively so a condition check and
// its write are atomic; readers share it.
class ItemStore final {
public:
    using Partition = std::map<SortKey, Item>;
    using PartitionMap = std::map<KeyValue, Partition>;

    class ReadView final {
    public:
        explicit ReadView(const ItemStore& store);

        [[nodiscard]] const PartitionMap& partitions() const noexcept;
        [[nodiscard]] const catalog::TableSchema& schema() const noexcept;

    private:
        const ItemStore* store_ = nullptr;
        std::shared_lock<std::shared_mutex> lock_;
    };

    explicit ItemStore(catalog::TableSchema schema);

    ItemStore(const ItemStore&) = delete;
    ItemStore& operator=(const ItemStore&) = delete;
    ItemStore(ItemStore&&) = delete;
    ItemStore& operator=(ItemStore&&) = delete;

    // The value holds the previous item when ReturnValues::AllOld was requested.
    OperationResult<std::optional<Item>> put_item(Item item, const WriteOptions& options = {});
    // An absent item is a successful result with an empty value.
    OperationResult<std::optional<Item>> get_item(const Item& key) const;
    OperationResult<std::optional<Item>> delete_item(const Item& key, const WriteOptions& options = {});
    OperationResult<std::optional<Item>> update_item(const Item& key,
                                                     const expression::UpdateExpression* update,
                                                     const WriteOptions& options = {});

    // Extracts the primary key from a full item.
    std::error_code extract_key(const Item& item, PrimaryKey& key, std::string& message) const;
    // Parses a key map that must contain exactly the key attributes.
    std::error_code parse_key(const Item& attributes, PrimaryKey& key, std::string& message) const;
    [[nodiscard]] Item key_attributes(const PrimaryKey& key) const;

    [[nodiscard]] ReadView read() const;
    [[nodiscard]] const catalog::TableSchema& schema() const noexcept;
    [[nodiscard]] StoreStatistics statistics() const noexcept;

private:
    std::error_code check_condition(const Item* existing, const WriteOptions& options, std::string& message) const;
    const Item* find_locked(const PrimaryKey& key) const;
    void store_locked(const PrimaryKey& key, Item item);
    void erase_locked(const PrimaryKey& key);

    catalog::TableSchema schema_;
    mutable std::shared_mutex mutex_;
    PartitionMap partitions_{};
    std::atomic<std::uint64_t> item_count_{0U};
    std::atomic<std::uint64_t> size_bytes_{0U};
};

}  // namespace rynamo::storage
