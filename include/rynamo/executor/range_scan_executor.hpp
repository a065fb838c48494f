#pragma once

#include "rynamo/executor/executor_node.hpp"
#include "rynamo/executor/executor_telemetry.hpp"
#include "rynamo/executor/key_condition.hpp"
#include "rynamo/storage/item_store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rynamo::executor {

// Walks stored items in key order. With a key plan it reads one partition
// between the plan bounds; without one it reads every partition.
class RangeScanExecutor final : public ExecutorNode {
public:
    struct Config final {
        const storage::ItemStore::PartitionMap* partitions = nullptr;
        std::optional<KeyConditionPlan> key_plan{};
        bool scan_forward = true;
        std::optional<storage::PrimaryKey> exclusive_start_key{};
        std::optional<std::size_t> row_limit{};
        std::optional<std::size_t> byte_limit{};
        ExecutorTelemetry* telemetry = nullptr;
        std::string telemetry_identifier{};
    };

    explicit RangeScanExecutor(Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, ItemRow& row) override;
    void close(ExecutorContext& context) override;

private:
    using PartitionIterator = storage::ItemStore::PartitionMap::const_iterator;
    using RowIterator = storage::ItemStore::Partition::const_iterator;

    bool advance(ItemRow& row);
    [[nodiscard]] bool exhausted() const;
    void position_partition();

    Config config_{};
    bool opened_ = false;
    PartitionIterator partition_{};
    PartitionIterator partition_end_{};
    RowIterator first_{};
    RowIterator last_{};
    std::size_t rows_read_ = 0U;
    std::size_t bytes_read_ = 0U;
};

}  // namespace rynamo::executor
