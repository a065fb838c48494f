#include "rynamo/executor/range_scan_executor.hpp"

#include "rynamo/executor/executor_context.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace rynamo::executor {

RangeScanExecutor::RangeScanExecutor(Config config)
    : config_{std::move(config)}
{
    if (config_.partitions == nullptr) {
        throw std::invalid_argument{"RangeScanExecutor requires a partition map"};
    }
}

void RangeScanExecutor::open(ExecutorContext&)
{
    if (opened_) {
        throw std::logic_error{"RangeScanExecutor opened twice"};
    }
    opened_ = true;
    rows_read_ = 0U;
    bytes_read_ = 0U;

    const auto& partitions = *config_.partitions;
    if (config_.key_plan) {
        partition_ = partitions.find(config_.key_plan->partition);
        partition_end_ = partition_ == partitions.end() ? partition_ : std::next(partition_);
    } else {
        partition_ = config_.exclusive_start_key ? partitions.lower_bound(config_.exclusive_start_key->partition)
                                                 : partitions.begin();
        partition_end_ = partitions.end();
    }
    position_partition();
}

bool RangeScanExecutor::next(ExecutorContext& context, ItemRow& row)
{
    if (!opened_) {
        throw std::logic_error{"RangeScanExecutor used before open"};
    }
    if (context.failed()) {
        return false;
    }
    const bool budget_spent = (config_.row_limit && rows_read_ >= *config_.row_limit)
                              || (config_.byte_limit && bytes_read_ >= *config_.byte_limit);
    if (budget_spent) {
        return false;
    }

    ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::RangeScan};
    if (!advance(row)) {
        return false;
    }

    const auto item_bytes = item_size(*row.item);
    ++rows_read_;
    bytes_read_ += item_bytes;
    context.record_examined(row);
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_range_scan_row(item_bytes);
    }

    const bool limit_reached = (config_.row_limit && rows_read_ >= *config_.row_limit)
                               || (config_.byte_limit && bytes_read_ >= *config_.byte_limit);
    if (limit_reached && !exhausted()) {
        context.mark_truncated();
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_range_scan_truncated();
        }
    }
    return true;
}

void RangeScanExecutor::close(ExecutorContext&)
{
    opened_ = false;
}

bool RangeScanExecutor::advance(ItemRow& row)
{
    while (partition_ != partition_end_) {
        if (first_ != last_) {
            const auto current = config_.scan_forward ? first_++ : --last_;
            row.partition = &partition_->first;
            row.sort = &current->first;
            row.item = &current->second;
            return true;
        }
        ++partition_;
        position_partition();
    }
    return false;
}

bool RangeScanExecutor::exhausted() const
{
    if (partition_ == partition_end_) {
        return true;
    }
    if (first_ != last_) {
        return false;
    }
    return std::next(partition_) == partition_end_;
}

void RangeScanExecutor::position_partition()
{
    if (partition_ == partition_end_) {
        return;
    }

    const auto& rows = partition_->second;
    std::optional<SortKeyBound> lower;
    std::optional<SortKeyBound> upper;
    if (config_.key_plan) {
        lower = config_.key_plan->lower;
        upper = config_.key_plan->upper;
    }

    const auto& start = config_.exclusive_start_key;
    if (start && start->partition == partition_->first) {
        if (!start->sort) {
            first_ = rows.end();
            last_ = rows.end();
            return;
        }
        SortKeyBound bound{*start->sort, false};
        if (config_.scan_forward) {
            if (!lower || !(bound.value < lower->value)) {
                lower = std::move(bound);
            }
        } else if (!upper || !(upper->value < bound.value)) {
            upper = std::move(bound);
        }
    }

    if (lower && upper) {
        const auto order = lower->value <=> upper->value;
        if (order > 0 || (order == 0 && !(lower->inclusive && upper->inclusive))) {
            first_ = rows.end();
            last_ = rows.end();
            return;
        }
    }

    first_ = rows.begin();
    if (lower) {
        const storage::SortKey key{lower->value};
        first_ = lower->inclusive ? rows.lower_bound(key) : rows.upper_bound(key);
    }
    last_ = rows.end();
    if (upper) {
        const storage::SortKey key{upper->value};
        last_ = upper->inclusive ? rows.upper_bound(key) : rows.lower_bound(key);
    }
}

}  // namespace rynamo::executor
