#include "rynamo/executor/executor_telemetry.hpp"

namespace rynamo::executor {

ExecutorTelemetry::LatencyScope::LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept
    : telemetry_{telemetry}
    , operator_{op}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

ExecutorTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(operator_, duration_ns);
}

void ExecutorTelemetry::record_range_scan_row(std::size_t item_bytes) noexcept
{
    range_scan_rows_read_.fetch_add(1U, std::memory_order_relaxed);
    range_scan_bytes_read_.fetch_add(item_bytes, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_range_scan_truncated() noexcept
{
    range_scan_pages_truncated_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_filter_row(bool passed) noexcept
{
    filter_rows_evaluated_.fetch_add(1U, std::memory_order_relaxed);
    if (passed) {
        filter_rows_passed_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ExecutorTelemetry::record_latency(Operator op, std::uint64_t duration_ns) noexcept
{
    const auto index = static_cast<std::size_t>(op);
    if (index >= latencies_.size()) {
        return;
    }
    auto& counters = latencies_[index];
    counters.invocations.fetch_add(1U, std::memory_order_relaxed);
    counters.total_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

ExecutorTelemetrySnapshot ExecutorTelemetry::snapshot() const noexcept
{
    ExecutorTelemetrySnapshot snapshot{};
    snapshot.range_scan_rows_read = range_scan_rows_read_.load(std::memory_order_relaxed);
    snapshot.range_scan_bytes_read = range_scan_bytes_read_.load(std::memory_order_relaxed);
    snapshot.range_scan_pages_truncated = range_scan_pages_truncated_.load(std::memory_order_relaxed);
    snapshot.filter_rows_evaluated = filter_rows_evaluated_.load(std::memory_order_relaxed);
    snapshot.filter_rows_passed = filter_rows_passed_.load(std::memory_order_relaxed);

    const auto make_latency_snapshot = [&](Operator operator_kind) {
        ExecutorTelemetrySnapshot::OperatorLatencySnapshot latency{};
        const auto& counters = latencies_[static_cast<std::size_t>(operator_kind)];
        latency.invocations = counters.invocations.load(std::memory_order_relaxed);
        latency.total_duration_ns = counters.total_duration_ns.load(std::memory_order_relaxed);
        latency.last_duration_ns = counters.last_duration_ns.load(std::memory_order_relaxed);
        return latency;
    };

    snapshot.range_scan_latency = make_latency_snapshot(Operator::RangeScan);
    snapshot.filter_latency = make_latency_snapshot(Operator::Filter);
    return snapshot;
}

void ExecutorTelemetry::reset() noexcept
{
    range_scan_rows_read_.store(0U, std::memory_order_relaxed);
    range_scan_bytes_read_.store(0U, std::memory_order_relaxed);
    range_scan_pages_truncated_.store(0U, std::memory_order_relaxed);
    filter_rows_evaluated_.store(0U, std::memory_order_relaxed);
    filter_rows_passed_.store(0U, std::memory_order_relaxed);
    for (auto& counters : latencies_) {
        counters.invocations.store(0U, std::memory_order_relaxed);
        counters.total_duration_ns.store(0U, std::memory_order_relaxed);
        counters.last_duration_ns.store(0U, std::memory_order_relaxed);
    }
}

}  // namespace rynamo::executor
