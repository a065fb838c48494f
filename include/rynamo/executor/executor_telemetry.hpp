#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rynamo::executor {

struct ExecutorTelemetrySnapshot final {
    struct OperatorLatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t range_scan_rows_read = 0U;
    std::uint64_t range_scan_bytes_read = 0U;
    std::uint64_t range_scan_pages_truncated = 0U;
    std::uint64_t filter_rows_evaluated = 0U;
    std::uint64_t filter_rows_passed = 0U;

    OperatorLatencySnapshot range_scan_latency{};
    OperatorLatencySnapshot filter_latency{};
};

class ExecutorTelemetry final {
public:
    enum class Operator {
        RangeScan = 0,
        Filter,
        Count
    };

    class LatencyScope final {
    public:
        LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        ExecutorTelemetry* telemetry_ = nullptr;
        Operator operator_ = Operator::RangeScan;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_range_scan_row(std::size_t item_bytes) noexcept;
    void record_range_scan_truncated() noexcept;
    void record_filter_row(bool passed) noexcept;

    void record_latency(Operator op, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ExecutorTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct OperatorLatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> range_scan_rows_read_{0U};
    std::atomic<std::uint64_t> range_scan_bytes_read_{0U};
    std::atomic<std::uint64_t> range_scan_pages_truncated_{0U};
    std::atomic<std::uint64_t> filter_rows_evaluated_{0U};
    std::atomic<std::uint64_t> filter_rows_passed_{0U};
    std::array<OperatorLatencyCounters, static_cast<std::size_t>(Operator::Count)> latencies_{};
};

}  // namespace rynamo::executor
