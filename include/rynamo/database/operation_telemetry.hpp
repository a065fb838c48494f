#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>

namespace rynamo::database {

enum class Operation : std::uint8_t {
    CreateTable = 0,
    DescribeTable,
    DeleteTable,
    ListTables,
    PutItem,
    GetItem,
    DeleteItem,
    UpdateItem,
    Query,
    Scan,
    BatchWriteItem,
    BatchGetItem,
    Count
};

const char* to_string(Operation operation) noexcept;

struct OperationTelemetrySnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

struct FailureTelemetrySnapshot final {
    std::uint64_t conditional_check_failures = 0U;
    std::uint64_t validation_failures = 0U;
    std::uint64_t not_found_failures = 0U;
    std::uint64_t other_failures = 0U;
};

struct DatabaseTelemetrySnapshot final {
    std::array<OperationTelemetrySnapshot, static_cast<std::size_t>(Operation::Count)> operations{};
    FailureTelemetrySnapshot failures{};

    [[nodiscard]] const OperationTelemetrySnapshot& operation(Operation op) const noexcept
    {
        return operations[static_cast<std::size_t>(op)];
    }
};

class OperationTelemetry final {
public:
    void record_attempt(Operation operation) noexcept;
    void record_success(Operation operation) noexcept;
    void record_failure(Operation operation, std::error_code error) noexcept;
    void record_duration(Operation operation, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] DatabaseTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static constexpr std::size_t operation_count = static_cast<std::size_t>(Operation::Count);

    std::array<std::atomic<std::uint64_t>, operation_count> attempts_{};
    std::array<std::atomic<std::uint64_t>, operation_count> successes_{};
    std::array<std::atomic<std::uint64_t>, operation_count> failures_{};
    std::array<std::atomic<std::uint64_t>, operation_count> total_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, operation_count> last_duration_ns_{};

    std::atomic<std::uint64_t> conditional_check_failures_{0U};
    std::atomic<std::uint64_t> validation_failures_{0U};
    std::atomic<std::uint64_t> not_found_failures_{0U};
    std::atomic<std::uint64_t> other_failures_{0U};
};

class OperationTelemetryRegistry final {
public:
    using Sampler = std::function<DatabaseTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const DatabaseTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] DatabaseTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    using SamplerMap = std::unordered_map<std::string, Sampler>;

    mutable std::mutex mutex_{};
    SamplerMap samplers_{};
};

}  // namespace rynamo::database
