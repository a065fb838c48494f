#include "rynamo/database/operation_telemetry.hpp"

#include "rynamo/common/error.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace rynamo::database {

namespace {

inline std::size_t to_index(Operation operation) noexcept
{
    return static_cast<std::size_t>(operation);
}

void accumulate(OperationTelemetrySnapshot& target, const OperationTelemetrySnapshot& source) noexcept
{
    target.attempts += source.attempts;
    target.successes += source.successes;
    target.failures += source.failures;
    target.total_duration_ns += source.total_duration_ns;
    target.last_duration_ns = std::max(target.last_duration_ns, source.last_duration_ns);
}

void accumulate(FailureTelemetrySnapshot& target, const FailureTelemetrySnapshot& source) noexcept
{
    target.conditional_check_failures += source.conditional_check_failures;
    target.validation_failures += source.validation_failures;
    target.not_found_failures += source.not_found_failures;
    target.other_failures += source.other_failures;
}

}  // namespace

const char* to_string(Operation operation) noexcept
{
    switch (operation) {
    case Operation::CreateTable:
        return "CreateTable";
    case Operation::DescribeTable:
        return "DescribeTable";
    case Operation::DeleteTable:
        return "DeleteTable";
    case Operation::ListTables:
        return "ListTables";
    case Operation::PutItem:
        return "PutItem";
    case Operation::GetItem:
        return "GetItem";
    case Operation::DeleteItem:
        return "DeleteItem";
    case Operation::UpdateItem:
        return "UpdateItem";
    case Operation::Query:
        return "Query";
    case Operation::Scan:
        return "Scan";
    case Operation::BatchWriteItem:
        return "BatchWriteItem";
    case Operation::BatchGetItem:
        return "BatchGetItem";
    case Operation::Count:
        break;
    }
    return "Unknown";
}

void OperationTelemetry::record_attempt(Operation operation) noexcept
{
    attempts_[to_index(operation)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_success(Operation operation) noexcept
{
    successes_[to_index(operation)].fetch_add(1U, std::memory_order_relaxed);
}

void OperationTelemetry::record_failure(Operation operation, std::error_code error) noexcept
{
    failures_[to_index(operation)].fetch_add(1U, std::memory_order_relaxed);

    if (!error || error.category() != rynamo_error_category()) {
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        return;
    }

    switch (static_cast<Errc>(error.value())) {
    case Errc::ConditionalCheckFailed:
        conditional_check_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case Errc::ParseError:
    case Errc::ValidationError:
    case Errc::UnresolvedPlaceholder:
    case Errc::TypeMismatch:
        validation_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case Errc::ResourceNotFound:
        not_found_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    default:
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    }
}

void OperationTelemetry::record_duration(Operation operation, std::uint64_t duration_ns) noexcept
{
    total_duration_ns_[to_index(operation)].fetch_add(duration_ns, std::memory_order_relaxed);
    last_duration_ns_[to_index(operation)].store(duration_ns, std::memory_order_relaxed);
}

DatabaseTelemetrySnapshot OperationTelemetry::snapshot() const noexcept
{
    DatabaseTelemetrySnapshot snapshot{};
    for (std::size_t i = 0; i < operation_count; ++i) {
        snapshot.operations[i].attempts = attempts_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].successes = successes_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].failures = failures_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].total_duration_ns = total_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].last_duration_ns = last_duration_ns_[i].load(std::memory_order_relaxed);
    }

    snapshot.failures.conditional_check_failures = conditional_check_failures_.load(std::memory_order_relaxed);
    snapshot.failures.validation_failures = validation_failures_.load(std::memory_order_relaxed);
    snapshot.failures.not_found_failures = not_found_failures_.load(std::memory_order_relaxed);
    snapshot.failures.other_failures = other_failures_.load(std::memory_order_relaxed);
    return snapshot;
}

void OperationTelemetry::reset() noexcept
{
    for (std::size_t i = 0; i < operation_count; ++i) {
        attempts_[i].store(0U, std::memory_order_relaxed);
        successes_[i].store(0U, std::memory_order_relaxed);
        failures_[i].store(0U, std::memory_order_relaxed);
        total_duration_ns_[i].store(0U, std::memory_order_relaxed);
        last_duration_ns_[i].store(0U, std::memory_order_relaxed);
    }

    conditional_check_failures_.store(0U, std::memory_order_relaxed);
    validation_failures_.store(0U, std::memory_order_relaxed);
    not_found_failures_.store(0U, std::memory_order_relaxed);
    other_failures_.store(0U, std::memory_order_relaxed);
}

void OperationTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void OperationTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

DatabaseTelemetrySnapshot OperationTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    DatabaseTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        const auto snapshot = sampler();
        for (std::size_t i = 0; i < snapshot.operations.size(); ++i) {
            accumulate(total.operations[i], snapshot.operations[i]);
        }
        accumulate(total.failures, snapshot.failures);
    }
    return total;
}

void OperationTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

}  // namespace rynamo::database
