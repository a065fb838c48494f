#include "rynamo/common/error.hpp"
#include "rynamo/database/operation_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>
#include <vector>

using namespace rynamo;
using namespace rynamo::database;

TEST_CASE("OperationTelemetry counts attempts and outcomes per operation")
{
    OperationTelemetry telemetry;
    telemetry.record_attempt(Operation::PutItem);
    telemetry.record_attempt(Operation::PutItem);
    telemetry.record_success(Operation::PutItem);
    telemetry.record_failure(Operation::PutItem, make_error_code(Errc::ConditionalCheckFailed));
    telemetry.record_duration(Operation::PutItem, 120U);
    telemetry.record_duration(Operation::PutItem, 80U);

    const auto snapshot = telemetry.snapshot();
    const auto& put = snapshot.operation(Operation::PutItem);
    CHECK(put.attempts == 2U);
    CHECK(put.successes == 1U);
    CHECK(put.failures == 1U);
    CHECK(put.total_duration_ns == 200U);
    CHECK(put.last_duration_ns == 80U);
    CHECK(snapshot.operation(Operation::GetItem).attempts == 0U);
}

TEST_CASE("OperationTelemetry buckets failures by error")
{
    OperationTelemetry telemetry;
    telemetry.record_failure(Operation::Query, make_error_code(Errc::ParseError));
    telemetry.record_failure(Operation::Query, make_error_code(Errc::ValidationError));
    telemetry.record_failure(Operation::Query, make_error_code(Errc::UnresolvedPlaceholder));
    telemetry.record_failure(Operation::Query, make_error_code(Errc::TypeMismatch));
    telemetry.record_failure(Operation::DescribeTable, make_error_code(Errc::ResourceNotFound));
    telemetry.record_failure(Operation::UpdateItem, make_error_code(Errc::ConditionalCheckFailed));
    telemetry.record_failure(Operation::CreateTable, make_error_code(Errc::TableAlreadyExists));
    telemetry.record_failure(Operation::Scan, std::make_error_code(std::errc::io_error));

    const auto failures = telemetry.snapshot().failures;
    CHECK(failures.validation_failures == 4U);
    CHECK(failures.not_found_failures == 1U);
    CHECK(failures.conditional_check_failures == 1U);
    CHECK(failures.other_failures == 2U);

    telemetry.reset();
    const auto cleared = telemetry.snapshot();
    CHECK(cleared.failures.validation_failures == 0U);
    CHECK(cleared.operation(Operation::Query).failures == 0U);
}

TEST_CASE("Operations render their API names")
{
    CHECK(std::string{to_string(Operation::PutItem)} == "PutItem");
    CHECK(std::string{to_string(Operation::BatchGetItem)} == "BatchGetItem");
    CHECK(std::string{to_string(Operation::ListTables)} == "ListTables");
    CHECK(std::string{to_string(Operation::Count)} == "Unknown");
}

TEST_CASE("OperationTelemetryRegistry aggregates registered samplers")
{
    OperationTelemetryRegistry registry;

    DatabaseTelemetrySnapshot first{};
    first.operations[static_cast<std::size_t>(Operation::GetItem)].attempts = 3U;
    first.operations[static_cast<std::size_t>(Operation::GetItem)].last_duration_ns = 40U;
    first.failures.validation_failures = 1U;

    DatabaseTelemetrySnapshot second{};
    second.operations[static_cast<std::size_t>(Operation::GetItem)].attempts = 2U;
    second.operations[static_cast<std::size_t>(Operation::GetItem)].last_duration_ns = 90U;
    second.failures.validation_failures = 2U;

    registry.register_sampler("b", [=] { return second; });
    registry.register_sampler("a", [=] { return first; });
    registry.register_sampler("ignored", {});

    const auto total = registry.aggregate();
    CHECK(total.operation(Operation::GetItem).attempts == 5U);
    CHECK(total.operation(Operation::GetItem).last_duration_ns == 90U);
    CHECK(total.failures.validation_failures == 3U);

    std::vector<std::string> visited;
    registry.visit([&](const std::string& identifier, const DatabaseTelemetrySnapshot&) { visited.push_back(identifier); });
    CHECK(visited == std::vector<std::string>{"a", "b"});

    registry.unregister_sampler("b");
    CHECK(registry.aggregate().operation(Operation::GetItem).attempts == 3U);
}
