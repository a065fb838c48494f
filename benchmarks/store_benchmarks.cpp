#include "rynamo/database/database.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;
using rynamo::AttributeValue;
using rynamo::Decimal;
using rynamo::Item;
using rynamo::database::Database;

struct BenchmarkOptions final {
    std::size_t partitions = 64U;
    std::size_t items_per_partition = 256U;
    std::size_t threads = 4U;
};

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: rynamo_store_benchmarks [--partitions N] [--items N] [--threads N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if (index + 1 >= argc) {
            continue;
        }
        const auto value = static_cast<std::size_t>(std::strtoull(argv[index + 1], nullptr, 10));
        if (value == 0U) {
            continue;
        }
        if (arg == "--partitions") {
            options.partitions = value;
        } else if (arg == "--items") {
            options.items_per_partition = value;
        } else if (arg == "--threads") {
            options.threads = value;
        }
    }
    return options;
}

bool create_table(Database& database)
{
    rynamo::catalog::CreateTableRequest request{};
    request.table_name = "bench";
    request.attribute_definitions = {{.attribute_name = "pk", .attribute_type = rynamo::catalog::ScalarAttributeType::String},
                                     {.attribute_name = "sk", .attribute_type = rynamo::catalog::ScalarAttributeType::Number}};
    request.key_schema = {{.attribute_name = "pk", .key_type = rynamo::catalog::KeyType::Hash},
                          {.attribute_name = "sk", .key_type = rynamo::catalog::KeyType::Range}};
    return database.create_table(request).success();
}

Item make_item(std::size_t partition, std::size_t sort)
{
    return Item{
        {"pk", AttributeValue::string("p" + std::to_string(partition))},
        {"sk", AttributeValue::number(Decimal::from_integer(static_cast<std::int64_t>(sort)))},
        {"payload", AttributeValue::string(std::string(64U, 'x'))},
    };
}

void report(std::string_view name, std::size_t operations, Clock::duration elapsed, std::size_t failures)
{
    const auto seconds = std::chrono::duration<double>(elapsed).count();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << name << "\n";
    std::cout << "  Operations: " << operations << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Operations/s: " << (seconds > 0.0 ? static_cast<double>(operations) / seconds : 0.0) << "\n";
    if (failures > 0U) {
        std::cout << "  Failures: " << failures << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    const auto options = parse_options(argc, argv);
    Database database{};
    if (!create_table(database)) {
        std::cerr << "error: failed to create benchmark table\n";
        return 1;
    }

    const auto total = options.partitions * options.items_per_partition;

    // Writers split partitions between threads; each thread counts its own failures.
    std::vector<std::size_t> put_failures(options.threads, 0U);
    auto start = Clock::now();
    {
        std::vector<std::thread> workers;
        workers.reserve(options.threads);
        for (std::size_t worker = 0U; worker < options.threads; ++worker) {
            workers.emplace_back([&, worker] {
                for (std::size_t partition = worker; partition < options.partitions; partition += options.threads) {
                    for (std::size_t sort = 0U; sort < options.items_per_partition; ++sort) {
                        if (!database.put_item({.table_name = "bench", .item = make_item(partition, sort)}).success()) {
                            ++put_failures[worker];
                        }
                    }
                }
            });
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }
    std::size_t failures = 0U;
    for (const auto count : put_failures) {
        failures += count;
    }
    report("concurrent put_item", total, Clock::now() - start, failures);

    failures = 0U;
    start = Clock::now();
    for (std::size_t partition = 0U; partition < options.partitions; ++partition) {
        rynamo::database::QueryRequest request{};
        request.table_name = "bench";
        request.key_condition_expression = "pk = :pk AND sk BETWEEN :lo AND :hi";
        request.bindings.values = {
            {":pk", AttributeValue::string("p" + std::to_string(partition))},
            {":lo", AttributeValue::number(Decimal::from_integer(0))},
            {":hi", AttributeValue::number(Decimal::from_integer(static_cast<std::int64_t>(options.items_per_partition / 2U)))},
        };
        if (!database.query(request).success()) {
            ++failures;
        }
    }
    report("range query", options.partitions, Clock::now() - start, failures);

    failures = 0U;
    std::size_t pages = 0U;
    start = Clock::now();
    rynamo::database::ScanRequest scan{};
    scan.table_name = "bench";
    scan.limit = 500U;
    while (true) {
        const auto result = database.scan(scan);
        ++pages;
        if (!result.success()) {
            ++failures;
            break;
        }
        if (!result.value->last_evaluated_key) {
            break;
        }
        scan.exclusive_start_key = result.value->last_evaluated_key;
    }
    report("paginated scan (pages)", pages, Clock::now() - start, failures);

    return 0;
}
