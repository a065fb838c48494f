#include "rynamo/common/attribute_value.hpp"
#include "rynamo/expression/evaluator.hpp"
#include "rynamo/expression/grammar.hpp"
#include "rynamo/expression/update_applier.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using Clock = std::chrono::steady_clock;
using rynamo::AttributeValue;
using rynamo::Decimal;
using rynamo::Item;

struct Scenario final {
    std::string_view name;
    std::string_view condition;
    std::string_view update;
};

constexpr std::array scenarios{
    Scenario{"equality", "#pk = :pk", "SET #c = #c + :one"},
    Scenario{"range", "#pk = :pk AND #sk BETWEEN :lo AND :hi", "SET #tags = list_append(#tags, :more)"},
    Scenario{"functions",
             "attribute_exists(#pk) AND begins_with(#name, :prefix) AND size(#tags) > :one",
             "SET #name = if_not_exists(#name, :prefix) REMOVE #stale ADD #c :one"},
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: rynamo_expression_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }
    return default_iterations;
}

rynamo::expression::PlaceholderBindings make_bindings()
{
    rynamo::expression::PlaceholderBindings bindings{};
    bindings.names = {{"#pk", "pk"}, {"#sk", "sk"}, {"#name", "name"}, {"#tags", "tags"}, {"#c", "c"}, {"#stale", "stale"}};
    bindings.values = {
        {":pk", AttributeValue::string("user#1")},
        {":lo", AttributeValue::number(Decimal::from_integer(10))},
        {":hi", AttributeValue::number(Decimal::from_integer(90))},
        {":prefix", AttributeValue::string("al")},
        {":one", AttributeValue::number(Decimal::from_integer(1))},
        {":more", AttributeValue::list({AttributeValue::string("x")})},
    };
    return bindings;
}

Item make_item()
{
    return Item{
        {"pk", AttributeValue::string("user#1")},
        {"sk", AttributeValue::number(Decimal::from_integer(42))},
        {"name", AttributeValue::string("alice")},
        {"tags", AttributeValue::list({AttributeValue::string("a"), AttributeValue::string("b")})},
        {"c", AttributeValue::number(Decimal::from_integer(7))},
        {"stale", AttributeValue::boolean(true)},
    };
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t matches = 0U;
    std::size_t failures = 0U;
    Clock::duration parse_elapsed{};
    Clock::duration evaluate_elapsed{};
    Clock::duration update_elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;
    const auto bindings = make_bindings();
    const auto item = make_item();

    auto start = Clock::now();
    for (std::size_t iteration = 0U; iteration < iterations; ++iteration) {
        const auto parsed = rynamo::expression::parse_condition_expression(scenario.condition);
        if (!parsed.success()) {
            ++summary.failures;
        }
    }
    summary.parse_elapsed = Clock::now() - start;

    const auto condition = rynamo::expression::parse_condition_expression(scenario.condition);
    const auto update = rynamo::expression::parse_update_expression(scenario.update);
    if (!condition.success() || !update.success()) {
        ++summary.failures;
        return summary;
    }

    start = Clock::now();
    for (std::size_t iteration = 0U; iteration < iterations; ++iteration) {
        const auto result = rynamo::expression::evaluate(*condition.condition, item, bindings);
        if (!result.success()) {
            ++summary.failures;
        } else if (result.matched) {
            ++summary.matches;
        }
    }
    summary.evaluate_elapsed = Clock::now() - start;

    start = Clock::now();
    for (std::size_t iteration = 0U; iteration < iterations; ++iteration) {
        auto working = item;
        std::string message;
        if (rynamo::expression::apply_update(*update.expression, bindings, working, message)) {
            ++summary.failures;
        }
    }
    summary.update_elapsed = Clock::now() - start;

    return summary;
}

double per_second(std::size_t count, Clock::duration elapsed)
{
    const auto seconds = std::chrono::duration<double>(elapsed).count();
    return seconds > 0.0 ? static_cast<double>(count) / seconds : 0.0;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Iterations: " << summary.iterations << "\n";
    std::cout << "  Parses/s: " << per_second(summary.iterations, summary.parse_elapsed) << "\n";
    std::cout << "  Evaluations/s: " << per_second(summary.iterations, summary.evaluate_elapsed) << "\n";
    std::cout << "  Updates/s: " << per_second(summary.iterations, summary.update_elapsed) << "\n";
    std::cout << "  Matches: " << summary.matches << "\n";
    if (summary.failures > 0U) {
        std::cout << "  Failures: " << summary.failures << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 20000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    for (const auto& scenario : scenarios) {
        report_summary(scenario, run_scenario(scenario, iterations));
    }
    return 0;
}
