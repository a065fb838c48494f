#pragma once

#include "rynamo/expression/grammar.hpp"
#include "rynamo/shell/command_parser.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace rynamo::database {
class Database;
}

namespace rynamo::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_returned = 0U;
    std::uint64_t rows_scanned = 0U;
    std::vector<expression::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

class ShellEngine final {
public:
    struct Config final {
        database::Database* database = nullptr;
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    // Runs one statement or meta command (\help, \stats). Never throws for bad input;
    // failures are reported through CommandMetrics::success and diagnostics.
    CommandMetrics execute(const std::string& text);

private:
    void dispatch(const ShellCommand& command, CommandMetrics& metrics);
    void execute_meta(std::string_view command, CommandMetrics& metrics);

    void create_table(const ShellCommand& command, CommandMetrics& metrics);
    void describe_table(const ShellCommand& command, CommandMetrics& metrics);
    void drop_table(const ShellCommand& command, CommandMetrics& metrics);
    void list_tables(const ShellCommand& command, CommandMetrics& metrics);
    void put_item(const ShellCommand& command, CommandMetrics& metrics);
    void get_item(const ShellCommand& command, CommandMetrics& metrics);
    void delete_item(const ShellCommand& command, CommandMetrics& metrics);
    void update_item(const ShellCommand& command, CommandMetrics& metrics);
    void query(const ShellCommand& command, CommandMetrics& metrics);
    void scan(const ShellCommand& command, CommandMetrics& metrics);

    std::string next_correlation_id();

    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace rynamo::shell
