#include "rynamo/database/database.hpp"
#include "rynamo/shell/shell_engine.hpp"
#include "rynamo/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }
    std::filesystem::path path{home};
    path /= ".rynamo_shell_history";
    return path;
}

void render_result(const rynamo::shell::CommandMetrics& metrics)
{
    const auto status = metrics.success ? "OK" : "ERROR";
    std::cout << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (metrics.rows_scanned != 0U) {
        std::cout << " count=" << metrics.rows_returned << " scanned=" << metrics.rows_scanned;
    }
    std::cout << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }
    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.message << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

// A command is complete once a ';' outside quotes and brackets ends the buffer.
bool command_complete(std::string_view text)
{
    std::int32_t depth = 0;
    bool in_single_quote = false;
    bool in_double_quote = false;

    for (std::size_t index = 0U; index < text.size(); ++index) {
        const char ch = text[index];
        const char next = (index + 1U < text.size()) ? text[index + 1U] : '\0';

        if (in_double_quote) {
            if (ch == '\\') {
                ++index;
            } else if (ch == '"') {
                in_double_quote = false;
            }
            continue;
        }
        if (in_single_quote) {
            if (ch == '\'' && next == '\'') {
                ++index;
            } else if (ch == '\'') {
                in_single_quote = false;
            }
            continue;
        }

        switch (ch) {
        case '\'':
            in_single_quote = true;
            break;
        case '"':
            in_double_quote = true;
            break;
        case '{':
        case '[':
            ++depth;
            break;
        case '}':
        case ']':
            if (depth > 0) {
                --depth;
            }
            break;
        case ';':
            if (depth == 0 && trim(text.substr(index + 1U)).empty()) {
                return true;
            }
            break;
        default:
            break;
        }
    }
    return false;
}

bool is_comment_line(std::string_view line)
{
    const auto trimmed = trim(line);
    return trimmed.rfind("--", 0U) == 0U;
}

bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();
    std::string buffer;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (buffer.empty() && is_comment_line(line)) {
            continue;
        }
        buffer.append(line);
        buffer.push_back('\n');
        if (!command_complete(buffer)) {
            continue;
        }
        auto statement = trim(buffer);
        if (!statement.empty()) {
            commands.push_back(std::move(statement));
        }
        buffer.clear();
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }

    auto trailing = trim(buffer);
    if (!trailing.empty()) {
        commands.push_back(std::move(trailing));
    }
    return true;
}

bool run_script_stream(rynamo::shell::ShellEngine& engine, std::istream& stream, const std::string& source)
{
    std::vector<std::string> statements;
    std::string error;
    if (!load_script_commands(stream, statements, error)) {
        std::cerr << "error: " << error << " ('" << source << "')" << '\n';
        return false;
    }

    bool all_success = true;
    for (const auto& statement : statements) {
        const auto result = engine.execute(statement);
        render_result(result);
        all_success = all_success && result.success;
    }
    return all_success;
}

int run_repl(bool quiet, rynamo::shell::ShellEngine& engine)
{
    replxx::Replxx repl;
    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "rynamo shell. Commands end with ';'. Type \\help for syntax, \\quit to exit.\n";
    }

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "rynamo> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(line);
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            repl.history_add(trimmed);
            render_result(engine.execute(trimmed));
            continue;
        }

        if (buffer.empty() && trimmed.rfind("@", 0U) == 0U) {
            const auto script_path = trim(std::string_view{trimmed}.substr(1U));
            if (script_path.empty()) {
                std::cerr << "error: script path is required after '@'" << '\n';
                continue;
            }
            std::ifstream script_file{script_path};
            if (!script_file.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                continue;
            }
            if (!run_script_stream(engine, script_file, script_path)) {
                std::cerr << "error: script '" << script_path << "' completed with errors" << '\n';
            }
            continue;
        }

        if (trimmed.empty() && buffer.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
        if (!command_complete(buffer)) {
            continue;
        }

        const auto statement = trim(buffer);
        repl.history_add(statement);
        render_result(engine.execute(statement));
        if (!history.empty()) {
            (void)repl.history_save(history.string());
        }
        buffer.clear();
    }

    std::cerr << "[debug] run_repl exiting with code=0\n";
    return 0;
}

int run_batch(const std::vector<std::string>& commands, rynamo::shell::ShellEngine& engine)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        const auto result = engine.execute(command);
        render_result(result);
        if (!result.success) {
            exit_code = 1;
        }
    }
    std::cerr << "[debug] run_batch exiting with code=" << exit_code << '\n';
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive shell for the rynamo local DynamoDB emulator."};

    bool quiet = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string log_json_path;
    rynamo::database::Database::Config database_config{};

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_option("-c,--command", execute_commands, "Execute the provided command and exit")
        ->type_name("COMMAND")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)");
    app.add_option("--region", database_config.region, "Region used in table ARNs")->capture_default_str();
    app.add_option("--account-id", database_config.account_id, "Account id used in table ARNs")
        ->capture_default_str()
        ->check([](const std::string& value) -> std::string {
            if (value.size() != 12U) {
                return "account id must have 12 digits";
            }
            for (const char ch : value) {
                if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
                    return "account id must have 12 digits";
                }
            }
            return {};
        });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        std::cerr << "[debug] exiting main via CLI parse error path code=" << code << '\n';
        return code;
    }

    rynamo::database::Database database{database_config};
    rynamo::shell::ShellEngine::Config config{};
    config.database = &database;

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;
    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
        config.command_logger = [log_stream, &log_mutex](const rynamo::shell::CommandMetrics& metrics) {
            const auto line = rynamo::tools::format_shell_command_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    rynamo::shell::ShellEngine engine{config};

    std::vector<std::string> commands_to_run;
    bool stdin_consumed = false;
    for (const auto& script_path : script_files) {
        std::istream* input = nullptr;
        std::ifstream script_stream;
        if (script_path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin script '-' specified more than once" << '\n';
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            script_stream.open(script_path);
            if (!script_stream.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                return 1;
            }
            input = &script_stream;
        }

        std::string error;
        if (!load_script_commands(*input, commands_to_run, error)) {
            std::cerr << "error: " << error << " ('" << (script_path == "-" ? std::string{"<stdin>"} : script_path) << "')" << '\n';
            return 1;
        }
    }
    commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());

    if (!commands_to_run.empty()) {
        const auto code = run_batch(commands_to_run, engine);
        std::cerr << "[debug] exiting main via run_batch code=" << code << '\n';
        return code;
    }
    if (!script_files.empty()) {
        return 0;
    }

    const auto repl_code = run_repl(quiet, engine);
    std::cerr << "[debug] exiting main via run_repl code=" << repl_code << '\n';
    return repl_code;
}
