#include "rynamo/shell/shell_engine.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/database/database.hpp"
#include "rynamo/shell/value_literal.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using rynamo::expression::ParserDiagnostic;
using rynamo::expression::ParserSeverity;

namespace rynamo::shell {

namespace {

[[nodiscard]] std::string trim(std::string_view text)
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

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun)
{
    std::string text = std::to_string(count) + " " + std::string{noun};
    if (count != 1U) {
        text.push_back('s');
    }
    return text;
}

[[nodiscard]] ParserSeverity to_parser_severity(DiagnosticSeverity severity) noexcept
{
    switch (severity) {
    case DiagnosticSeverity::Info:
        return ParserSeverity::Info;
    case DiagnosticSeverity::Warning:
        return ParserSeverity::Warning;
    case DiagnosticSeverity::Error:
    default:
        return ParserSeverity::Error;
    }
}

template <typename T>
void report_failure(const OperationResult<T>& result, const ShellCommand& command, CommandMetrics& metrics)
{
    metrics.success = false;
    const std::string name = exception_name(result.error);
    metrics.summary = std::string{to_string(command.kind)} + " failed: " + name;

    ParserDiagnostic diagnostic{};
    diagnostic.severity = to_parser_severity(result.severity);
    diagnostic.message = result.message.empty() ? name : name + ": " + result.message;
    diagnostic.expression = metrics.command_text;
    diagnostic.remediation_hints = result.remediation_hints;
    metrics.diagnostics.push_back(std::move(diagnostic));
}

[[nodiscard]] std::string format_time(std::chrono::system_clock::time_point time)
{
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream stream;
    stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return stream.str();
}

[[nodiscard]] std::string format_key(const catalog::KeyAttribute& key)
{
    return key.name + " (" + catalog::to_string(key.type) + ")";
}

[[nodiscard]] std::string format_average_ms(std::uint64_t total_ns, std::uint64_t count)
{
    if (count == 0U) {
        return "-";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(total_ns) / static_cast<double>(count) / 1'000'000.0);
    return buffer;
}

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (i + 1U < column_count && field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }
    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

[[nodiscard]] std::vector<std::string> describe_lines(const catalog::TableDescription& description)
{
    const auto& schema = description.schema;
    std::vector<std::vector<std::string>> rows{
        {"table_name", schema.table_name},
        {"status", catalog::to_string(description.status)},
        {"partition_key", format_key(schema.partition_key)},
        {"sort_key", schema.sort_key ? format_key(*schema.sort_key) : std::string{"-"}},
        {"billing_mode", catalog::to_string(description.billing_mode)},
        {"item_count", std::to_string(description.item_count)},
        {"table_size_bytes", std::to_string(description.table_size_bytes)},
        {"created", format_time(description.creation_time)},
        {"table_arn", description.table_arn},
    };
    return format_table({"property", "value"}, rows);
}

void append_returned(const std::optional<Item>& attributes, CommandMetrics& metrics)
{
    if (attributes) {
        metrics.detail_lines.push_back(render_item(*attributes));
        metrics.rows_returned = 1U;
    }
}

void append_page(const executor::QueryPage& page, CommandMetrics& metrics)
{
    for (const auto& item : page.items) {
        metrics.detail_lines.push_back(render_item(item));
    }
    if (page.last_evaluated_key) {
        metrics.detail_lines.push_back("more results: FROM " + render_item(*page.last_evaluated_key));
    }
    metrics.rows_returned = page.count;
    metrics.rows_scanned = page.scanned_count;
    metrics.summary = "Returned " + plural(page.count, "item") + " (scanned " + std::to_string(page.scanned_count) + ")";
}

const std::vector<std::string>& help_lines()
{
    static const std::vector<std::string> lines{
        "CREATE TABLE name HASH attr S|N|B [RANGE attr S|N|B];",
        "DESCRIBE TABLE name;",
        "DROP TABLE name;",
        "LIST TABLES [LIMIT n] [FROM name];",
        "PUT table {item} [IF 'cond'] [USING {bindings}];",
        "GET table {key};",
        "DELETE table {key} [IF 'cond'] [USING {bindings}];",
        "UPDATE table {key} 'update' [IF 'cond'] [USING {bindings}] [RETURN ALL_NEW|ALL_OLD|NONE];",
        "QUERY table 'keycond' [FILTER 'filter'] [USING {bindings}] [LIMIT n] [DESC] [FROM {key}];",
        "SCAN table [FILTER 'filter'] [USING {bindings}] [LIMIT n] [FROM {key}];",
        "Values: S\"text\" N\"1.5\" B\"base64\" BOOL true NULL L[...] M{...} SS[...] NS[...] BS[...]",
        "Bindings: {#n: \"name\", :v: S\"value\"}",
        "Meta commands: \\help \\stats",
    };
    return lines;
}

}  // namespace

ShellEngine::ShellEngine() = default;

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{}

CommandMetrics ShellEngine::execute(const std::string& text)
{
    CommandMetrics metrics{};
    metrics.command_text = trim(text);
    if (metrics.command_text.empty() || metrics.command_text == ";") {
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    }

    metrics.correlation_id = next_correlation_id();
    metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    if (metrics.command_text.front() == '\\') {
        metrics.command_category = "meta";
        execute_meta(metrics.command_text, metrics);
    } else {
        auto parsed = parse_command(metrics.command_text);
        if (!parsed.success()) {
            metrics.command_category = "parse";
            metrics.success = false;
            metrics.summary = "Parse error.";
            metrics.diagnostics = std::move(parsed.diagnostics);
        } else {
            metrics.command_category = to_string(parsed.command->kind);
            if (config_.database == nullptr) {
                metrics.success = false;
                metrics.summary = "No database is attached to the shell.";
            } else {
                dispatch(*parsed.command, metrics);
            }
        }
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.finished_at = std::chrono::system_clock::now();

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
    return metrics;
}

std::string ShellEngine::next_correlation_id()
{
    const auto value = correlation_counter_.fetch_add(1U, std::memory_order_relaxed);
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "cmd-%06llu", static_cast<unsigned long long>(value));
    return buffer;
}

void ShellEngine::dispatch(const ShellCommand& command, CommandMetrics& metrics)
{
    switch (command.kind) {
    case CommandKind::CreateTable:
        create_table(command, metrics);
        return;
    case CommandKind::DescribeTable:
        describe_table(command, metrics);
        return;
    case CommandKind::DropTable:
        drop_table(command, metrics);
        return;
    case CommandKind::ListTables:
        list_tables(command, metrics);
        return;
    case CommandKind::Put:
        put_item(command, metrics);
        return;
    case CommandKind::Get:
        get_item(command, metrics);
        return;
    case CommandKind::Delete:
        delete_item(command, metrics);
        return;
    case CommandKind::Update:
        update_item(command, metrics);
        return;
    case CommandKind::Query:
        query(command, metrics);
        return;
    case CommandKind::Scan:
        scan(command, metrics);
        return;
    }
}

void ShellEngine::execute_meta(std::string_view command, CommandMetrics& metrics)
{
    std::string name{command.substr(0U, command.find_first_of(" \t;"))};

    if (name == "\\help" || name == "\\h" || name == "\\?") {
        metrics.success = true;
        metrics.summary = "Available commands:";
        metrics.detail_lines = help_lines();
        return;
    }

    if (name == "\\stats") {
        if (config_.database == nullptr) {
            metrics.success = false;
            metrics.summary = "No database is attached to the shell.";
            return;
        }
        const auto snapshot = config_.database->telemetry().snapshot();
        std::vector<std::vector<std::string>> rows;
        for (std::size_t index = 0U; index < snapshot.operations.size(); ++index) {
            const auto& operation = snapshot.operations[index];
            if (operation.attempts == 0U) {
                continue;
            }
            rows.push_back({database::to_string(static_cast<database::Operation>(index)),
                            std::to_string(operation.attempts),
                            std::to_string(operation.successes),
                            std::to_string(operation.failures),
                            format_average_ms(operation.total_duration_ns, operation.attempts)});
        }
        metrics.detail_lines = format_table({"operation", "attempts", "successes", "failures", "avg_ms"}, rows);

        const auto& failures = snapshot.failures;
        metrics.detail_lines.push_back("failures: conditional_check=" + std::to_string(failures.conditional_check_failures) +
                                       " validation=" + std::to_string(failures.validation_failures) +
                                       " not_found=" + std::to_string(failures.not_found_failures) +
                                       " other=" + std::to_string(failures.other_failures));

        const auto executor = config_.database->executor_telemetry().snapshot();
        metrics.detail_lines.push_back("range scan: rows=" + std::to_string(executor.range_scan_rows_read) +
                                       " bytes=" + std::to_string(executor.range_scan_bytes_read) +
                                       " truncated_pages=" + std::to_string(executor.range_scan_pages_truncated));
        metrics.detail_lines.push_back("filter: evaluated=" + std::to_string(executor.filter_rows_evaluated) +
                                       " passed=" + std::to_string(executor.filter_rows_passed));

        metrics.success = true;
        metrics.summary = "Recorded " + plural(rows.size(), "operation") + " with activity";
        return;
    }

    metrics.success = false;
    metrics.summary = "Unknown meta command.";
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = "unknown meta command '" + name + "'";
    diagnostic.fragment = name;
    diagnostic.expression = std::string{command};
    diagnostic.remediation_hints = {"Type \\help for the list of commands."};
    metrics.diagnostics.push_back(std::move(diagnostic));
}

void ShellEngine::create_table(const ShellCommand& command, CommandMetrics& metrics)
{
    catalog::CreateTableRequest request{};
    request.table_name = command.table_name;
    if (command.hash_key) {
        request.attribute_definitions.push_back({.attribute_name = command.hash_key->name, .attribute_type = command.hash_key->type});
        request.key_schema.push_back({.attribute_name = command.hash_key->name, .key_type = catalog::KeyType::Hash});
    }
    if (command.range_key) {
        request.attribute_definitions.push_back({.attribute_name = command.range_key->name, .attribute_type = command.range_key->type});
        request.key_schema.push_back({.attribute_name = command.range_key->name, .key_type = catalog::KeyType::Range});
    }

    const auto result = config_.database->create_table(request);
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Created table " + command.table_name;
    metrics.detail_lines = describe_lines(*result.value);
}

void ShellEngine::describe_table(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->describe_table({.table_name = command.table_name});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Table " + command.table_name + " is " + catalog::to_string(result.value->status);
    metrics.detail_lines = describe_lines(*result.value);
}

void ShellEngine::drop_table(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->delete_table({.table_name = command.table_name});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Dropped table " + command.table_name + " (" + plural(result.value->item_count, "item") + ")";
}

void ShellEngine::list_tables(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->list_tables({.exclusive_start_table_name = command.from_table, .limit = command.limit});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(result.value->table_names.size());
    for (const auto& name : result.value->table_names) {
        rows.push_back({name});
    }
    metrics.detail_lines = format_table({"table"}, rows);
    if (result.value->last_evaluated_table_name) {
        metrics.detail_lines.push_back("more results: FROM " + *result.value->last_evaluated_table_name);
    }
    metrics.rows_returned = rows.size();
    metrics.success = true;
    metrics.summary = "Listed " + plural(rows.size(), "table");
}

void ShellEngine::put_item(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->put_item({.table_name = command.table_name,
                                                    .item = command.item,
                                                    .condition_expression = command.condition,
                                                    .bindings = command.bindings,
                                                    .return_values = command.return_values});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Put item into " + command.table_name;
    append_returned(result.value->attributes, metrics);
}

void ShellEngine::get_item(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->get_item({.table_name = command.table_name, .key = command.item});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    if (!result.value->item) {
        metrics.summary = "No item found.";
        return;
    }
    metrics.summary = "Found item in " + command.table_name;
    append_returned(result.value->item, metrics);
}

void ShellEngine::delete_item(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->delete_item({.table_name = command.table_name,
                                                       .key = command.item,
                                                       .condition_expression = command.condition,
                                                       .bindings = command.bindings,
                                                       .return_values = command.return_values});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Deleted item from " + command.table_name;
    append_returned(result.value->attributes, metrics);
}

void ShellEngine::update_item(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->update_item({.table_name = command.table_name,
                                                       .key = command.item,
                                                       .update_expression = command.expression,
                                                       .condition_expression = command.condition,
                                                       .bindings = command.bindings,
                                                       .return_values = command.return_values});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    metrics.summary = "Updated item in " + command.table_name;
    append_returned(result.value->attributes, metrics);
}

void ShellEngine::query(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->query({.table_name = command.table_name,
                                                 .key_condition_expression = command.expression.value_or(std::string{}),
                                                 .filter_expression = command.filter,
                                                 .bindings = command.bindings,
                                                 .scan_forward = command.scan_forward,
                                                 .limit = command.limit,
                                                 .exclusive_start_key = command.start_key});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    append_page(*result.value, metrics);
}

void ShellEngine::scan(const ShellCommand& command, CommandMetrics& metrics)
{
    const auto result = config_.database->scan({.table_name = command.table_name,
                                                .filter_expression = command.filter,
                                                .bindings = command.bindings,
                                                .limit = command.limit,
                                                .exclusive_start_key = command.start_key});
    if (!result.success()) {
        report_failure(result, command, metrics);
        return;
    }
    metrics.success = true;
    append_page(*result.value, metrics);
}

}  // namespace rynamo::shell
