#include "rynamo/tools/shell_log_formatter.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <vector>

namespace {

using rynamo::expression::ParserDiagnostic;
using rynamo::expression::ParserSeverity;

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (const unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04X", static_cast<unsigned>(ch));
                out.append(escaped);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

// Writes the members of one JSON object, inserting separators between them.
class ObjectWriter final {
public:
    explicit ObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    ~ObjectWriter() { out_.push_back('}'); }

    ObjectWriter(const ObjectWriter&) = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    std::string& key(std::string_view name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        append_json_string(out_, name);
        out_.push_back(':');
        return out_;
    }

    void string(std::string_view name, std::string_view value) { append_json_string(key(name), value); }

    void boolean(std::string_view name, bool value) { key(name).append(value ? "true" : "false"); }

    template <typename Number>
    void number(std::string_view name, Number value)
    {
        key(name).append(std::to_string(value));
    }

    void strings(std::string_view name, const std::vector<std::string>& values)
    {
        auto& out = key(name);
        out.push_back('[');
        for (std::size_t index = 0U; index < values.size(); ++index) {
            if (index > 0U) {
                out.push_back(',');
            }
            append_json_string(out, values[index]);
        }
        out.push_back(']');
    }

private:
    std::string& out_;
    bool first_ = true;
};

[[nodiscard]] const char* severity_name(ParserSeverity severity) noexcept
{
    switch (severity) {
    case ParserSeverity::Info:
        return "info";
    case ParserSeverity::Warning:
        return "warning";
    case ParserSeverity::Error:
    default:
        return "error";
    }
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

void append_timestamp(ObjectWriter& writer, std::string_view name, std::chrono::system_clock::time_point tp)
{
    const auto text = format_timestamp_iso(tp);
    if (text.empty()) {
        writer.key(name).append("null");
    } else {
        writer.string(name, text);
    }
}

void append_diagnostic(std::string& out, const ParserDiagnostic& diagnostic)
{
    ObjectWriter writer{out};
    writer.string("severity", severity_name(diagnostic.severity));
    writer.string("message", diagnostic.message);
    writer.number("line", diagnostic.line);
    writer.number("column", diagnostic.column);
    if (!diagnostic.fragment.empty()) {
        writer.string("fragment", diagnostic.fragment);
    }
    writer.strings("remediation_hints", diagnostic.remediation_hints);
}

}  // namespace

namespace rynamo::tools {

std::string format_shell_command_log_json(const rynamo::shell::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(512U);
    {
        ObjectWriter writer{json};
        append_timestamp(writer, "timestamp", metrics.started_at);
        writer.string("category", metrics.command_category);
        writer.string("correlation_id", metrics.correlation_id);
        writer.string("command", metrics.command_text);
        writer.boolean("success", metrics.success);
        writer.number("duration_ms", metrics.duration_ms);
        writer.number("rows_returned", metrics.rows_returned);
        writer.number("rows_scanned", metrics.rows_scanned);
        writer.string("summary", metrics.summary);
        append_timestamp(writer, "finished_at", metrics.finished_at);

        auto& out = writer.key("diagnostics");
        out.push_back('[');
        for (std::size_t index = 0U; index < metrics.diagnostics.size(); ++index) {
            if (index > 0U) {
                out.push_back(',');
            }
            append_diagnostic(out, metrics.diagnostics[index]);
        }
        out.push_back(']');
    }
    return json;
}

}  // namespace rynamo::tools
