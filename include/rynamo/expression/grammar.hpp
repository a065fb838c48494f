#pragma once

#include "rynamo/expression/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rynamo::expression {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::size_t byte_offset = 0U;
    std::string fragment{};
    std::string expression{};
    std::vector<std::string> remediation_hints{};
};

struct ConditionParseResult final {
    AstArena arena{};
    Condition* condition = nullptr;
    std::error_code error{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return condition != nullptr; }
};

struct UpdateParseResult final {
    AstArena arena{};
    UpdateExpression* expression = nullptr;
    std::error_code error{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return expression != nullptr; }
};

// Parses a condition, filter or key-condition expression. Failures carry
// Errc::ParseError for syntax problems and Errc::TypeMismatch for function calls
// with the wrong number or kind of operands.
ConditionParseResult parse_condition_expression(std::string_view input);

UpdateParseResult parse_update_expression(std::string_view input);

// Joins diagnostics into one line suitable for an error response.
std::string summarize_diagnostics(const std::vector<ParserDiagnostic>& diagnostics);

}  // namespace rynamo::expression
