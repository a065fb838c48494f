#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace rynamo {

enum class Errc {
    Success = 0,
    ParseError,
    ValidationError,
    ResourceNotFound,
    TableAlreadyExists,
    ConditionalCheckFailed,
    UnresolvedPlaceholder,
    TypeMismatch,
    InternalError
};

const std::error_category& rynamo_error_category() noexcept;
std::error_code make_error_code(Errc value) noexcept;

// Wire-level exception name reported to clients for an error code.
const char* exception_name(std::error_code error) noexcept;

enum class DiagnosticSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

template <typename T>
struct OperationResult final {
    std::error_code error{};
    std::string message{};
    DiagnosticSeverity severity = DiagnosticSeverity::Info;
    std::vector<std::string> remediation_hints{};
    std::optional<T> value{};

    [[nodiscard]] bool success() const noexcept
    {
        return !error;
    }
};

DiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept;
std::vector<std::string> default_remediation_hints(std::error_code error);

template <typename T>
OperationResult<T> make_success(T value)
{
    OperationResult<T> result{};
    result.severity = DiagnosticSeverity::Info;
    result.value = std::move(value);
    return result;
}

template <typename T>
OperationResult<T> make_failure(std::error_code error, std::string message = {})
{
    OperationResult<T> result{};
    result.error = error;
    result.message = std::move(message);
    result.severity = default_diagnostic_severity(result.error);
    result.remediation_hints = default_remediation_hints(result.error);
    return result;
}

template <typename T, typename U>
OperationResult<T> forward_failure(const OperationResult<U>& other)
{
    OperationResult<T> result{};
    result.error = other.error;
    result.message = other.message;
    result.severity = other.severity;
    result.remediation_hints = other.remediation_hints;
    return result;
}

}  // namespace rynamo

namespace std {

template <>
struct is_error_code_enum<rynamo::Errc> : true_type {
};

}  // namespace std
