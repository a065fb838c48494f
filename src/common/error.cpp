#include "rynamo/common/error.hpp"

namespace rynamo {

namespace {

class RynamoErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rynamo";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<Errc>(condition)) {
        case Errc::Success:
            return "success";
        case Errc::ParseError:
            return "expression parse error";
        case Errc::ValidationError:
            return "validation error";
        case Errc::ResourceNotFound:
            return "requested resource not found";
        case Errc::TableAlreadyExists:
            return "table already exists";
        case Errc::ConditionalCheckFailed:
            return "the conditional request failed";
        case Errc::UnresolvedPlaceholder:
            return "unresolved expression placeholder";
        case Errc::TypeMismatch:
            return "operand type mismatch";
        case Errc::InternalError:
            return "internal error";
        default:
            return "unknown rynamo error";
        }
    }
};

const RynamoErrorCategory kCategory{};

}  // namespace

const std::error_category& rynamo_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(Errc value) noexcept
{
    return {static_cast<int>(value), rynamo_error_category()};
}

const char* exception_name(std::error_code error) noexcept
{
    if (!error) {
        return "";
    }
    if (error.category() != rynamo_error_category()) {
        return "InternalServerError";
    }

    switch (static_cast<Errc>(error.value())) {
    case Errc::ResourceNotFound:
        return "ResourceNotFoundException";
    case Errc::TableAlreadyExists:
        return "ResourceInUseException";
    case Errc::ConditionalCheckFailed:
        return "ConditionalCheckFailedException";
    case Errc::ParseError:
    case Errc::ValidationError:
    case Errc::UnresolvedPlaceholder:
    case Errc::TypeMismatch:
        return "ValidationException";
    default:
        return "InternalServerError";
    }
}

DiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept
{
    if (!error) {
        return DiagnosticSeverity::Info;
    }
    if (error.category() != rynamo_error_category()) {
        return DiagnosticSeverity::Error;
    }

    switch (static_cast<Errc>(error.value())) {
    case Errc::Success:
        return DiagnosticSeverity::Info;
    case Errc::ResourceNotFound:
    case Errc::TableAlreadyExists:
    case Errc::ConditionalCheckFailed:
        return DiagnosticSeverity::Warning;
    default:
        return DiagnosticSeverity::Error;
    }
}

std::vector<std::string> default_remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != rynamo_error_category()) {
        return {"Inspect server logs for additional details."};
    }

    switch (static_cast<Errc>(error.value())) {
    case Errc::Success:
        return {};
    case Errc::ParseError:
        return {"Check the expression near the reported column for typos or unsupported syntax."};
    case Errc::ValidationError:
        return {"Review the validation message and adjust the request parameters."};
    case Errc::ResourceNotFound:
        return {"Confirm the table name is spelled correctly and the table has been created."};
    case Errc::TableAlreadyExists:
        return {"Delete the existing table or choose a different table name."};
    case Errc::ConditionalCheckFailed:
        return {"Re-read the item and retry with a condition that matches its current state."};
    case Errc::UnresolvedPlaceholder:
        return {"Supply every #name and :value referenced by the expression in the request bindings."};
    case Errc::TypeMismatch:
        return {"Check the number and types of the function arguments."};
    default:
        return {"Inspect server logs for additional details."};
    }
}

}  // namespace rynamo
