#include "rynamo/common/validation.hpp"

#include <cctype>

namespace rynamo {

namespace {

bool is_valid_table_name_char(unsigned char ch) noexcept
{
    return std::isalnum(ch) != 0 || ch == '_' || ch == '-' || ch == '.';
}

const char* empty_set_message(AttributeType type) noexcept
{
    switch (type) {
    case AttributeType::StringSet:
        return "One or more parameter values were invalid: An string set  may not be empty";
    case AttributeType::NumberSet:
        return "One or more parameter values were invalid: An number set  may not be empty";
    default:
        return "One or more parameter values were invalid: Binary sets should not be empty";
    }
}

}  // namespace

bool is_valid_table_name(std::string_view name) noexcept
{
    if (name.size() < kMinTableNameLength || name.size() > kMaxTableNameLength) {
        return false;
    }
    for (char ch : name) {
        if (!is_valid_table_name_char(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::error_code validate_table_name(std::string_view name, std::string& message)
{
    if (is_valid_table_name(name)) {
        return {};
    }
    if (name.size() < kMinTableNameLength || name.size() > kMaxTableNameLength) {
        message = "TableName must be at least 3 characters long and at most 255 characters long";
    } else {
        message = "1 validation error detected: Value '" + std::string{name}
                  + "' at 'tableName' failed to satisfy constraint: Member must satisfy regular expression pattern: [a-zA-Z0-9_.-]+";
    }
    return make_error_code(Errc::ValidationError);
}

std::error_code validate_attribute_value(const AttributeValue& value, std::string& message)
{
    switch (value.type()) {
    case AttributeType::StringSet:
    case AttributeType::NumberSet:
    case AttributeType::BinarySet:
        if (value.cardinality() == 0U) {
            message = empty_set_message(value.type());
            return make_error_code(Errc::ValidationError);
        }
        return {};
    case AttributeType::List:
        for (const auto& element : value.as_list()) {
            if (auto ec = validate_attribute_value(element, message)) {
                return ec;
            }
        }
        return {};
    case AttributeType::Map:
        for (const auto& [name, element] : value.as_map()) {
            if (auto ec = validate_attribute_value(element, message)) {
                return ec;
            }
        }
        return {};
    default:
        return {};
    }
}

std::error_code validate_item(const Item& item, std::string& message)
{
    for (const auto& [name, value] : item) {
        if (name.empty()) {
            message = "One or more parameter values were invalid: An attribute name cannot be empty";
            return make_error_code(Errc::ValidationError);
        }
        if (auto ec = validate_attribute_value(value, message)) {
            return ec;
        }
    }
    if (item_size(item) > kMaxItemSizeBytes) {
        message = "Item size has exceeded the maximum allowed size";
        return make_error_code(Errc::ValidationError);
    }
    return {};
}

std::error_code ensure_exists(bool exists, Errc error_if_missing) noexcept
{
    if (exists) {
        return {};
    }
    return make_error_code(error_if_missing);
}

std::error_code ensure_absent(bool present, Errc error_if_present) noexcept
{
    if (!present) {
        return {};
    }
    return make_error_code(error_if_present);
}

}  // namespace rynamo
