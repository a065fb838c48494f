#include "rynamo/shell/value_literal.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/shell/literal_grammar.hpp"

#include <tao/pegtl.hpp>

#include <cctype>

namespace rynamo::shell {

namespace pegtl = tao::pegtl;

namespace {

struct value_document : pegtl::seq<literal::ws, literal::value, literal::ws, pegtl::eof> {
};

std::string quote(std::string_view text)
{
    std::string quoted;
    quoted.reserve(text.size() + 2U);
    quoted.push_back('"');
    for (const char ch : text) {
        switch (ch) {
        case '"':
            quoted += "\\\"";
            break;
        case '\\':
            quoted += "\\\\";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\t':
            quoted += "\\t";
            break;
        case '\r':
            quoted += "\\r";
            break;
        default:
            quoted.push_back(ch);
            break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

bool is_plain_key(std::string_view key)
{
    if (key.empty()) {
        return false;
    }
    for (const char ch : key) {
        const auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) == 0 && ch != '_' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

template <typename Container, typename Render>
std::string join(const Container& values, Render render)
{
    std::string text;
    for (const auto& value : values) {
        if (!text.empty()) {
            text += ", ";
        }
        text += render(value);
    }
    return text;
}

std::string render_entries(const AttributeMap& entries)
{
    std::string text;
    for (const auto& [key, value] : entries) {
        if (!text.empty()) {
            text += ", ";
        }
        text += render_key(key);
        text += ": ";
        text += render_value(value);
    }
    return text;
}

}  // namespace

std::error_code parse_value_literal(std::string_view text, AttributeValue& out, std::string& message)
{
    literal::LiteralState state{};
    pegtl::memory_input in(text.data(), text.size(), "value literal");
    try {
        if (!pegtl::parse<value_document, literal::literal_action, literal::literal_control>(in, state) || state.completed.size() != 1U) {
            message = "invalid value literal '" + std::string{text} + "'";
            return make_error_code(Errc::ParseError);
        }
    } catch (const pegtl::parse_error& error) {
        message = error.message();
        return make_error_code(Errc::ParseError);
    }
    out = state.take_completed();
    return {};
}

std::error_code parse_item_literal(std::string_view text, Item& out, std::string& message)
{
    AttributeValue value{};
    if (auto error = parse_value_literal(text, value, message)) {
        return error;
    }
    if (value.type() != AttributeType::Map) {
        message = "expected a map literal for the item";
        return make_error_code(Errc::ParseError);
    }
    out = std::move(value.as_map());
    return {};
}

std::string render_key(std::string_view key)
{
    return is_plain_key(key) ? std::string{key} : quote(key);
}

std::string render_value(const AttributeValue& value)
{
    switch (value.type()) {
    case AttributeType::String:
        return "S" + quote(value.as_string());
    case AttributeType::Number:
        return "N\"" + value.as_number().to_string() + "\"";
    case AttributeType::Binary:
        return "B\"" + base64_encode(value.as_binary()) + "\"";
    case AttributeType::Boolean:
        return value.as_bool() ? "BOOL true" : "BOOL false";
    case AttributeType::Null:
        return "NULL";
    case AttributeType::List:
        return "L[" + join(value.as_list(), [](const AttributeValue& element) { return render_value(element); }) + "]";
    case AttributeType::Map:
        return "M{" + render_entries(value.as_map()) + "}";
    case AttributeType::StringSet:
        return "SS[" + join(value.as_string_set(), [](const std::string& element) { return quote(element); }) + "]";
    case AttributeType::NumberSet:
        return "NS[" + join(value.as_number_set(), [](const Decimal& element) { return "\"" + element.to_string() + "\""; }) + "]";
    case AttributeType::BinarySet:
        return "BS[" + join(value.as_binary_set(), [](const std::string& element) { return "\"" + base64_encode(element) + "\""; }) + "]";
    }
    return {};
}

std::string render_item(const Item& item)
{
    return "{" + render_entries(item) + "}";
}

}  // namespace rynamo::shell
