#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/base64.hpp"
#include "rynamo/common/decimal.hpp"

#include <tao/pegtl.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Typed value literals shared by the shell command grammar:
//   S"text"  N"12.5"  B"aGk="  BOOL true  NULL
//   L[...]  M{name: value, ...}  SS["a"]  NS["1"]  BS["aGk="]
// A bare [...] is a list and a bare {...} is a map.
namespace rynamo::shell::literal {

namespace pegtl = tao::pegtl;

struct ws : pegtl::star<pegtl::space> {
};

struct comma : pegtl::seq<ws, pegtl::one<','>, ws> {
};

struct escape_sequence : pegtl::seq<pegtl::one<'\\'>, pegtl::one<'"', '\\', 'n', 't', 'r', '/'>> {
};

struct quoted_char : pegtl::sor<escape_sequence, pegtl::not_one<'"', '\\'>> {
};

struct closing_quote : pegtl::one<'"'> {
};

struct quoted : pegtl::seq<pegtl::one<'"'>, pegtl::star<quoted_char>, pegtl::must<closing_quote>> {
};

template <char... Cs>
struct word : pegtl::seq<pegtl::string<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct value;

struct string_value : pegtl::seq<pegtl::one<'S'>, quoted> {
};

struct number_value : pegtl::seq<pegtl::one<'N'>, quoted> {
};

struct binary_value : pegtl::seq<pegtl::one<'B'>, quoted> {
};

struct true_value : word<'t', 'r', 'u', 'e'> {
};

struct false_value : word<'f', 'a', 'l', 's', 'e'> {
};

struct boolean_operand : pegtl::sor<true_value, false_value> {
};

struct boolean_value : pegtl::seq<word<'B', 'O', 'O', 'L'>, ws, pegtl::must<boolean_operand>> {
};

struct null_value : word<'N', 'U', 'L', 'L'> {
};

struct list_open : pegtl::one<'['> {
};

struct list_close : pegtl::one<']'> {
};

struct list_elements : pegtl::opt<pegtl::list<value, comma>> {
};

struct list_value : pegtl::seq<pegtl::opt<pegtl::one<'L'>>, list_open, ws, list_elements, ws, pegtl::must<list_close>> {
};

struct map_open : pegtl::one<'{'> {
};

struct map_close : pegtl::one<'}'> {
};

struct map_key : pegtl::sor<quoted, pegtl::plus<pegtl::sor<pegtl::identifier_other, pegtl::one<'-', '.'>>>> {
};

struct map_colon : pegtl::one<':'> {
};

struct map_entry : pegtl::seq<map_key, ws, pegtl::must<map_colon>, ws, pegtl::must<value>> {
};

struct map_entries : pegtl::opt<pegtl::list<map_entry, comma>> {
};

struct map_value : pegtl::seq<pegtl::opt<pegtl::one<'M'>>, map_open, ws, map_entries, ws, pegtl::must<map_close>> {
};

struct string_element : quoted {
};

struct number_element : quoted {
};

struct binary_element : quoted {
};

template <char Tag, typename Element>
struct set_of : pegtl::seq<pegtl::one<Tag>,
                           pegtl::one<'S'>,
                           list_open,
                           ws,
                           pegtl::opt<pegtl::list<Element, comma>>,
                           ws,
                           pegtl::must<list_close>> {
};

struct string_set_value : set_of<'S', string_element> {
};

struct number_set_value : set_of<'N', number_element> {
};

struct binary_set_value : set_of<'B', binary_element> {
};

struct value : pegtl::sor<string_set_value,
                          number_set_value,
                          binary_set_value,
                          boolean_value,
                          null_value,
                          string_value,
                          number_value,
                          binary_value,
                          list_value,
                          map_value> {
};

template <typename Rule>
inline constexpr const char* error_message = nullptr;

template <>
inline constexpr const char* error_message<closing_quote> = "expected closing '\"'";
template <>
inline constexpr const char* error_message<boolean_operand> = "expected true or false";
template <>
inline constexpr const char* error_message<list_close> = "expected ']'";
template <>
inline constexpr const char* error_message<map_close> = "expected '}'";
template <>
inline constexpr const char* error_message<map_colon> = "expected ':' after map key";
template <>
inline constexpr const char* error_message<value> = "expected value literal";

template <typename Rule>
struct literal_control : pegtl::normal<Rule> {
    template <typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&... states)
    {
        if constexpr (error_message<Rule> != nullptr) {
            throw pegtl::parse_error(error_message<Rule>, in);
        } else {
            pegtl::normal<Rule>::raise(in, states...);
        }
    }
};

// Collection under construction. Scalars are appended to the innermost frame.
struct Frame final {
    enum class Kind : std::uint8_t {
        List = 0,
        Map,
        StringSet,
        NumberSet,
        BinarySet
    };

    Kind kind = Kind::List;
    AttributeList values{};
    AttributeMap entries{};
    std::vector<std::string> strings{};
    std::vector<Decimal> numbers{};
    std::vector<std::string> keys{};
};

struct LiteralState {
    std::vector<Frame> frames{};
    std::vector<AttributeValue> completed{};
    std::string text{};

    void emit(AttributeValue value)
    {
        if (frames.empty()) {
            completed.push_back(std::move(value));
            return;
        }
        auto& frame = frames.back();
        if (frame.kind == Frame::Kind::Map && !frame.keys.empty()) {
            frame.entries.insert_or_assign(std::move(frame.keys.back()), std::move(value));
            frame.keys.pop_back();
            return;
        }
        frame.values.push_back(std::move(value));
    }

    AttributeValue take_completed()
    {
        auto value = std::move(completed.back());
        completed.pop_back();
        return value;
    }
};

inline std::string unescape_quoted(std::string_view quoted_text)
{
    std::string text;
    if (quoted_text.size() < 2U) {
        return text;
    }
    const auto body = quoted_text.substr(1U, quoted_text.size() - 2U);
    text.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        const char ch = body[index];
        if (ch != '\\' || index + 1U >= body.size()) {
            text.push_back(ch);
            continue;
        }
        const char escaped = body[++index];
        switch (escaped) {
        case 'n':
            text.push_back('\n');
            break;
        case 't':
            text.push_back('\t');
            break;
        case 'r':
            text.push_back('\r');
            break;
        default:
            text.push_back(escaped);
            break;
        }
    }
    return text;
}

template <typename Input>
Decimal parse_number_text(const Input& in, const std::string& text)
{
    Decimal number{};
    std::string message;
    if (Decimal::parse(text, number, message)) {
        throw pegtl::parse_error(message, in);
    }
    return number;
}

template <typename Input>
std::string decode_binary_text(const Input& in, const std::string& text)
{
    auto bytes = base64_decode(text);
    if (!bytes) {
        throw pegtl::parse_error("invalid base64 binary value \"" + text + "\"", in);
    }
    return std::move(*bytes);
}

template <typename Rule>
struct literal_action : pegtl::nothing<Rule> {
};

template <>
struct literal_action<quoted> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.text = unescape_quoted(in.string_view());
    }
};

template <>
struct literal_action<string_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        state.emit(AttributeValue::string(std::move(state.text)));
    }
};

template <>
struct literal_action<number_value> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.emit(AttributeValue::number(parse_number_text(in, state.text)));
    }
};

template <>
struct literal_action<binary_value> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.emit(AttributeValue::binary(decode_binary_text(in, state.text)));
    }
};

template <>
struct literal_action<true_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        state.emit(AttributeValue::boolean(true));
    }
};

template <>
struct literal_action<false_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        state.emit(AttributeValue::boolean(false));
    }
};

template <>
struct literal_action<null_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        state.emit(AttributeValue::null());
    }
};

// Every '[' opens a frame: lists and sets share the bracket and the set
// actions retag the frame once the tag is known.
template <>
struct literal_action<list_open> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        state.frames.emplace_back();
    }
};

template <>
struct literal_action<list_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        auto frame = std::move(state.frames.back());
        state.frames.pop_back();
        state.emit(AttributeValue::list(std::move(frame.values)));
    }
};

template <>
struct literal_action<map_open> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        Frame frame{};
        frame.kind = Frame::Kind::Map;
        state.frames.push_back(std::move(frame));
    }
};

template <>
struct literal_action<map_key> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        const auto raw = in.string_view();
        state.frames.back().keys.push_back(!raw.empty() && raw.front() == '"' ? std::move(state.text) : std::string{raw});
    }
};

template <>
struct literal_action<map_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        auto frame = std::move(state.frames.back());
        state.frames.pop_back();
        state.emit(AttributeValue::map(std::move(frame.entries)));
    }
};

template <>
struct literal_action<string_element> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.text = unescape_quoted(in.string_view());
        state.frames.back().strings.push_back(std::move(state.text));
    }
};

template <>
struct literal_action<number_element> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.frames.back().numbers.push_back(parse_number_text(in, unescape_quoted(in.string_view())));
    }
};

template <>
struct literal_action<binary_element> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, LiteralState& state)
    {
        state.frames.back().strings.push_back(decode_binary_text(in, unescape_quoted(in.string_view())));
    }
};

template <>
struct literal_action<string_set_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        auto frame = std::move(state.frames.back());
        state.frames.pop_back();
        state.emit(AttributeValue::string_set(std::move(frame.strings)));
    }
};

template <>
struct literal_action<number_set_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        auto frame = std::move(state.frames.back());
        state.frames.pop_back();
        state.emit(AttributeValue::number_set(std::move(frame.numbers)));
    }
};

template <>
struct literal_action<binary_set_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, LiteralState& state)
    {
        auto frame = std::move(state.frames.back());
        state.frames.pop_back();
        state.emit(AttributeValue::binary_set(std::move(frame.strings)));
    }
};

}  // namespace rynamo::shell::literal
