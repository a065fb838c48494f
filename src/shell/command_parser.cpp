#include "rynamo/shell/command_parser.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/expression/expression_primitives.hpp"
#include "rynamo/shell/literal_grammar.hpp"

#include <tao/pegtl.hpp>

#include <charconv>
#include <limits>
#include <utility>

namespace rynamo::shell {

namespace pegtl = tao::pegtl;

namespace rules {

using expression::rules::keyword;
using literal::ws;

struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {
};
struct kw_describe : keyword<'D', 'E', 'S', 'C', 'R', 'I', 'B', 'E'> {
};
struct kw_drop : keyword<'D', 'R', 'O', 'P'> {
};
struct kw_list : keyword<'L', 'I', 'S', 'T'> {
};
struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {
};
struct kw_tables : keyword<'T', 'A', 'B', 'L', 'E', 'S'> {
};
struct kw_hash : keyword<'H', 'A', 'S', 'H'> {
};
struct kw_range : keyword<'R', 'A', 'N', 'G', 'E'> {
};
struct kw_put : keyword<'P', 'U', 'T'> {
};
struct kw_get : keyword<'G', 'E', 'T'> {
};
struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {
};
struct kw_update : keyword<'U', 'P', 'D', 'A', 'T', 'E'> {
};
struct kw_query : keyword<'Q', 'U', 'E', 'R', 'Y'> {
};
struct kw_scan : keyword<'S', 'C', 'A', 'N'> {
};
struct kw_if : keyword<'I', 'F'> {
};
struct kw_using : keyword<'U', 'S', 'I', 'N', 'G'> {
};
struct kw_filter : keyword<'F', 'I', 'L', 'T', 'E', 'R'> {
};
struct kw_limit : keyword<'L', 'I', 'M', 'I', 'T'> {
};
struct kw_from : keyword<'F', 'R', 'O', 'M'> {
};
struct kw_desc : keyword<'D', 'E', 'S', 'C'> {
};
struct kw_return : keyword<'R', 'E', 'T', 'U', 'R', 'N'> {
};
struct kw_all_new : keyword<'A', 'L', 'L', '_', 'N', 'E', 'W'> {
};
struct kw_all_old : keyword<'A', 'L', 'L', '_', 'O', 'L', 'D'> {
};
struct kw_none : keyword<'N', 'O', 'N', 'E'> {
};

struct name_chars : pegtl::plus<pegtl::sor<pegtl::alnum, pegtl::one<'_', '-', '.'>>> {
};

struct table_name : name_chars {
};
struct from_table_name : name_chars {
};
struct hash_name : name_chars {
};
struct hash_type : pegtl::plus<pegtl::alpha> {
};
struct range_name : name_chars {
};
struct range_type : pegtl::plus<pegtl::alpha> {
};

struct quoted_text : pegtl::seq<pegtl::one<'\''>, pegtl::star<expression::rules::string_literal_char>, pegtl::must<pegtl::one<'\''>>> {
};

struct condition_text : quoted_text {
};
struct filter_text : quoted_text {
};
struct update_text : quoted_text {
};
struct key_condition_text : quoted_text {
};

struct item_literal : literal::value {
};
struct key_literal : literal::value {
};
struct start_key_literal : literal::value {
};

struct limit_number : pegtl::plus<pegtl::digit> {
};

struct binding_colon : pegtl::one<':'> {
};
struct name_key : pegtl::seq<pegtl::one<'#'>, pegtl::plus<pegtl::identifier_other>> {
};
struct name_target : pegtl::seq<pegtl::one<'"'>, pegtl::star<literal::quoted_char>, pegtl::must<literal::closing_quote>> {
};
struct value_key : pegtl::seq<pegtl::one<':'>, pegtl::plus<pegtl::identifier_other>> {
};
struct binding_value : literal::value {
};
struct name_binding : pegtl::seq<name_key, ws, pegtl::must<binding_colon>, ws, pegtl::must<name_target>> {
};
struct value_binding : pegtl::seq<value_key, ws, pegtl::must<binding_colon>, ws, pegtl::must<binding_value>> {
};
struct binding : pegtl::sor<name_binding, value_binding> {
};
struct bindings_open : pegtl::one<'{'> {
};
struct bindings_close : pegtl::one<'}'> {
};
struct bindings : pegtl::seq<pegtl::must<bindings_open>, ws, pegtl::opt<pegtl::list<binding, literal::comma>>, ws, pegtl::must<bindings_close>> {
};

struct if_clause : pegtl::if_must<kw_if, ws, condition_text> {
};
struct using_clause : pegtl::if_must<kw_using, ws, bindings> {
};
struct filter_clause : pegtl::if_must<kw_filter, ws, filter_text> {
};
struct limit_clause : pegtl::if_must<kw_limit, ws, limit_number> {
};
struct desc_clause : kw_desc {
};
struct from_key_clause : pegtl::if_must<kw_from, ws, start_key_literal> {
};
struct from_table_clause : pegtl::if_must<kw_from, ws, from_table_name> {
};
struct return_all_new : kw_all_new {
};
struct return_all_old : kw_all_old {
};
struct return_none : kw_none {
};
struct return_mode : pegtl::sor<return_all_new, return_all_old, return_none> {
};
struct return_clause : pegtl::if_must<kw_return, ws, return_mode> {
};

template <typename... Clauses>
struct clauses : pegtl::star<ws, pegtl::sor<Clauses...>> {
};

struct range_clause : pegtl::if_must<kw_range, ws, range_name, ws, range_type> {
};

struct create_table : pegtl::if_must<kw_create,
                                     ws,
                                     kw_table,
                                     ws,
                                     table_name,
                                     ws,
                                     kw_hash,
                                     ws,
                                     hash_name,
                                     ws,
                                     hash_type,
                                     pegtl::opt<ws, range_clause>> {
};
struct describe_table : pegtl::if_must<kw_describe, ws, kw_table, ws, table_name> {
};
struct drop_table : pegtl::if_must<kw_drop, ws, kw_table, ws, table_name> {
};
struct list_tables : pegtl::if_must<kw_list, ws, kw_tables, clauses<limit_clause, from_table_clause>> {
};
struct put_item : pegtl::if_must<kw_put, ws, table_name, ws, item_literal, clauses<if_clause, using_clause>> {
};
struct get_item : pegtl::if_must<kw_get, ws, table_name, ws, key_literal> {
};
struct delete_item : pegtl::if_must<kw_delete, ws, table_name, ws, key_literal, clauses<if_clause, using_clause>> {
};
struct update_item
    : pegtl::if_must<kw_update, ws, table_name, ws, key_literal, ws, update_text, clauses<if_clause, using_clause, return_clause>> {
};
struct query_items : pegtl::if_must<kw_query,
                                    ws,
                                    table_name,
                                    ws,
                                    key_condition_text,
                                    clauses<filter_clause, using_clause, limit_clause, desc_clause, from_key_clause>> {
};
struct scan_items : pegtl::if_must<kw_scan, ws, table_name, clauses<filter_clause, using_clause, limit_clause, from_key_clause>> {
};

struct statement : pegtl::sor<create_table,
                              describe_table,
                              drop_table,
                              list_tables,
                              put_item,
                              get_item,
                              delete_item,
                              update_item,
                              query_items,
                              scan_items> {
};

struct statement_end : pegtl::seq<ws, pegtl::opt<pegtl::one<';'>>, ws, pegtl::eof> {
};

struct command : pegtl::seq<ws, pegtl::must<statement>, pegtl::must<statement_end>> {
};

}  // namespace rules

namespace {

template <typename Rule>
inline constexpr const char* error_message = nullptr;

template <>
inline constexpr const char* error_message<rules::statement> =
    "expected CREATE TABLE, DESCRIBE TABLE, DROP TABLE, LIST TABLES, PUT, GET, DELETE, UPDATE, QUERY or SCAN";
template <>
inline constexpr const char* error_message<rules::statement_end> = "unexpected trailing input";
template <>
inline constexpr const char* error_message<rules::kw_table> = "expected 'TABLE'";
template <>
inline constexpr const char* error_message<rules::kw_tables> = "expected 'TABLES'";
template <>
inline constexpr const char* error_message<rules::kw_hash> = "expected 'HASH' key definition";
template <>
inline constexpr const char* error_message<rules::table_name> = "expected table name";
template <>
inline constexpr const char* error_message<rules::from_table_name> = "expected table name";
template <>
inline constexpr const char* error_message<rules::hash_name> = "expected key attribute name";
template <>
inline constexpr const char* error_message<rules::range_name> = "expected key attribute name";
template <>
inline constexpr const char* error_message<rules::hash_type> = "expected key type S, N or B";
template <>
inline constexpr const char* error_message<rules::range_type> = "expected key type S, N or B";
template <>
inline constexpr const char* error_message<rules::item_literal> = "expected item literal";
template <>
inline constexpr const char* error_message<rules::key_literal> = "expected key literal";
template <>
inline constexpr const char* error_message<rules::start_key_literal> = "expected start key literal";
template <>
inline constexpr const char* error_message<rules::binding_value> = "expected value literal";
template <>
inline constexpr const char* error_message<rules::condition_text> = "expected quoted condition expression";
template <>
inline constexpr const char* error_message<rules::filter_text> = "expected quoted filter expression";
template <>
inline constexpr const char* error_message<rules::update_text> = "expected quoted update expression";
template <>
inline constexpr const char* error_message<rules::key_condition_text> = "expected quoted key condition expression";
template <>
inline constexpr const char* error_message<pegtl::one<'\''>> = "expected closing quote";
template <>
inline constexpr const char* error_message<rules::limit_number> = "expected limit";
template <>
inline constexpr const char* error_message<rules::binding_colon> = "expected ':' after placeholder";
template <>
inline constexpr const char* error_message<rules::name_target> = "expected quoted attribute name";
template <>
inline constexpr const char* error_message<rules::bindings_open> = "expected '{' to start bindings";
template <>
inline constexpr const char* error_message<rules::bindings_close> = "expected '}' to close bindings";
template <>
inline constexpr const char* error_message<rules::bindings> = "expected placeholder bindings";
template <>
inline constexpr const char* error_message<rules::return_mode> = "expected ALL_NEW, ALL_OLD or NONE";

template <typename Rule>
struct command_control : pegtl::normal<Rule> {
    template <typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&... states)
    {
        if constexpr (error_message<Rule> != nullptr) {
            throw pegtl::parse_error(error_message<Rule>, in);
        } else {
            literal::literal_control<Rule>::raise(in, states...);
        }
    }
};

struct CommandState : literal::LiteralState {
    ShellCommand command{};
    std::string pending_key{};
};

std::string unquote_single(std::string_view text)
{
    std::string result;
    if (text.size() < 2U) {
        return result;
    }
    const auto body = text.substr(1U, text.size() - 2U);
    result.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        result.push_back(body[index]);
        if (body[index] == '\'' && index + 1U < body.size() && body[index + 1U] == '\'') {
            ++index;
        }
    }
    return result;
}

template <typename Input>
Item take_map(const Input& in, CommandState& state, const char* what)
{
    auto value = state.take_completed();
    if (value.type() != AttributeType::Map) {
        throw pegtl::parse_error(std::string{"expected a map literal for the "} + what, in);
    }
    return std::move(value.as_map());
}

template <typename Input>
catalog::KeyAttribute make_key(const Input& in, std::string name, std::string_view type_text)
{
    const auto type = catalog::parse_scalar_attribute_type(type_text);
    if (!type) {
        throw pegtl::parse_error("expected key type S, N or B", in);
    }
    return catalog::KeyAttribute{.name = std::move(name), .type = *type};
}

template <typename Rule>
struct command_action : literal::literal_action<Rule> {
};

template <CommandKind Value>
struct kind_action {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.kind = Value;
    }
};

template <>
struct command_action<rules::kw_create> : kind_action<CommandKind::CreateTable> {
};
template <>
struct command_action<rules::kw_describe> : kind_action<CommandKind::DescribeTable> {
};
template <>
struct command_action<rules::kw_drop> : kind_action<CommandKind::DropTable> {
};
template <>
struct command_action<rules::kw_list> : kind_action<CommandKind::ListTables> {
};
template <>
struct command_action<rules::kw_put> : kind_action<CommandKind::Put> {
};
template <>
struct command_action<rules::kw_get> : kind_action<CommandKind::Get> {
};
template <>
struct command_action<rules::kw_delete> : kind_action<CommandKind::Delete> {
};
template <>
struct command_action<rules::kw_update> : kind_action<CommandKind::Update> {
};
template <>
struct command_action<rules::kw_query> : kind_action<CommandKind::Query> {
};
template <>
struct command_action<rules::kw_scan> : kind_action<CommandKind::Scan> {
};

template <>
struct command_action<rules::table_name> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.table_name = in.string();
    }
};

template <>
struct command_action<rules::from_table_name> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.from_table = in.string();
    }
};

template <>
struct command_action<rules::hash_name> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.pending_key = in.string();
    }
};

template <>
struct command_action<rules::hash_type> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.hash_key = make_key(in, std::move(state.pending_key), in.string_view());
    }
};

template <>
struct command_action<rules::range_name> : command_action<rules::hash_name> {
};

template <>
struct command_action<rules::range_type> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.range_key = make_key(in, std::move(state.pending_key), in.string_view());
    }
};

template <>
struct command_action<rules::condition_text> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.condition = unquote_single(in.string_view());
    }
};

template <>
struct command_action<rules::filter_text> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.filter = unquote_single(in.string_view());
    }
};

template <>
struct command_action<rules::update_text> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.expression = unquote_single(in.string_view());
    }
};

template <>
struct command_action<rules::key_condition_text> : command_action<rules::update_text> {
};

template <>
struct command_action<rules::item_literal> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.item = take_map(in, state, "item");
    }
};

template <>
struct command_action<rules::key_literal> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.item = take_map(in, state, "key");
    }
};

template <>
struct command_action<rules::start_key_literal> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.start_key = take_map(in, state, "start key");
    }
};

template <>
struct command_action<rules::limit_number> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        const auto text = in.string_view();
        std::uint32_t limit = 0U;
        const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), limit);
        if (error != std::errc{} || end != text.data() + text.size()) {
            throw pegtl::parse_error("limit must be at most " + std::to_string(std::numeric_limits<std::uint32_t>::max()), in);
        }
        state.command.limit = limit;
    }
};

template <>
struct command_action<rules::desc_clause> {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.scan_forward = false;
    }
};

template <>
struct command_action<rules::return_all_new> {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.return_values = storage::ReturnValues::AllNew;
    }
};

template <>
struct command_action<rules::return_all_old> {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.return_values = storage::ReturnValues::AllOld;
    }
};

template <>
struct command_action<rules::return_none> {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.return_values = storage::ReturnValues::None;
    }
};

template <>
struct command_action<rules::name_key> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.pending_key = in.string();
    }
};

template <>
struct command_action<rules::name_target> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, CommandState& state)
    {
        state.command.bindings.names.insert_or_assign(std::move(state.pending_key), literal::unescape_quoted(in.string_view()));
    }
};

template <>
struct command_action<rules::value_key> : command_action<rules::name_key> {
};

template <>
struct command_action<rules::binding_value> {
    template <typename ActionInput>
    static void apply(const ActionInput&, CommandState& state)
    {
        state.command.bindings.values.insert_or_assign(std::move(state.pending_key), state.take_completed());
    }
};

expression::ParserDiagnostic make_diagnostic(const pegtl::parse_error& error, std::string_view source)
{
    expression::ParserDiagnostic diagnostic{};
    diagnostic.severity = expression::ParserSeverity::Error;
    diagnostic.message = error.message();
    diagnostic.expression = std::string{source};
    diagnostic.remediation_hints = {"Type \\help for the command syntax."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);
        diagnostic.byte_offset = static_cast<std::size_t>(position.byte);
        auto begin = diagnostic.byte_offset;
        while (begin < source.size() && (source[begin] == ' ' || source[begin] == '\n' || source[begin] == '\t')) {
            ++begin;
        }
        if (begin < source.size()) {
            auto end = begin;
            while (end < source.size() && source[end] != ' ' && source[end] != '\n' && source[end] != '\t') {
                ++end;
            }
            diagnostic.fragment = std::string{source.substr(begin, end - begin)};
            diagnostic.message += " near '" + diagnostic.fragment + "'";
        } else {
            diagnostic.message += " at end of input";
        }
    }
    return diagnostic;
}

}  // namespace

const char* to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::CreateTable:
        return "create_table";
    case CommandKind::DescribeTable:
        return "describe_table";
    case CommandKind::DropTable:
        return "drop_table";
    case CommandKind::ListTables:
        return "list_tables";
    case CommandKind::Put:
        return "put_item";
    case CommandKind::Get:
        return "get_item";
    case CommandKind::Delete:
        return "delete_item";
    case CommandKind::Update:
        return "update_item";
    case CommandKind::Query:
        return "query";
    case CommandKind::Scan:
        return "scan";
    }
    return "unknown";
}

CommandParseResult parse_command(std::string_view text)
{
    CommandParseResult result{};
    CommandState state{};
    pegtl::memory_input in(text.data(), text.size(), "shell command");

    try {
        if (!pegtl::parse<rules::command, command_action, command_control>(in, state)) {
            result.error = make_error_code(Errc::ParseError);
            result.diagnostics.push_back(expression::ParserDiagnostic{
                .severity = expression::ParserSeverity::Error,
                .message = "input did not match the shell command grammar",
                .line = 1U,
                .column = 1U,
                .expression = std::string{text},
            });
            return result;
        }
    } catch (const pegtl::parse_error& error) {
        result.error = make_error_code(Errc::ParseError);
        result.diagnostics.push_back(make_diagnostic(error, text));
        return result;
    }

    result.command = std::move(state.command);
    return result;
}

}  // namespace rynamo::shell
