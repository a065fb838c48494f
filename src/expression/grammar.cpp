#include "rynamo/expression/grammar.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/expression/expression_primitives.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace rynamo::expression {

namespace pegtl = tao::pegtl;

namespace rules {

struct kw_size : function_keyword<'s', 'i', 'z', 'e'> {
};

struct fn_attribute_exists
    : function_keyword<'a', 't', 't', 'r', 'i', 'b', 'u', 't', 'e', '_', 'e', 'x', 'i', 's', 't', 's'> {
};

struct fn_attribute_not_exists
    : function_keyword<'a', 't', 't', 'r', 'i', 'b', 'u', 't', 'e', '_', 'n', 'o', 't', '_', 'e', 'x', 'i', 's', 't', 's'> {
};

struct fn_attribute_type : function_keyword<'a', 't', 't', 'r', 'i', 'b', 'u', 't', 'e', '_', 't', 'y', 'p', 'e'> {
};

struct fn_begins_with : function_keyword<'b', 'e', 'g', 'i', 'n', 's', '_', 'w', 'i', 't', 'h'> {
};

struct fn_contains : function_keyword<'c', 'o', 'n', 't', 'a', 'i', 'n', 's'> {
};

struct condition_function_name
    : pegtl::sor<fn_attribute_exists, fn_attribute_not_exists, fn_attribute_type, fn_begins_with, fn_contains> {
};

struct size_argument : pegtl::sor<value_placeholder, path> {
};

struct size_function : pegtl::seq<kw_size,
                                  optional_space,
                                  pegtl::one<'('>,
                                  optional_space,
                                  pegtl::must<size_argument>,
                                  optional_space,
                                  pegtl::must<pegtl::one<')'>>> {
};

struct size_lookahead : pegtl::seq<kw_size, optional_space, pegtl::one<'('>> {
};

struct operand : pegtl::sor<pegtl::seq<pegtl::at<size_lookahead>, pegtl::must<size_function>>, value_placeholder, path> {
};

struct function_arguments
    : pegtl::seq<operand, pegtl::star<optional_space, pegtl::one<','>, optional_space, pegtl::must<operand>>> {
};

struct function_condition : pegtl::seq<condition_function_name,
                                       optional_space,
                                       pegtl::must<pegtl::one<'('>>,
                                       optional_space,
                                       pegtl::must<function_arguments>,
                                       optional_space,
                                       pegtl::must<pegtl::one<')'>>> {
};

struct function_lookahead : pegtl::seq<condition_function_name, optional_space, pegtl::one<'('>> {
};

struct comparison_rest : pegtl::seq<comparator, optional_space, pegtl::must<operand>> {
};

struct between_rest : pegtl::seq<kw_between,
                                 optional_space,
                                 pegtl::must<operand>,
                                 optional_space,
                                 pegtl::must<kw_and>,
                                 optional_space,
                                 pegtl::must<operand>> {
};

struct condition_tail : pegtl::sor<comparison_rest, between_rest> {
};

struct operand_condition : pegtl::seq<operand, optional_space, pegtl::must<condition_tail>> {
};

struct condition
    : pegtl::sor<pegtl::seq<pegtl::at<function_lookahead>, pegtl::must<function_condition>>, operand_condition> {
};

struct and_rest : pegtl::seq<optional_space, kw_and, optional_space, pegtl::must<condition>> {
};

struct expression_end : pegtl::eof {
};

struct condition_expression
    : pegtl::seq<optional_space, pegtl::must<condition>, pegtl::star<and_rest>, optional_space, pegtl::must<expression_end>> {
};

struct kw_set : keyword<'S', 'E', 'T'> {
};

struct kw_remove : keyword<'R', 'E', 'M', 'O', 'V', 'E'> {
};

struct kw_add : keyword<'A', 'D', 'D'> {
};

struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {
};

struct kw_if_not_exists : function_keyword<'i', 'f', '_', 'n', 'o', 't', '_', 'e', 'x', 'i', 's', 't', 's'> {
};

struct kw_list_append : function_keyword<'l', 'i', 's', 't', '_', 'a', 'p', 'p', 'e', 'n', 'd'> {
};

struct set_operand;

struct if_not_exists_function : pegtl::seq<kw_if_not_exists,
                                           optional_space,
                                           pegtl::one<'('>,
                                           optional_space,
                                           pegtl::must<path>,
                                           optional_space,
                                           pegtl::must<pegtl::one<','>>,
                                           optional_space,
                                           pegtl::must<set_operand>,
                                           optional_space,
                                           pegtl::must<pegtl::one<')'>>> {
};

struct list_append_function : pegtl::seq<kw_list_append,
                                         optional_space,
                                         pegtl::one<'('>,
                                         optional_space,
                                         pegtl::must<set_operand>,
                                         optional_space,
                                         pegtl::must<pegtl::one<','>>,
                                         optional_space,
                                         pegtl::must<set_operand>,
                                         optional_space,
                                         pegtl::must<pegtl::one<')'>>> {
};

struct if_not_exists_lookahead : pegtl::seq<kw_if_not_exists, optional_space, pegtl::one<'('>> {
};

struct list_append_lookahead : pegtl::seq<kw_list_append, optional_space, pegtl::one<'('>> {
};

struct set_operand : pegtl::sor<pegtl::seq<pegtl::at<if_not_exists_lookahead>, pegtl::must<if_not_exists_function>>,
                                pegtl::seq<pegtl::at<list_append_lookahead>, pegtl::must<list_append_function>>,
                                value_placeholder,
                                path> {
};

struct op_plus : pegtl::one<'+'> {
};

struct op_minus : pegtl::one<'-'> {
};

struct arithmetic_rest
    : pegtl::seq<optional_space, pegtl::sor<op_plus, op_minus>, optional_space, pegtl::must<set_operand>> {
};

struct set_value : pegtl::seq<set_operand, pegtl::opt<arithmetic_rest>> {
};

struct set_action : pegtl::seq<path, optional_space, pegtl::must<pegtl::one<'='>>, optional_space, pegtl::must<set_value>> {
};

struct remove_action : pegtl::seq<path> {
};

struct add_action : pegtl::seq<path, optional_space, pegtl::must<value_placeholder>> {
};

struct delete_action : pegtl::seq<path, optional_space, pegtl::must<value_placeholder>> {
};

template <typename Keyword, typename Action>
struct update_clause_of
    : pegtl::seq<Keyword,
                 optional_space,
                 pegtl::must<Action>,
                 pegtl::star<optional_space, pegtl::one<','>, optional_space, pegtl::must<Action>>> {
};

struct set_clause : update_clause_of<kw_set, set_action> {
};

struct remove_clause : update_clause_of<kw_remove, remove_action> {
};

struct add_clause : update_clause_of<kw_add, add_action> {
};

struct delete_clause : update_clause_of<kw_delete, delete_action> {
};

struct update_clause : pegtl::sor<set_clause, remove_clause, add_clause, delete_clause> {
};

struct update_expression : pegtl::seq<optional_space,
                                      pegtl::must<update_clause>,
                                      pegtl::star<optional_space, update_clause>,
                                      optional_space,
                                      pegtl::must<expression_end>> {
};

}  // namespace rules

namespace {

template <typename Rule>
inline constexpr const char* error_message = nullptr;

template <>
inline constexpr const char* error_message<rules::operand> = "expected operand";
template <>
inline constexpr const char* error_message<rules::condition> = "expected condition";
template <>
inline constexpr const char* error_message<rules::condition_tail> = "expected comparator or BETWEEN";
template <>
inline constexpr const char* error_message<rules::kw_and> = "expected 'AND'";
template <>
inline constexpr const char* error_message<rules::function_arguments> = "expected function arguments";
template <>
inline constexpr const char* error_message<rules::function_condition> = "expected function call";
template <>
inline constexpr const char* error_message<rules::size_function> = "expected size(path)";
template <>
inline constexpr const char* error_message<rules::size_argument> = "expected path or value placeholder";
template <>
inline constexpr const char* error_message<rules::name_segment> = "expected attribute name";
template <>
inline constexpr const char* error_message<rules::index_digits> = "expected list index";
template <>
inline constexpr const char* error_message<pegtl::one<'('>> = "expected '('";
template <>
inline constexpr const char* error_message<pegtl::one<')'>> = "expected ')'";
template <>
inline constexpr const char* error_message<pegtl::one<']'>> = "expected ']'";
template <>
inline constexpr const char* error_message<pegtl::one<','>> = "expected ','";
template <>
inline constexpr const char* error_message<pegtl::one<'='>> = "expected '='";
template <>
inline constexpr const char* error_message<rules::expression_end> = "unexpected trailing input";
template <>
inline constexpr const char* error_message<rules::path> = "expected document path";
template <>
inline constexpr const char* error_message<rules::value_placeholder> = "expected value placeholder";
template <>
inline constexpr const char* error_message<rules::set_operand> = "expected operand";
template <>
inline constexpr const char* error_message<rules::set_value> = "expected value";
template <>
inline constexpr const char* error_message<rules::set_action> = "expected SET action";
template <>
inline constexpr const char* error_message<rules::remove_action> = "expected document path";
template <>
inline constexpr const char* error_message<rules::add_action> = "expected ADD action";
template <>
inline constexpr const char* error_message<rules::delete_action> = "expected DELETE action";
template <>
inline constexpr const char* error_message<rules::if_not_exists_function> = "expected if_not_exists(path, value)";
template <>
inline constexpr const char* error_message<rules::list_append_function> = "expected list_append(list, list)";
template <>
inline constexpr const char* error_message<rules::update_clause> = "expected SET, REMOVE, ADD or DELETE clause";

template <typename Rule>
struct error_control : pegtl::normal<Rule> {
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

enum class UpdateClause : std::uint8_t {
    Set = 1U,
    Remove = 2U,
    Add = 4U,
    Delete = 8U
};

struct FunctionFrame final {
    ConditionFunction function = ConditionFunction::AttributeExists;
    std::size_t operand_mark = 0U;
};

struct ExpressionParseState final {
    AstArena* arena = nullptr;
    std::vector<PathSegment> segments{};
    std::vector<Operand*> operands{};
    std::vector<Condition*> conditions{};
    std::vector<FunctionFrame> functions{};
    ComparisonOperator pending_comparator = ComparisonOperator::Equal;
    ArithmeticOperator pending_arithmetic = ArithmeticOperator::Add;
    UpdateExpression* update = nullptr;
    std::uint8_t seen_clauses = 0U;

    std::error_code semantic_error{};
    std::string semantic_message{};
    std::size_t semantic_line = 0U;
    std::size_t semantic_column = 0U;
    std::size_t semantic_byte = 0U;
};

Operand* pop_operand(ExpressionParseState& state)
{
    if (state.operands.empty()) {
        throw std::logic_error("expression parser operand stack underflow");
    }
    auto* operand = state.operands.back();
    state.operands.pop_back();
    return operand;
}

Condition* pop_condition(ExpressionParseState& state)
{
    if (state.conditions.empty()) {
        throw std::logic_error("expression parser condition stack underflow");
    }
    auto* condition = state.conditions.back();
    state.conditions.pop_back();
    return condition;
}

template <typename Input>
void record_semantic_error(const Input& in, ExpressionParseState& state, std::string message)
{
    if (state.semantic_error) {
        return;
    }
    const auto position = in.position();
    state.semantic_error = make_error_code(Errc::TypeMismatch);
    state.semantic_message = std::move(message);
    state.semantic_line = static_cast<std::size_t>(position.line);
    state.semantic_column = static_cast<std::size_t>(position.column);
    state.semantic_byte = static_cast<std::size_t>(position.byte);
}

template <typename Input>
void mark_clause(const Input& in, ExpressionParseState& state, UpdateClause clause, const char* name)
{
    const auto bit = static_cast<std::uint8_t>(clause);
    if ((state.seen_clauses & bit) != 0U) {
        throw pegtl::parse_error(std::string{"The \""} + name + "\" section can only be used once in an update expression", in);
    }
    state.seen_clauses = static_cast<std::uint8_t>(state.seen_clauses | bit);
}

std::string describe_arity(ConditionFunction function, std::size_t count)
{
    return std::string{"Invalid ConditionExpression: Incorrect number of operands for operator or function; "}
           + "operator or function: " + function_name(function) + ", number of operands: " + std::to_string(count);
}

std::string validate_function(const FunctionCondition& node)
{
    const auto count = node.arguments.size();
    for (const auto* argument : node.arguments) {
        if (argument->kind == NodeKind::SizeFunction) {
            return std::string{"Invalid ConditionExpression: Incorrect operand type for operator or function; "}
                   + "operator or function: " + function_name(node.function) + ", operand type: N";
        }
    }

    switch (node.function) {
    case ConditionFunction::AttributeExists:
    case ConditionFunction::AttributeNotExists:
        if (count != 1U) {
            return describe_arity(node.function, count);
        }
        if (node.arguments.front()->kind != NodeKind::PathExpression) {
            return std::string{"Invalid ConditionExpression: Operator or function requires a document path; "}
                   + "operator or function: " + function_name(node.function);
        }
        return {};
    case ConditionFunction::AttributeType:
        if (count != 2U) {
            return describe_arity(node.function, count);
        }
        if (node.arguments[0]->kind != NodeKind::PathExpression) {
            return std::string{"Invalid ConditionExpression: Operator or function requires a document path; "}
                   + "operator or function: attribute_type";
        }
        if (node.arguments[1]->kind != NodeKind::ValueReference) {
            return "Invalid ConditionExpression: attribute_type requires a value placeholder as its second operand";
        }
        return {};
    case ConditionFunction::BeginsWith:
    case ConditionFunction::Contains:
        if (count != 2U) {
            return describe_arity(node.function, count);
        }
        return {};
    }
    return {};
}

template <typename Rule>
struct expression_action {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState&)
    {
    }
};

template <>
struct expression_action<rules::name_segment> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        PathSegment segment{};
        segment.kind = PathSegment::Kind::Name;
        segment.name = in.string();
        state.segments.push_back(std::move(segment));
    }
};

template <>
struct expression_action<rules::index_digits> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        const auto text = in.string_view();
        std::size_t index = 0U;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
        if (ec != std::errc{} || end != text.data() + text.size()) {
            throw pegtl::parse_error("list index out of range", in);
        }
        if (state.segments.empty()) {
            throw pegtl::parse_error("list index must follow an attribute name", in);
        }
        PathSegment segment{};
        segment.kind = PathSegment::Kind::Index;
        segment.index = index;
        state.segments.push_back(std::move(segment));
    }
};

template <>
struct expression_action<rules::path> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<PathExpression>();
        node.segments = std::move(state.segments);
        state.segments.clear();
        state.operands.push_back(&node);
    }
};

template <>
struct expression_action<rules::value_placeholder> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        auto& node = state.arena->make<ValueReference>();
        node.placeholder = in.string();
        state.operands.push_back(&node);
    }
};

template <>
struct expression_action<rules::size_function> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<SizeFunction>();
        node.argument = pop_operand(state);
        state.operands.push_back(&node);
    }
};

template <ComparisonOperator Op>
struct comparator_action {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        state.pending_comparator = Op;
    }
};

template <>
struct expression_action<rules::op_equal> : comparator_action<ComparisonOperator::Equal> {
};

template <>
struct expression_action<rules::op_not_equal> : comparator_action<ComparisonOperator::NotEqual> {
};

template <>
struct expression_action<rules::op_less> : comparator_action<ComparisonOperator::Less> {
};

template <>
struct expression_action<rules::op_less_equal> : comparator_action<ComparisonOperator::LessOrEqual> {
};

template <>
struct expression_action<rules::op_greater> : comparator_action<ComparisonOperator::Greater> {
};

template <>
struct expression_action<rules::op_greater_equal> : comparator_action<ComparisonOperator::GreaterOrEqual> {
};

template <>
struct expression_action<rules::comparison_rest> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<ComparisonCondition>();
        node.right = pop_operand(state);
        node.left = pop_operand(state);
        node.op = state.pending_comparator;
        state.conditions.push_back(&node);
    }
};

template <>
struct expression_action<rules::between_rest> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<BetweenCondition>();
        node.upper = pop_operand(state);
        node.lower = pop_operand(state);
        node.value = pop_operand(state);
        state.conditions.push_back(&node);
    }
};

template <ConditionFunction Function>
struct function_name_action {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        state.functions.push_back(FunctionFrame{Function, state.operands.size()});
    }
};

template <>
struct expression_action<rules::fn_attribute_exists> : function_name_action<ConditionFunction::AttributeExists> {
};

template <>
struct expression_action<rules::fn_attribute_not_exists> : function_name_action<ConditionFunction::AttributeNotExists> {
};

template <>
struct expression_action<rules::fn_attribute_type> : function_name_action<ConditionFunction::AttributeType> {
};

template <>
struct expression_action<rules::fn_begins_with> : function_name_action<ConditionFunction::BeginsWith> {
};

template <>
struct expression_action<rules::fn_contains> : function_name_action<ConditionFunction::Contains> {
};

template <>
struct expression_action<rules::function_condition> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        if (state.functions.empty()) {
            throw std::logic_error("expression parser function frame underflow");
        }
        const auto frame = state.functions.back();
        state.functions.pop_back();

        auto& node = state.arena->make<FunctionCondition>();
        node.function = frame.function;
        const auto first = state.operands.begin() + static_cast<std::ptrdiff_t>(frame.operand_mark);
        node.arguments.assign(first, state.operands.end());
        state.operands.erase(first, state.operands.end());

        auto problem = validate_function(node);
        if (!problem.empty()) {
            record_semantic_error(in, state, std::move(problem));
        }
        state.conditions.push_back(&node);
    }
};

template <>
struct expression_action<rules::and_rest> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<AndCondition>();
        node.right = pop_condition(state);
        node.left = pop_condition(state);
        state.conditions.push_back(&node);
    }
};

template <>
struct expression_action<rules::kw_set> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        mark_clause(in, state, UpdateClause::Set, "SET");
    }
};

template <>
struct expression_action<rules::kw_remove> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        mark_clause(in, state, UpdateClause::Remove, "REMOVE");
    }
};

template <>
struct expression_action<rules::kw_add> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        mark_clause(in, state, UpdateClause::Add, "ADD");
    }
};

template <>
struct expression_action<rules::kw_delete> {
    template <typename Input>
    static void apply(const Input& in, ExpressionParseState& state)
    {
        mark_clause(in, state, UpdateClause::Delete, "DELETE");
    }
};

template <>
struct expression_action<rules::op_plus> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        state.pending_arithmetic = ArithmeticOperator::Add;
    }
};

template <>
struct expression_action<rules::op_minus> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        state.pending_arithmetic = ArithmeticOperator::Subtract;
    }
};

template <>
struct expression_action<rules::arithmetic_rest> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<ArithmeticExpression>();
        node.right = pop_operand(state);
        node.left = pop_operand(state);
        node.op = state.pending_arithmetic;
        state.operands.push_back(&node);
    }
};

template <>
struct expression_action<rules::if_not_exists_function> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<IfNotExistsFunction>();
        node.fallback = pop_operand(state);
        node.path = static_cast<PathExpression*>(pop_operand(state));
        state.operands.push_back(&node);
    }
};

template <>
struct expression_action<rules::list_append_function> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<ListAppendFunction>();
        node.right = pop_operand(state);
        node.left = pop_operand(state);
        state.operands.push_back(&node);
    }
};

template <>
struct expression_action<rules::set_action> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<SetAction>();
        node.value = pop_operand(state);
        node.path = static_cast<PathExpression*>(pop_operand(state));
        state.update->set_actions.push_back(&node);
    }
};

template <>
struct expression_action<rules::remove_action> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<RemoveAction>();
        node.path = static_cast<PathExpression*>(pop_operand(state));
        state.update->remove_actions.push_back(&node);
    }
};

template <>
struct expression_action<rules::add_action> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<AddAction>();
        node.value = static_cast<ValueReference*>(pop_operand(state));
        node.path = static_cast<PathExpression*>(pop_operand(state));
        state.update->add_actions.push_back(&node);
    }
};

template <>
struct expression_action<rules::delete_action> {
    template <typename Input>
    static void apply(const Input&, ExpressionParseState& state)
    {
        auto& node = state.arena->make<DeleteAction>();
        node.value = static_cast<ValueReference*>(pop_operand(state));
        node.path = static_cast<PathExpression*>(pop_operand(state));
        state.update->delete_actions.push_back(&node);
    }
};

std::string trim_copy(std::string_view text)
{
    const auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string{begin, end};
}

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view expected_prefix = "expected ";
    if (message.rfind(expected_prefix, 0) == 0U && message.size() > expected_prefix.size()) {
        auto detail = message.substr(expected_prefix.size());
        if (!detail.empty() && detail.front() == '\'' && detail.back() == '\'' && detail.size() > 2) {
            detail = detail.substr(1, detail.size() - 2);
        }
        return "Missing " + std::string{detail};
    }
    return std::string{message};
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }

    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isspace(unsigned_ch) != 0 || ch == ',' || ch == '(' || ch == ')';
    };

    std::size_t begin = offset;
    while (begin > 0U && !is_separator(input[begin - 1U])) {
        --begin;
    }

    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }

    return input.substr(begin, end - begin);
}

void attach_fragment(ParserDiagnostic& diagnostic, std::string_view source)
{
    if (!source.empty() && diagnostic.byte_offset < source.size()) {
        diagnostic.fragment = trim_copy(extract_token(source, diagnostic.byte_offset));
        if (!diagnostic.fragment.empty()) {
            diagnostic.message += " near '" + diagnostic.fragment + "'";
        }
    } else {
        diagnostic.message += " at end of input";
    }
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.expression = trim_copy(source);
    diagnostic.remediation_hints = {"Review the expression syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);
        diagnostic.byte_offset = static_cast<std::size_t>(position.byte);
        attach_fragment(diagnostic, source);
    }

    return diagnostic;
}

ParserDiagnostic make_semantic_error(const ExpressionParseState& state, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = state.semantic_message;
    diagnostic.line = state.semantic_line;
    diagnostic.column = state.semantic_column;
    diagnostic.byte_offset = state.semantic_byte;
    diagnostic.fragment = trim_copy(extract_token(source, state.semantic_byte));
    diagnostic.expression = trim_copy(source);
    diagnostic.remediation_hints = {"Check the number and kind of operands passed to the function."};
    return diagnostic;
}

ParserDiagnostic make_mismatch(std::string_view source, const char* grammar_name)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = std::string{"input did not match "} + grammar_name + " grammar";
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.expression = trim_copy(source);
    diagnostic.remediation_hints = {"Review the expression syntax near the reported token."};
    return diagnostic;
}

template <typename Grammar, typename Result>
void run_parser(std::string_view input, const char* grammar_name, ExpressionParseState& state, Result& result)
{
    pegtl::memory_input in(input.data(), input.size(), grammar_name);

    try {
        const auto parsed = pegtl::parse<Grammar, expression_action, error_control>(in, state);
        if (!parsed) {
            result.error = make_error_code(Errc::ParseError);
            result.diagnostics.push_back(make_mismatch(input, grammar_name));
        } else if (state.semantic_error) {
            result.error = state.semantic_error;
            result.diagnostics.push_back(make_semantic_error(state, input));
        }
    } catch (const pegtl::parse_error& error) {
        result.error = make_error_code(Errc::ParseError);
        result.diagnostics.push_back(make_parse_error(error, input));
    }
}

}  // namespace

ConditionParseResult parse_condition_expression(std::string_view input)
{
    ConditionParseResult result{};
    ExpressionParseState state{};
    state.arena = &result.arena;

    run_parser<rules::condition_expression>(input, "condition expression", state, result);
    if (!result.error && state.conditions.size() == 1U) {
        result.condition = state.conditions.front();
    } else {
        if (!result.error) {
            result.error = make_error_code(Errc::ParseError);
            result.diagnostics.push_back(make_mismatch(input, "condition expression"));
        }
        result.condition = nullptr;
        result.arena.reset();
    }
    return result;
}

UpdateParseResult parse_update_expression(std::string_view input)
{
    UpdateParseResult result{};
    ExpressionParseState state{};
    state.arena = &result.arena;
    state.update = &result.arena.make<UpdateExpression>();

    run_parser<rules::update_expression>(input, "update expression", state, result);
    if (!result.error) {
        result.expression = state.update;
    } else {
        result.expression = nullptr;
        result.arena.reset();
    }
    return result;
}

std::string summarize_diagnostics(const std::vector<ParserDiagnostic>& diagnostics)
{
    std::string summary;
    for (const auto& diagnostic : diagnostics) {
        if (!summary.empty()) {
            summary += "; ";
        }
        summary += diagnostic.message;
        if (diagnostic.column > 0U) {
            summary += " (column " + std::to_string(diagnostic.column) + ")";
        }
    }
    return summary;
}

}  // namespace rynamo::expression
