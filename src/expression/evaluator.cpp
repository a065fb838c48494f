#include "rynamo/expression/evaluator.hpp"

#include "rynamo/common/error.hpp"

#include <algorithm>
#include <string_view>

namespace rynamo::expression {

namespace {

struct OperandValue final {
    OperandValue() = default;
    OperandValue(const OperandValue&) = delete;
    OperandValue& operator=(const OperandValue&) = delete;

    const AttributeValue* value = nullptr;
    AttributeValue computed{};
    bool from_placeholder = false;
};

bool starts_with(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0U, prefix.size(), prefix) == 0;
}

bool is_prefix_type(const AttributeValue& value) noexcept
{
    return value.type() == AttributeType::String || value.type() == AttributeType::Binary;
}

bool set_contains(const AttributeValue& set, const AttributeValue& element) noexcept
{
    switch (set.type()) {
    case AttributeType::StringSet:
        return element.type() == AttributeType::String
               && std::binary_search(set.as_string_set().begin(), set.as_string_set().end(), element.as_string());
    case AttributeType::NumberSet:
        return element.type() == AttributeType::Number
               && std::binary_search(set.as_number_set().begin(), set.as_number_set().end(), element.as_number());
    case AttributeType::BinarySet:
        return element.type() == AttributeType::Binary
               && std::binary_search(set.as_binary_set().begin(), set.as_binary_set().end(), element.as_binary());
    default:
        return false;
    }
}

class ConditionEvaluator final {
public:
    ConditionEvaluator(const Item& item, const PlaceholderBindings& bindings) noexcept
        : item_{item}
        , bindings_{bindings}
    {
    }

    bool evaluate(const Condition& condition)
    {
        if (error_) {
            return false;
        }

        switch (condition.kind) {
        case NodeKind::ComparisonCondition:
            return evaluate_comparison(static_cast<const ComparisonCondition&>(condition));
        case NodeKind::BetweenCondition:
            return evaluate_between(static_cast<const BetweenCondition&>(condition));
        case NodeKind::FunctionCondition:
            return evaluate_function(static_cast<const FunctionCondition&>(condition));
        case NodeKind::AndCondition: {
            const auto& node = static_cast<const AndCondition&>(condition);
            if (node.left == nullptr || node.right == nullptr) {
                return fail(Errc::InternalError, "malformed AND condition");
            }
            return evaluate(*node.left) && evaluate(*node.right);
        }
        default:
            return fail(Errc::InternalError, "unsupported condition node");
        }
    }

    [[nodiscard]] EvaluationResult result(bool matched) const
    {
        EvaluationResult result{};
        result.error = error_;
        result.message = message_;
        result.matched = !error_ && matched;
        return result;
    }

private:
    bool fail(Errc code, std::string message)
    {
        if (!error_) {
            error_ = make_error_code(code);
            message_ = std::move(message);
        }
        return false;
    }

    void resolve(const Operand* operand, OperandValue& out)
    {
        if (operand == nullptr) {
            fail(Errc::InternalError, "malformed expression operand");
            return;
        }

        switch (operand->kind) {
        case NodeKind::PathExpression: {
            std::vector<PathSegment> resolved;
            std::string message;
            if (auto ec = resolve_path(static_cast<const PathExpression&>(*operand), bindings_, resolved, message)) {
                fail(static_cast<Errc>(ec.value()), std::move(message));
                return;
            }
            out.value = find_attribute(item_, resolved);
            return;
        }
        case NodeKind::ValueReference: {
            const auto& placeholder = static_cast<const ValueReference&>(*operand).placeholder;
            out.value = find_value(bindings_, placeholder);
            out.from_placeholder = true;
            if (out.value == nullptr) {
                fail(Errc::UnresolvedPlaceholder,
                     "An expression attribute value used in expression is not defined; attribute value: " + placeholder);
            }
            return;
        }
        case NodeKind::SizeFunction: {
            OperandValue argument;
            resolve(static_cast<const SizeFunction&>(*operand).argument, argument);
            if (argument.value == nullptr) {
                return;
            }
            std::size_t size = 0U;
            switch (argument.value->type()) {
            case AttributeType::String:
                size = argument.value->as_string().size();
                break;
            case AttributeType::Binary:
                size = argument.value->as_binary().size();
                break;
            case AttributeType::List:
            case AttributeType::Map:
            case AttributeType::StringSet:
            case AttributeType::NumberSet:
            case AttributeType::BinarySet:
                size = argument.value->cardinality();
                break;
            default:
                return;
            }
            out.computed = AttributeValue::number(Decimal::from_integer(static_cast<std::int64_t>(size)));
            out.value = &out.computed;
            return;
        }
        default:
            fail(Errc::InternalError, "update functions are not valid in a condition expression");
            return;
        }
    }

    bool evaluate_comparison(const ComparisonCondition& node)
    {
        OperandValue left;
        OperandValue right;
        resolve(node.left, left);
        resolve(node.right, right);
        if (error_ || left.value == nullptr || right.value == nullptr) {
            return false;
        }
        if (left.value->type() != right.value->type()) {
            return false;
        }

        switch (node.op) {
        case ComparisonOperator::Equal:
            return *left.value == *right.value;
        case ComparisonOperator::NotEqual:
            return !(*left.value == *right.value);
        default:
            break;
        }

        const auto order = compare_scalars(*left.value, *right.value);
        if (!order) {
            return false;
        }
        switch (node.op) {
        case ComparisonOperator::Less:
            return *order < 0;
        case ComparisonOperator::LessOrEqual:
            return *order <= 0;
        case ComparisonOperator::Greater:
            return *order > 0;
        case ComparisonOperator::GreaterOrEqual:
            return *order >= 0;
        default:
            return false;
        }
    }

    bool evaluate_between(const BetweenCondition& node)
    {
        OperandValue value;
        OperandValue lower;
        OperandValue upper;
        resolve(node.value, value);
        resolve(node.lower, lower);
        resolve(node.upper, upper);
        if (error_ || lower.value == nullptr || upper.value == nullptr) {
            return false;
        }

        if (lower.from_placeholder && upper.from_placeholder) {
            const auto bounds = compare_scalars(*lower.value, *upper.value);
            if (bounds && *bounds > 0) {
                return fail(Errc::ValidationError,
                            "Invalid ConditionExpression: The BETWEEN operator requires upper bound to be greater than "
                            "or equal to lower bound");
            }
        }

        if (value.value == nullptr) {
            return false;
        }
        const auto above = compare_scalars(*value.value, *lower.value);
        const auto below = compare_scalars(*value.value, *upper.value);
        return above && below && *above >= 0 && *below <= 0;
    }

    bool evaluate_function(const FunctionCondition& node)
    {
        switch (node.function) {
        case ConditionFunction::AttributeExists:
        case ConditionFunction::AttributeNotExists: {
            if (node.arguments.size() != 1U) {
                return fail(Errc::TypeMismatch, std::string{"Incorrect number of operands for "} + function_name(node.function));
            }
            OperandValue target;
            resolve(node.arguments.front(), target);
            if (error_) {
                return false;
            }
            const bool exists = target.value != nullptr;
            return node.function == ConditionFunction::AttributeExists ? exists : !exists;
        }
        case ConditionFunction::AttributeType:
            return evaluate_attribute_type(node);
        case ConditionFunction::BeginsWith:
            return evaluate_begins_with(node);
        case ConditionFunction::Contains:
            return evaluate_contains(node);
        }
        return fail(Errc::InternalError, "unsupported condition function");
    }

    bool evaluate_attribute_type(const FunctionCondition& node)
    {
        if (node.arguments.size() != 2U) {
            return fail(Errc::TypeMismatch, "Incorrect number of operands for attribute_type");
        }
        OperandValue target;
        OperandValue type_name;
        resolve(node.arguments[0], target);
        resolve(node.arguments[1], type_name);
        if (error_ || type_name.value == nullptr) {
            return false;
        }

        std::optional<AttributeType> expected;
        if (type_name.value->type() == AttributeType::String) {
            expected = parse_type_tag(type_name.value->as_string());
        }
        if (!expected) {
            const auto shown = type_name.value->type() == AttributeType::String ? type_name.value->as_string()
                                                                               : std::string{type_tag(type_name.value->type())};
            return fail(Errc::TypeMismatch,
                        "Invalid ConditionExpression: Invalid attribute type name found; type: " + shown
                            + ", valid types: { B,NULL,SS,BOOL,L,BS,N,NS,S,M }");
        }
        return target.value != nullptr && target.value->type() == *expected;
    }

    bool evaluate_begins_with(const FunctionCondition& node)
    {
        if (node.arguments.size() != 2U) {
            return fail(Errc::TypeMismatch, "Incorrect number of operands for begins_with");
        }
        OperandValue subject;
        OperandValue prefix;
        resolve(node.arguments[0], subject);
        resolve(node.arguments[1], prefix);
        if (error_) {
            return false;
        }

        for (const auto* operand : {&subject, &prefix}) {
            if (operand->from_placeholder && operand->value != nullptr && !is_prefix_type(*operand->value)) {
                return fail(Errc::TypeMismatch,
                            std::string{"Invalid ConditionExpression: Incorrect operand type for operator or function; "}
                                + "operator or function: begins_with, operand type: " + type_tag(operand->value->type()));
            }
        }

        if (subject.value == nullptr || prefix.value == nullptr || subject.value->type() != prefix.value->type()) {
            return false;
        }
        if (subject.value->type() == AttributeType::String) {
            return starts_with(subject.value->as_string(), prefix.value->as_string());
        }
        if (subject.value->type() == AttributeType::Binary) {
            return starts_with(subject.value->as_binary(), prefix.value->as_binary());
        }
        return false;
    }

    bool evaluate_contains(const FunctionCondition& node)
    {
        if (node.arguments.size() != 2U) {
            return fail(Errc::TypeMismatch, "Incorrect number of operands for contains");
        }
        OperandValue haystack;
        OperandValue needle;
        resolve(node.arguments[0], haystack);
        resolve(node.arguments[1], needle);
        if (error_ || haystack.value == nullptr || needle.value == nullptr) {
            return false;
        }

        const auto& container = *haystack.value;
        const auto& element = *needle.value;
        switch (container.type()) {
        case AttributeType::String:
            return element.type() == AttributeType::String
                   && container.as_string().find(element.as_string()) != std::string::npos;
        case AttributeType::Binary:
            return element.type() == AttributeType::Binary
                   && container.as_binary().find(element.as_binary()) != std::string::npos;
        case AttributeType::StringSet:
        case AttributeType::NumberSet:
        case AttributeType::BinarySet:
            return set_contains(container, element);
        case AttributeType::List:
            return std::any_of(container.as_list().begin(), container.as_list().end(), [&element](const AttributeValue& entry) {
                return entry == element;
            });
        default:
            return false;
        }
    }

    const Item& item_;
    const PlaceholderBindings& bindings_;
    std::error_code error_{};
    std::string message_{};
};

}  // namespace

std::error_code resolve_path(const PathExpression& path,
                             const PlaceholderBindings& bindings,
                             std::vector<PathSegment>& resolved,
                             std::string& message)
{
    resolved.clear();
    resolved.reserve(path.segments.size());
    for (const auto& segment : path.segments) {
        if (!segment.is_placeholder()) {
            resolved.push_back(segment);
            continue;
        }
        const auto it = bindings.names.find(segment.name);
        if (it == bindings.names.end()) {
            message = "An expression attribute name used in the document path is not defined; attribute name: " + segment.name;
            return make_error_code(Errc::UnresolvedPlaceholder);
        }
        PathSegment name{};
        name.kind = PathSegment::Kind::Name;
        name.name = it->second;
        resolved.push_back(std::move(name));
    }
    return {};
}

const AttributeValue* find_attribute(const Item& item, const std::vector<PathSegment>& path) noexcept
{
    if (path.empty() || path.front().kind != PathSegment::Kind::Name) {
        return nullptr;
    }
    const auto root = item.find(path.front().name);
    if (root == item.end()) {
        return nullptr;
    }

    const AttributeValue* current = &root->second;
    for (std::size_t index = 1U; index < path.size(); ++index) {
        const auto& segment = path[index];
        if (segment.kind == PathSegment::Kind::Index) {
            if (current->type() != AttributeType::List || segment.index >= current->as_list().size()) {
                return nullptr;
            }
            current = &current->as_list()[segment.index];
            continue;
        }
        if (current->type() != AttributeType::Map) {
            return nullptr;
        }
        const auto& members = current->as_map();
        const auto it = members.find(segment.name);
        if (it == members.end()) {
            return nullptr;
        }
        current = &it->second;
    }
    return current;
}

const AttributeValue* find_value(const PlaceholderBindings& bindings, const std::string& placeholder) noexcept
{
    const auto it = bindings.values.find(placeholder);
    return it == bindings.values.end() ? nullptr : &it->second;
}

std::optional<std::strong_ordering> compare_scalars(const AttributeValue& lhs, const AttributeValue& rhs) noexcept
{
    if (lhs.type() != rhs.type()) {
        return std::nullopt;
    }
    switch (lhs.type()) {
    case AttributeType::String:
        return lhs.as_string().compare(rhs.as_string()) <=> 0;
    case AttributeType::Number:
        return lhs.as_number() <=> rhs.as_number();
    case AttributeType::Binary:
        return lhs.as_binary().compare(rhs.as_binary()) <=> 0;
    default:
        return std::nullopt;
    }
}

std::error_code verify_bindings(const Condition& condition, const PlaceholderBindings& bindings, std::string& message)
{
    PlaceholderUsage usage;
    collect_placeholders(condition, usage);
    for (const auto& name : usage.names) {
        if (!bindings.names.contains(name)) {
            message = "An expression attribute name used in the document path is not defined; attribute name: " + name;
            return make_error_code(Errc::UnresolvedPlaceholder);
        }
    }
    for (const auto& value : usage.values) {
        if (!bindings.values.contains(value)) {
            message = "An expression attribute value used in expression is not defined; attribute value: " + value;
            return make_error_code(Errc::UnresolvedPlaceholder);
        }
    }
    return {};
}

EvaluationResult evaluate(const Condition& condition, const Item& item, const PlaceholderBindings& bindings)
{
    std::string message;
    if (auto ec = verify_bindings(condition, bindings, message)) {
        EvaluationResult result{};
        result.error = ec;
        result.message = std::move(message);
        return result;
    }
    return evaluate_verified(condition, item, bindings);
}

EvaluationResult evaluate_verified(const Condition& condition, const Item& item, const PlaceholderBindings& bindings)
{
    ConditionEvaluator evaluator{item, bindings};
    const bool matched = evaluator.evaluate(condition);
    return evaluator.result(matched);
}

}  // namespace rynamo::expression
