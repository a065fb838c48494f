#include "rynamo/executor/key_condition.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/expression/evaluator.hpp"

#include <utility>
#include <vector>

namespace rynamo::executor {

namespace {

using expression::ComparisonOperator;
using expression::Condition;
using expression::NodeKind;
using expression::Operand;

std::error_code invalid(std::string& message, std::string text)
{
    message = std::move(text);
    return make_error_code(Errc::ValidationError);
}

void flatten(const Condition& condition, std::vector<const Condition*>& conjuncts)
{
    if (condition.kind == NodeKind::AndCondition) {
        const auto& conjunction = static_cast<const expression::AndCondition&>(condition);
        flatten(*conjunction.left, conjuncts);
        flatten(*conjunction.right, conjuncts);
        return;
    }
    conjuncts.push_back(&condition);
}

// Name of a top-level attribute path, or empty for any other operand.
std::error_code attribute_name(const Operand* operand,
                               const expression::PlaceholderBindings& bindings,
                               std::string& name,
                               std::string& message)
{
    name.clear();
    if (operand == nullptr || operand->kind != NodeKind::PathExpression) {
        return {};
    }
    std::vector<expression::PathSegment> resolved;
    if (auto ec = expression::resolve_path(static_cast<const expression::PathExpression&>(*operand), bindings, resolved, message)) {
        return ec;
    }
    if (resolved.size() == 1U && resolved.front().kind == expression::PathSegment::Kind::Name) {
        name = resolved.front().name;
    }
    return {};
}

std::error_code key_value(const Operand* operand,
                          const expression::PlaceholderBindings& bindings,
                          const catalog::KeyAttribute& key,
                          storage::KeyValue& out,
                          std::string& message)
{
    if (operand == nullptr || operand->kind != NodeKind::ValueReference) {
        return invalid(message, "Invalid KeyConditionExpression: key conditions must compare " + key.name + " with a value");
    }
    const auto& reference = static_cast<const expression::ValueReference&>(*operand);
    const auto* value = expression::find_value(bindings, reference.placeholder);
    if (value == nullptr) {
        message = "An expression attribute value used in expression is not defined; attribute value: " + reference.placeholder;
        return make_error_code(Errc::UnresolvedPlaceholder);
    }
    if (!catalog::matches(key.type, value->type())) {
        return invalid(message, "One or more parameter values were invalid: Condition parameter type does not match schema type");
    }
    auto converted = storage::KeyValue::from_attribute(*value);
    if (!converted) {
        return invalid(message, "One or more parameter values were invalid: Condition parameter type does not match schema type");
    }
    out = std::move(*converted);
    return {};
}

ComparisonOperator mirror(ComparisonOperator op) noexcept
{
    switch (op) {
    case ComparisonOperator::Less:
        return ComparisonOperator::Greater;
    case ComparisonOperator::LessOrEqual:
        return ComparisonOperator::GreaterOrEqual;
    case ComparisonOperator::Greater:
        return ComparisonOperator::Less;
    case ComparisonOperator::GreaterOrEqual:
        return ComparisonOperator::LessOrEqual;
    default:
        return op;
    }
}

// True when the conjunct is `partition_key = :value` in either operand order.
bool is_partition_equality(const Condition& condition,
                           const catalog::TableSchema& schema,
                           const expression::PlaceholderBindings& bindings,
                           const Operand*& value)
{
    if (condition.kind != NodeKind::ComparisonCondition) {
        return false;
    }
    const auto& comparison = static_cast<const expression::ComparisonCondition&>(condition);
    if (comparison.op != ComparisonOperator::Equal) {
        return false;
    }
    std::string name;
    std::string ignored;
    if (!attribute_name(comparison.left, bindings, name, ignored) && name == schema.partition_key.name) {
        value = comparison.right;
        return true;
    }
    if (!attribute_name(comparison.right, bindings, name, ignored) && name == schema.partition_key.name) {
        value = comparison.left;
        return true;
    }
    return false;
}

std::error_code require_sort_key(const Operand* operand,
                                 const catalog::TableSchema& schema,
                                 const expression::PlaceholderBindings& bindings,
                                 std::string& message)
{
    std::string name;
    if (auto ec = attribute_name(operand, bindings, name, message)) {
        return ec;
    }
    if (name.empty()) {
        return invalid(message, "Invalid KeyConditionExpression: key conditions may only reference top-level key attributes");
    }
    if (!schema.sort_key || name != schema.sort_key->name) {
        return invalid(message, "Query condition missed key schema element: "
                                    + (schema.sort_key ? schema.sort_key->name : schema.partition_key.name));
    }
    return {};
}

}  // namespace

bool KeyConditionPlan::contains(const storage::SortKey& sort) const noexcept
{
    if (!sort) {
        return !lower && !upper;
    }
    if (lower) {
        const auto order = *sort <=> lower->value;
        if (order < 0 || (order == 0 && !lower->inclusive)) {
            return false;
        }
    }
    if (upper) {
        const auto order = *sort <=> upper->value;
        if (order > 0 || (order == 0 && !upper->inclusive)) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> prefix_successor(const std::string& prefix)
{
    std::string successor = prefix;
    while (!successor.empty()) {
        auto& last = successor.back();
        if (static_cast<unsigned char>(last) != 0xFFU) {
            last = static_cast<char>(static_cast<unsigned char>(last) + 1U);
            return successor;
        }
        successor.pop_back();
    }
    return std::nullopt;
}

std::error_code plan_key_condition(const expression::Condition& condition,
                                   const catalog::TableSchema& schema,
                                   const expression::PlaceholderBindings& bindings,
                                   KeyConditionPlan& plan,
                                   std::string& message)
{
    std::vector<const Condition*> conjuncts;
    flatten(condition, conjuncts);
    if (conjuncts.size() > 2U) {
        return invalid(message, "Invalid KeyConditionExpression: conditions can be of length 1 or 2 only");
    }

    const Condition* sort_condition = nullptr;
    const Operand* partition_value = nullptr;
    for (const auto* conjunct : conjuncts) {
        const Operand* value = nullptr;
        if (partition_value == nullptr && is_partition_equality(*conjunct, schema, bindings, value)) {
            partition_value = value;
            continue;
        }
        sort_condition = conjunct;
    }
    if (partition_value == nullptr) {
        return invalid(message, "Query condition missed key schema element: " + schema.partition_key.name);
    }
    if (auto ec = key_value(partition_value, bindings, schema.partition_key, plan.partition, message)) {
        return ec;
    }
    return plan_sort_key_condition(sort_condition, schema, bindings, plan, message);
}

std::error_code plan_sort_key_condition(const expression::Condition* condition,
                                        const catalog::TableSchema& schema,
                                        const expression::PlaceholderBindings& bindings,
                                        KeyConditionPlan& plan,
                                        std::string& message)
{
    plan.lower.reset();
    plan.upper.reset();
    if (condition == nullptr) {
        return {};
    }

    switch (condition->kind) {
    case NodeKind::ComparisonCondition: {
        const auto& comparison = static_cast<const expression::ComparisonCondition&>(*condition);
        auto op = comparison.op;
        const Operand* key_operand = comparison.left;
        const Operand* value_operand = comparison.right;
        if (comparison.left->kind == NodeKind::ValueReference) {
            std::swap(key_operand, value_operand);
            op = mirror(op);
        }
        if (op == ComparisonOperator::NotEqual) {
            return invalid(message, "Unsupported operator in KeyConditionExpression: <>");
        }
        if (auto ec = require_sort_key(key_operand, schema, bindings, message)) {
            return ec;
        }
        storage::KeyValue value{};
        if (auto ec = key_value(value_operand, bindings, *schema.sort_key, value, message)) {
            return ec;
        }
        switch (op) {
        case ComparisonOperator::Equal:
            plan.lower = SortKeyBound{value, true};
            plan.upper = SortKeyBound{std::move(value), true};
            break;
        case ComparisonOperator::Less:
            plan.upper = SortKeyBound{std::move(value), false};
            break;
        case ComparisonOperator::LessOrEqual:
            plan.upper = SortKeyBound{std::move(value), true};
            break;
        case ComparisonOperator::Greater:
            plan.lower = SortKeyBound{std::move(value), false};
            break;
        case ComparisonOperator::GreaterOrEqual:
            plan.lower = SortKeyBound{std::move(value), true};
            break;
        default:
            break;
        }
        return {};
    }
    case NodeKind::BetweenCondition: {
        const auto& between = static_cast<const expression::BetweenCondition&>(*condition);
        if (auto ec = require_sort_key(between.value, schema, bindings, message)) {
            return ec;
        }
        storage::KeyValue lower{};
        storage::KeyValue upper{};
        if (auto ec = key_value(between.lower, bindings, *schema.sort_key, lower, message)) {
            return ec;
        }
        if (auto ec = key_value(between.upper, bindings, *schema.sort_key, upper, message)) {
            return ec;
        }
        if (upper < lower) {
            return invalid(message,
                           "Invalid KeyConditionExpression: The BETWEEN operator requires upper bound to be greater than "
                           "or equal to lower bound");
        }
        plan.lower = SortKeyBound{std::move(lower), true};
        plan.upper = SortKeyBound{std::move(upper), true};
        return {};
    }
    case NodeKind::FunctionCondition: {
        const auto& function = static_cast<const expression::FunctionCondition&>(*condition);
        if (function.function != expression::ConditionFunction::BeginsWith || function.arguments.size() != 2U) {
            return invalid(message,
                           std::string{"Invalid KeyConditionExpression: Invalid function name; function: "}
                               + expression::function_name(function.function));
        }
        if (auto ec = require_sort_key(function.arguments[0], schema, bindings, message)) {
            return ec;
        }
        if (schema.sort_key->type == catalog::ScalarAttributeType::Number) {
            return invalid(message,
                           "Invalid KeyConditionExpression: Incorrect operand type for operator or function; "
                           "operator or function: begins_with, operand type: N");
        }
        storage::KeyValue prefix{};
        if (auto ec = key_value(function.arguments[1], bindings, *schema.sort_key, prefix, message)) {
            return ec;
        }
        if (auto successor = prefix_successor(prefix.bytes())) {
            const auto upper = schema.sort_key->type == catalog::ScalarAttributeType::String
                                   ? AttributeValue::string(std::move(*successor))
                                   : AttributeValue::binary(std::move(*successor));
            plan.upper = SortKeyBound{*storage::KeyValue::from_attribute(upper), false};
        }
        plan.lower = SortKeyBound{std::move(prefix), true};
        return {};
    }
    case NodeKind::AndCondition:
        return invalid(message, "Invalid KeyConditionExpression: conditions can be of length 1 or 2 only");
    default:
        return invalid(message, "Invalid KeyConditionExpression: unsupported condition");
    }
}

}  // namespace rynamo::executor
