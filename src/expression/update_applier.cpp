#include "rynamo/expression/update_applier.hpp"

#include "rynamo/common/error.hpp"
#include "rynamo/expression/evaluator.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace rynamo::expression {

namespace {

using ResolvedPath = std::vector<PathSegment>;

constexpr const char* kIncorrectOperandType = "An operand in the update expression has an incorrect data type";
constexpr const char* kInvalidDocumentPath = "The document path provided in the update expression is invalid for update";

std::error_code validation_error(std::string& message, std::string text)
{
    message = std::move(text);
    return make_error_code(Errc::ValidationError);
}

bool segments_equal(const PathSegment& lhs, const PathSegment& rhs) noexcept
{
    if (lhs.kind != rhs.kind) {
        return false;
    }
    return lhs.kind == PathSegment::Kind::Index ? lhs.index == rhs.index : lhs.name == rhs.name;
}

bool paths_overlap(const ResolvedPath& lhs, const ResolvedPath& rhs) noexcept
{
    const auto common = std::min(lhs.size(), rhs.size());
    for (std::size_t index = 0; index < common; ++index) {
        if (!segments_equal(lhs[index], rhs[index])) {
            return false;
        }
    }
    return true;
}

std::string render_path(const ResolvedPath& path)
{
    std::string text = "[";
    for (std::size_t index = 0; index < path.size(); ++index) {
        if (index > 0U) {
            text += ", ";
        }
        text += path[index].kind == PathSegment::Kind::Index ? "[" + std::to_string(path[index].index) + "]" : path[index].name;
    }
    return text + "]";
}

AttributeValue* find_mutable(Item& item, const ResolvedPath& path, std::size_t length) noexcept
{
    if (length == 0U || path.front().kind != PathSegment::Kind::Name) {
        return nullptr;
    }
    const auto root = item.find(path.front().name);
    if (root == item.end()) {
        return nullptr;
    }

    AttributeValue* current = &root->second;
    for (std::size_t index = 1U; index < length; ++index) {
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
        auto& members = current->as_map();
        const auto it = members.find(segment.name);
        if (it == members.end()) {
            return nullptr;
        }
        current = &it->second;
    }
    return current;
}

std::error_code assign_path(Item& item, const ResolvedPath& path, AttributeValue value, std::string& message)
{
    if (path.size() == 1U) {
        item.insert_or_assign(path.front().name, std::move(value));
        return {};
    }

    auto* parent = find_mutable(item, path, path.size() - 1U);
    const auto& leaf = path.back();
    if (parent != nullptr && leaf.kind == PathSegment::Kind::Name && parent->type() == AttributeType::Map) {
        parent->as_map().insert_or_assign(leaf.name, std::move(value));
        return {};
    }
    if (parent != nullptr && leaf.kind == PathSegment::Kind::Index && parent->type() == AttributeType::List) {
        auto& elements = parent->as_list();
        if (leaf.index < elements.size()) {
            elements[leaf.index] = std::move(value);
        } else {
            elements.push_back(std::move(value));
        }
        return {};
    }
    return validation_error(message, kInvalidDocumentPath);
}

std::error_code erase_path(Item& item, const ResolvedPath& path, std::string& message)
{
    if (path.size() == 1U) {
        item.erase(path.front().name);
        return {};
    }

    auto* parent = find_mutable(item, path, path.size() - 1U);
    if (parent == nullptr) {
        return validation_error(message, kInvalidDocumentPath);
    }
    const auto& leaf = path.back();
    if (leaf.kind == PathSegment::Kind::Name && parent->type() == AttributeType::Map) {
        parent->as_map().erase(leaf.name);
        return {};
    }
    if (leaf.kind == PathSegment::Kind::Index && parent->type() == AttributeType::List) {
        auto& elements = parent->as_list();
        if (leaf.index < elements.size()) {
            elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(leaf.index));
        }
        return {};
    }
    return validation_error(message, kInvalidDocumentPath);
}

template <typename T>
std::vector<T> merge_sets(const std::vector<T>& lhs, const std::vector<T>& rhs)
{
    std::vector<T> merged;
    merged.reserve(lhs.size() + rhs.size());
    std::set_union(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(merged));
    return merged;
}

template <typename T>
std::vector<T> subtract_sets(const std::vector<T>& lhs, const std::vector<T>& rhs)
{
    std::vector<T> remaining;
    std::set_difference(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(remaining));
    return remaining;
}

AttributeValue union_of(const AttributeValue& lhs, const AttributeValue& rhs)
{
    switch (lhs.type()) {
    case AttributeType::StringSet:
        return AttributeValue::string_set(merge_sets(lhs.as_string_set(), rhs.as_string_set()));
    case AttributeType::NumberSet:
        return AttributeValue::number_set(merge_sets(lhs.as_number_set(), rhs.as_number_set()));
    default:
        return AttributeValue::binary_set(merge_sets(lhs.as_binary_set(), rhs.as_binary_set()));
    }
}

AttributeValue difference_of(const AttributeValue& lhs, const AttributeValue& rhs)
{
    switch (lhs.type()) {
    case AttributeType::StringSet:
        return AttributeValue::string_set(subtract_sets(lhs.as_string_set(), rhs.as_string_set()));
    case AttributeType::NumberSet:
        return AttributeValue::number_set(subtract_sets(lhs.as_number_set(), rhs.as_number_set()));
    default:
        return AttributeValue::binary_set(subtract_sets(lhs.as_binary_set(), rhs.as_binary_set()));
    }
}

class UpdateCalculator final {
public:
    UpdateCalculator(const Item& original, const PlaceholderBindings& bindings) noexcept
        : original_{original}
        , bindings_{bindings}
    {
    }

    std::error_code calculate(const Operand& operand, AttributeValue& out, std::string& message) const
    {
        switch (operand.kind) {
        case NodeKind::PathExpression: {
            const AttributeValue* value = nullptr;
            if (auto ec = lookup(static_cast<const PathExpression&>(operand), value, message)) {
                return ec;
            }
            if (value == nullptr) {
                return validation_error(message, "The provided expression refers to an attribute that does not exist in the item");
            }
            out = *value;
            return {};
        }
        case NodeKind::ValueReference: {
            const auto& placeholder = static_cast<const ValueReference&>(operand).placeholder;
            const auto* value = find_value(bindings_, placeholder);
            if (value == nullptr) {
                message = "An expression attribute value used in expression is not defined; attribute value: " + placeholder;
                return make_error_code(Errc::UnresolvedPlaceholder);
            }
            out = *value;
            return {};
        }
        case NodeKind::IfNotExistsFunction: {
            const auto& node = static_cast<const IfNotExistsFunction&>(operand);
            const AttributeValue* existing = nullptr;
            if (auto ec = lookup(*node.path, existing, message)) {
                return ec;
            }
            if (existing != nullptr) {
                out = *existing;
                return {};
            }
            return calculate(*node.fallback, out, message);
        }
        case NodeKind::ListAppendFunction: {
            const auto& node = static_cast<const ListAppendFunction&>(operand);
            AttributeValue left;
            AttributeValue right;
            if (auto ec = calculate(*node.left, left, message)) {
                return ec;
            }
            if (auto ec = calculate(*node.right, right, message)) {
                return ec;
            }
            if (left.type() != AttributeType::List || right.type() != AttributeType::List) {
                return validation_error(message, kIncorrectOperandType);
            }
            auto combined = left.as_list();
            combined.insert(combined.end(), right.as_list().begin(), right.as_list().end());
            out = AttributeValue::list(std::move(combined));
            return {};
        }
        case NodeKind::ArithmeticExpression: {
            const auto& node = static_cast<const ArithmeticExpression&>(operand);
            AttributeValue left;
            AttributeValue right;
            if (auto ec = calculate(*node.left, left, message)) {
                return ec;
            }
            if (auto ec = calculate(*node.right, right, message)) {
                return ec;
            }
            if (left.type() != AttributeType::Number || right.type() != AttributeType::Number) {
                return validation_error(message, kIncorrectOperandType);
            }
            Decimal result;
            const auto ec = node.op == ArithmeticOperator::Add ? left.as_number().add(right.as_number(), result, message)
                                                               : left.as_number().subtract(right.as_number(), result, message);
            if (ec) {
                return ec;
            }
            out = AttributeValue::number(std::move(result));
            return {};
        }
        default:
            return validation_error(message, "Invalid UpdateExpression: The function is not allowed in an update expression");
        }
    }

private:
    std::error_code lookup(const PathExpression& path, const AttributeValue*& out, std::string& message) const
    {
        ResolvedPath resolved;
        if (auto ec = resolve_path(path, bindings_, resolved, message)) {
            return ec;
        }
        out = find_attribute(original_, resolved);
        return {};
    }

    const Item& original_;
    const PlaceholderBindings& bindings_;
};

struct PlannedAction final {
    const UpdateAction* action = nullptr;
    ResolvedPath path{};
};

bool removes_list_element(const PlannedAction& entry) noexcept
{
    return entry.action->kind == NodeKind::RemoveAction && entry.path.back().kind == PathSegment::Kind::Index;
}

// Orders paths so that a removal never shifts an index another pending removal
// still refers to: at each level the greater index goes first.
bool removal_precedes(const ResolvedPath& lhs, const ResolvedPath& rhs) noexcept
{
    const auto common = std::min(lhs.size(), rhs.size());
    for (std::size_t position = 0U; position < common; ++position) {
        const auto& left = lhs[position];
        const auto& right = rhs[position];
        if (left.kind != right.kind) {
            return left.kind > right.kind;
        }
        if (left.kind == PathSegment::Kind::Index && left.index != right.index) {
            return left.index > right.index;
        }
        if (left.kind == PathSegment::Kind::Name && left.name != right.name) {
            return left.name > right.name;
        }
    }
    return lhs.size() > rhs.size();
}

std::error_code apply_add(Item& item, const ResolvedPath& path, const AttributeValue& operand, std::string& message)
{
    if (operand.type() != AttributeType::Number && !operand.is_set()) {
        return validation_error(message,
                                std::string{"Invalid UpdateExpression: Incorrect operand type for operator or function; "}
                                    + "operator: ADD, operand type: " + type_tag(operand.type()));
    }

    const auto* existing = find_attribute(item, path);
    if (existing == nullptr) {
        return assign_path(item, path, operand, message);
    }
    if (existing->type() != operand.type()) {
        return validation_error(message, kIncorrectOperandType);
    }
    if (operand.type() == AttributeType::Number) {
        Decimal sum;
        if (auto ec = existing->as_number().add(operand.as_number(), sum, message)) {
            return ec;
        }
        return assign_path(item, path, AttributeValue::number(std::move(sum)), message);
    }
    return assign_path(item, path, union_of(*existing, operand), message);
}

std::error_code apply_delete(Item& item, const ResolvedPath& path, const AttributeValue& operand, std::string& message)
{
    if (!operand.is_set()) {
        return validation_error(message,
                                std::string{"Invalid UpdateExpression: Incorrect operand type for operator or function; "}
                                    + "operator: DELETE, operand type: " + type_tag(operand.type()));
    }

    const auto* existing = find_attribute(item, path);
    if (existing == nullptr) {
        return {};
    }
    if (existing->type() != operand.type()) {
        return validation_error(message, kIncorrectOperandType);
    }
    auto remaining = difference_of(*existing, operand);
    if (remaining.cardinality() == 0U) {
        return erase_path(item, path, message);
    }
    return assign_path(item, path, std::move(remaining), message);
}

}  // namespace

std::error_code verify_bindings(const UpdateExpression& update, const PlaceholderBindings& bindings, std::string& message)
{
    PlaceholderUsage usage;
    collect_placeholders(update, usage);
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

std::error_code apply_update(const UpdateExpression& update,
                             const PlaceholderBindings& bindings,
                             Item& item,
                             std::string& message)
{
    if (auto ec = verify_bindings(update, bindings, message)) {
        return ec;
    }

    std::vector<PlannedAction> planned;
    const auto plan = [&](const UpdateAction* action) -> std::error_code {
        PlannedAction entry{};
        entry.action = action;
        if (auto ec = resolve_path(*action->path, bindings, entry.path, message)) {
            return ec;
        }
        for (const auto& other : planned) {
            if (paths_overlap(other.path, entry.path)) {
                return validation_error(message,
                                        "Invalid UpdateExpression: Two document paths overlap with each other; must remove or "
                                        "rewrite one of these paths; path one: "
                                            + render_path(other.path) + ", path two: " + render_path(entry.path));
            }
        }
        planned.push_back(std::move(entry));
        return {};
    };

    for (const auto* action : update.set_actions) {
        if (auto ec = plan(action)) {
            return ec;
        }
    }
    for (const auto* action : update.remove_actions) {
        if (auto ec = plan(action)) {
            return ec;
        }
    }
    for (const auto* action : update.add_actions) {
        if (auto ec = plan(action)) {
            return ec;
        }
    }
    for (const auto* action : update.delete_actions) {
        if (auto ec = plan(action)) {
            return ec;
        }
    }

    const UpdateCalculator calculator{item, bindings};
    std::vector<AttributeValue> set_values;
    set_values.reserve(update.set_actions.size());
    for (const auto* action : update.set_actions) {
        AttributeValue value;
        if (auto ec = calculator.calculate(*action->value, value, message)) {
            return ec;
        }
        set_values.push_back(std::move(value));
    }

    Item working = item;
    std::size_t set_index = 0U;
    std::vector<const PlannedAction*> element_removals;
    for (const auto& entry : planned) {
        if (removes_list_element(entry)) {
            element_removals.push_back(&entry);
            continue;
        }
        std::error_code ec;
        switch (entry.action->kind) {
        case NodeKind::SetAction:
            ec = assign_path(working, entry.path, std::move(set_values[set_index++]), message);
            break;
        case NodeKind::RemoveAction:
            ec = erase_path(working, entry.path, message);
            break;
        case NodeKind::AddAction:
            ec = apply_add(working,
                           entry.path,
                           *find_value(bindings, static_cast<const AddAction*>(entry.action)->value->placeholder),
                           message);
            break;
        case NodeKind::DeleteAction:
            ec = apply_delete(working,
                              entry.path,
                              *find_value(bindings, static_cast<const DeleteAction*>(entry.action)->value->placeholder),
                              message);
            break;
        default:
            ec = make_error_code(Errc::InternalError);
            message = "unsupported update action";
            break;
        }
        if (ec) {
            return ec;
        }
    }

    // List indices refer to the item as it was before the update.
    std::sort(element_removals.begin(), element_removals.end(), [](const PlannedAction* lhs, const PlannedAction* rhs) {
        return removal_precedes(lhs->path, rhs->path);
    });
    for (const auto* entry : element_removals) {
        if (auto ec = erase_path(working, entry->path, message)) {
            return ec;
        }
    }

    item = std::move(working);
    return {};
}

}  // namespace rynamo::expression
