#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/expression/ast.hpp"
#include "rynamo/expression/bindings.hpp"

#include <compare>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rynamo::expression {

struct EvaluationResult final {
    bool matched = false;
    std::error_code error{};
    std::string message{};

    [[nodiscard]] bool success() const noexcept { return !error; }
};

// Resolves #name segments through the bindings. Fails with Errc::UnresolvedPlaceholder.
std::error_code resolve_path(const PathExpression& path,
                             const PlaceholderBindings& bindings,
                             std::vector<PathSegment>& resolved,
                             std::string& message);

const AttributeValue* find_attribute(const Item& item, const std::vector<PathSegment>& path) noexcept;

const AttributeValue* find_value(const PlaceholderBindings& bindings, const std::string& placeholder) noexcept;

// Ordering for the scalar types that support it (S, N, B). Other pairs are unordered.
std::optional<std::strong_ordering> compare_scalars(const AttributeValue& lhs, const AttributeValue& rhs) noexcept;

std::error_code verify_bindings(const Condition& condition, const PlaceholderBindings& bindings, std::string& message);

// Verifies the bindings, then evaluates. Type mismatches and missing attributes
// evaluate to false; unresolved placeholders and invalid operands are errors.
EvaluationResult evaluate(const Condition& condition, const Item& item, const PlaceholderBindings& bindings);

// Same as evaluate() but assumes verify_bindings() already succeeded.
EvaluationResult evaluate_verified(const Condition& condition, const Item& item, const PlaceholderBindings& bindings);

}  // namespace rynamo::expression
