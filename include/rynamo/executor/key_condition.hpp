#pragma once

#include "rynamo/catalog/table_schema.hpp"
#include "rynamo/expression/ast.hpp"
#include "rynamo/expression/bindings.hpp"
#include "rynamo/storage/key_value.hpp"

#include <optional>
#include <string>
#include <system_error>

namespace rynamo::executor {

struct SortKeyBound final {
    storage::KeyValue value{};
    bool inclusive = true;
};

// A query reduced to one partition and a contiguous sort-key range.
struct KeyConditionPlan final {
    storage::KeyValue partition{};
    std::optional<SortKeyBound> lower{};
    std::optional<SortKeyBound> upper{};

    [[nodiscard]] bool contains(const storage::SortKey& sort) const noexcept;
};

// Splits a key condition into `pk = :v` and at most one sort-key condition
// (=, <, <=, >, >=, BETWEEN or begins_with), ANDed in either order.
std::error_code plan_key_condition(const expression::Condition& condition,
                                   const catalog::TableSchema& schema,
                                   const expression::PlaceholderBindings& bindings,
                                   KeyConditionPlan& plan,
                                   std::string& message);

// Bounds a plan by a sort-key condition alone. A null condition selects the
// whole partition.
std::error_code plan_sort_key_condition(const expression::Condition* condition,
                                        const catalog::TableSchema& schema,
                                        const expression::PlaceholderBindings& bindings,
                                        KeyConditionPlan& plan,
                                        std::string& message);

// Smallest byte string greater than every string starting with prefix.
// Empty when no such string exists.
std::optional<std::string> prefix_successor(const std::string& prefix);

}  // namespace rynamo::executor
