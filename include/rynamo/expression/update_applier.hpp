#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/expression/ast.hpp"
#include "rynamo/expression/bindings.hpp"

#include <string>
#include <system_error>

namespace rynamo::expression {

std::error_code verify_bindings(const UpdateExpression& update, const PlaceholderBindings& bindings, std::string& message);

// Applies every action of an update expression to item. Right-hand sides are
// computed against the item as it was before the update. On error the item is
// left untouched.
std::error_code apply_update(const UpdateExpression& update,
                             const PlaceholderBindings& bindings,
                             Item& item,
                             std::string& message);

}  // namespace rynamo::expression
