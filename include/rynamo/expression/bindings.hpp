#pragma once

#include "rynamo/common/attribute_value.hpp"

#include <map>
#include <string>

namespace rynamo::expression {

// Request-scoped placeholder tables. Keys include their sigil ("#n", ":v").
struct PlaceholderBindings final {
    std::map<std::string, std::string> names{};
    std::map<std::string, AttributeValue> values{};
};

}  // namespace rynamo::expression
