#pragma once

#include "rynamo/common/attribute_value.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace rynamo::shell {

// Parses a single typed literal such as S"x" or M{a: N"1"}. Trailing input is rejected.
std::error_code parse_value_literal(std::string_view text, AttributeValue& out, std::string& message);

// Parses a map literal and returns its entries as an item.
std::error_code parse_item_literal(std::string_view text, Item& out, std::string& message);

std::string render_value(const AttributeValue& value);
std::string render_item(const Item& item);

// Renders a map key bare when it is a plain word, quoted otherwise.
std::string render_key(std::string_view key);

}  // namespace rynamo::shell
