#pragma once

#include "rynamo/common/attribute_value.hpp"
#include "rynamo/common/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace rynamo {

inline constexpr std::size_t kMinTableNameLength = 3U;
inline constexpr std::size_t kMaxTableNameLength = 255U;
inline constexpr std::size_t kMaxItemSizeBytes = 400U * 1024U;

bool is_valid_table_name(std::string_view name) noexcept;
std::error_code validate_table_name(std::string_view name, std::string& message);

std::error_code validate_attribute_value(const AttributeValue& value, std::string& message);
std::error_code validate_item(const Item& item, std::string& message);

std::error_code ensure_exists(bool exists, Errc error_if_missing) noexcept;
std::error_code ensure_absent(bool present, Errc error_if_present) noexcept;

}  // namespace rynamo
