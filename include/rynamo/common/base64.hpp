#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rynamo {

// Standard alphabet with '=' padding, as used for B values on the wire.
std::string base64_encode(std::string_view bytes);

// Rejects characters outside the alphabet, bad padding and truncated groups.
std::optional<std::string> base64_decode(std::string_view text);

}  // namespace rynamo
