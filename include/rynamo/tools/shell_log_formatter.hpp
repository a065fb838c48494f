#pragma once

#include "rynamo/shell/shell_engine.hpp"

#include <string>

namespace rynamo::tools {

// One JSON object per command, without a trailing newline.
[[nodiscard]] std::string format_shell_command_log_json(const rynamo::shell::CommandMetrics& metrics);

}  // namespace rynamo::tools
