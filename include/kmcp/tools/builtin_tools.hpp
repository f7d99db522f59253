#pragma once

#include <kmcp/config/app_config.hpp>
#include <kmcp/core/result.hpp>
#include <kmcp/mcp/tool_registry.hpp>

namespace kmcp {

// Register every tool shipped with the server, each configured from its
// tools.<name> section.
Result<void, Error> RegisterBuiltinTools(ToolRegistry& registry,
                                         const AppConfig& config);

} // namespace kmcp
