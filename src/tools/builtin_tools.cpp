#include <kmcp/tools/builtin_tools.hpp>

#include <kmcp/config/config_loader.hpp>
#include <kmcp/core/log.hpp>
#include <kmcp/tools/echo_tool.hpp>

namespace kmcp {

Result<void, Error> RegisterBuiltinTools(ToolRegistry& registry,
                                         const AppConfig& config) {
    auto echo = RegisterEchoTool(registry, GetToolConfig(config, kEchoToolName));
    if (echo.IsErr()) {
        return echo;
    }

    LogDebug("tools", "Registered " + std::to_string(registry.Size()) + " built-in tool(s)");
    return Result<void, Error>::Ok();
}

} // namespace kmcp
