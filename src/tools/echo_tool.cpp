#include <kmcp/tools/echo_tool.hpp>

#include <memory>

namespace kmcp {

ToolOutcome EchoTool::Call(const nlohmann::json& arguments) const {
    if (!arguments.is_object()) {
        return ToolOutcome::Err("Missing required parameter: message");
    }
    auto it = arguments.find("message");
    if (it == arguments.end() || !it->is_string()) {
        return ToolOutcome::Err("Missing required parameter: message");
    }
    return ToolOutcome::Ok(
        nlohmann::json{{"result", prefix_ + it->get<std::string>()}});
}

ToolDescriptor EchoTool::Descriptor() {
    return ToolDescriptor{
        kEchoToolName,
        "Echo a message back to the client.",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "The message to echo"},
                }},
            }},
            {"required", {"message"}},
        },
    };
}

Result<void, Error> RegisterEchoTool(ToolRegistry& registry,
                                     const nlohmann::json& tool_config) {
    std::string prefix;
    if (tool_config.is_object()) {
        auto it = tool_config.find("prefix");
        if (it != tool_config.end()) {
            if (!it->is_string()) {
                return Result<void, Error>::Err(
                    Error{"RegisterEchoTool", "tools.echo.prefix must be a string",
                          ErrorCategory::Config});
            }
            prefix = it->get<std::string>();
        }
    }
    return registry.Register(EchoTool::Descriptor(),
                             std::make_shared<const EchoTool>(std::move(prefix)));
}

} // namespace kmcp
