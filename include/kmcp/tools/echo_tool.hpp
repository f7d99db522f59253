#pragma once

#include <kmcp/core/result.hpp>
#include <kmcp/mcp/tool_registry.hpp>

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace kmcp {

constexpr const char* kEchoToolName = "echo";

// ---------------------------------------------------------------------------
// EchoTool: returns {"result": <prefix><message>}.
//
// The prefix comes from tools.echo.prefix in the config file and is empty
// by default.
// ---------------------------------------------------------------------------
class EchoTool : public IToolHandler {
public:
    explicit EchoTool(std::string prefix = {}) : prefix_(std::move(prefix)) {}

    [[nodiscard]] ToolOutcome Call(const nlohmann::json& arguments) const override;

    [[nodiscard]] static ToolDescriptor Descriptor();

    [[nodiscard]] const std::string& Prefix() const noexcept { return prefix_; }

private:
    std::string prefix_;
};

// Register the echo tool configured from a tools.echo object.
Result<void, Error> RegisterEchoTool(ToolRegistry& registry,
                                     const nlohmann::json& tool_config);

} // namespace kmcp
