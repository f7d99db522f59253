#include <kmcp/mcp/tool_invoker.hpp>

#include <kmcp/core/log.hpp>

#include <exception>

namespace kmcp {

nlohmann::json MakeToolCallResult(const std::string& text, bool is_error) {
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", text}}
        })},
        {"isError", is_error},
    };
}

Result<nlohmann::json, RpcError> InvokeTool(const ToolRegistry& registry,
                                            ServerMetrics& metrics,
                                            const std::string& name,
                                            const nlohmann::json& arguments) {
    const ToolEntry* entry = registry.Find(name);
    if (entry == nullptr) {
        return Result<nlohmann::json, RpcError>::Err(
            RpcError{kInvalidParams, "Unknown tool: " + name, std::nullopt});
    }

    metrics.CountToolCall();

    ToolOutcome outcome = ToolOutcome::Err("");
    try {
        outcome = entry->handler->Call(arguments);
    } catch (const std::exception& e) {
        LogError("tools", "Tool '" + name + "' failed: " + e.what());
        return Result<nlohmann::json, RpcError>::Err(
            RpcError::Standard(kInternalError,
                               "Tool '" + name + "' failed: " + e.what()));
    } catch (...) {
        LogError("tools", "Tool '" + name + "' failed with a non-standard exception");
        return Result<nlohmann::json, RpcError>::Err(
            RpcError::Standard(kInternalError,
                               "Tool '" + name + "' failed with an unknown exception"));
    }

    if (outcome.IsErr()) {
        LogDebug("tools", "Tool '" + name + "' reported: " + outcome.Error());
        return Result<nlohmann::json, RpcError>::Ok(
            MakeToolCallResult("Error: " + outcome.Error(), true));
    }
    return Result<nlohmann::json, RpcError>::Ok(
        MakeToolCallResult(DumpJson(outcome.Value()), false));
}

} // namespace kmcp
