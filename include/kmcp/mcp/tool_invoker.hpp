#pragma once

#include <kmcp/core/result.hpp>
#include <kmcp/mcp/json_rpc.hpp>
#include <kmcp/mcp/server_context.hpp>
#include <kmcp/mcp/tool_registry.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace kmcp {

/// {"content":[{"type":"text","text":<text>}],"isError":<is_error>}
nlohmann::json MakeToolCallResult(const std::string& text, bool is_error);

// ---------------------------------------------------------------------------
// InvokeTool: run a registered tool and shape the outcome for tools/call.
//
//   unknown tool            -> Err(-32602 "Unknown tool: <name>")
//   handler Ok(value)       -> Ok(content text = value.dump(), isError false)
//   handler Err(message)    -> Ok(content text = "Error: <message>", isError true)
//   handler throws          -> Err(-32603 Internal error, data = what())
// ---------------------------------------------------------------------------
Result<nlohmann::json, RpcError> InvokeTool(const ToolRegistry& registry,
                                            ServerMetrics& metrics,
                                            const std::string& name,
                                            const nlohmann::json& arguments);

} // namespace kmcp
