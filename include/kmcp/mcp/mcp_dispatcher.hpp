#pragma once

#include <kmcp/mcp/json_rpc.hpp>
#include <kmcp/mcp/server_context.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kmcp {

constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpDispatcher: MCP 2024-11-05 method routing, shared by every transport.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/initialized (acknowledged with an empty result)
//
// Holds no per-request state; one instance serves all worker threads.
// ---------------------------------------------------------------------------
class McpDispatcher {
public:
    explicit McpDispatcher(ServerContext& context);

    // Raw bytes in, encoded envelope out. Always produces exactly one
    // response and never throws. Counts the request in the metrics.
    [[nodiscard]] std::string HandleMessage(std::string_view raw);

    // Dispatch an already decoded request.
    [[nodiscard]] JsonRpcResponse Dispatch(const JsonRpcRequest& request);

    [[nodiscard]] ServerContext& Context() noexcept { return context_; }

private:
    JsonRpcResponse HandleInitialize(const JsonRpcRequest& request);
    JsonRpcResponse HandleToolsList(const JsonRpcRequest& request);
    JsonRpcResponse HandleToolsCall(const JsonRpcRequest& request);

    ServerContext& context_;
};

/// {"tools":[...]}: the tools/list result, also used by the SSE endpoint.
nlohmann::json ToolsListResult(const ToolRegistry& registry);

} // namespace kmcp
