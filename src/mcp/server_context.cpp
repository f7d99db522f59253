#include <kmcp/mcp/server_context.hpp>

#include <stdexcept>

namespace kmcp {

nlohmann::json ServerMetrics::Snapshot() const {
    return {
        {"requests_total", RequestsTotal()},
        {"tool_calls_total", ToolCallsTotal()},
        {"errors_total", ErrorsTotal()},
        {"rejected_connections_total", RejectedConnectionsTotal()},
        {"status", "ok"},
    };
}

ServerContext::ServerContext(ServerInfo info,
                             std::shared_ptr<const ToolRegistry> registry)
    : info_(std::move(info)), registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("ServerContext requires a tool registry");
    }
}

} // namespace kmcp
