#pragma once

#include <kmcp/mcp/tool_registry.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace kmcp {

// Identity reported in initialize and /health.
struct ServerInfo {
    std::string name;
    std::string version;
};

// ---------------------------------------------------------------------------
// ServerMetrics: process-lifetime counters. Increments are relaxed: only
// the totals matter, not their ordering relative to other memory.
// ---------------------------------------------------------------------------
class ServerMetrics {
public:
    void CountRequest() noexcept { requests_total_.fetch_add(1, std::memory_order_relaxed); }
    void CountToolCall() noexcept { tool_calls_total_.fetch_add(1, std::memory_order_relaxed); }
    void CountError() noexcept { errors_total_.fetch_add(1, std::memory_order_relaxed); }
    void CountRejectedConnection() noexcept {
        rejected_connections_total_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t RequestsTotal() const noexcept {
        return requests_total_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t ToolCallsTotal() const noexcept {
        return tool_calls_total_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t ErrorsTotal() const noexcept {
        return errors_total_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t RejectedConnectionsTotal() const noexcept {
        return rejected_connections_total_.load(std::memory_order_relaxed);
    }

    // Body of GET /metrics.
    [[nodiscard]] nlohmann::json Snapshot() const;

private:
    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> tool_calls_total_{0};
    std::atomic<std::uint64_t> errors_total_{0};
    std::atomic<std::uint64_t> rejected_connections_total_{0};
};

// ---------------------------------------------------------------------------
// ServerContext: everything a request handler may touch, owned once per
// process and passed by reference into the dispatcher and transports.
// ---------------------------------------------------------------------------
class ServerContext {
public:
    ServerContext(ServerInfo info, std::shared_ptr<const ToolRegistry> registry);

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return *registry_; }
    [[nodiscard]] ServerMetrics& Metrics() noexcept { return metrics_; }
    [[nodiscard]] const ServerMetrics& Metrics() const noexcept { return metrics_; }

private:
    ServerInfo info_;
    std::shared_ptr<const ToolRegistry> registry_;
    ServerMetrics metrics_;
};

} // namespace kmcp
