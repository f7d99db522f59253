#pragma once

#include <kmcp/core/result.hpp>
#include <kmcp/mcp/mcp_dispatcher.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace kmcp {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    int port = 3000;  // 0 binds an ephemeral port
    std::size_t worker_threads = 4;  // also caps concurrently open connections
    std::size_t max_connections = 10000;
    std::size_t max_connection_rate = 1000;  // new connections per second, 0 = unlimited
    std::chrono::seconds keep_alive{30};
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds disconnect_timeout{2};
    std::chrono::seconds shutdown_timeout{10};
    std::size_t max_body_bytes = 4 * 1024 * 1024;
};

// ---------------------------------------------------------------------------
// ConnectionLimiter: admission control for accepted sockets.
//
// Caps concurrently served connections and the number of connections
// admitted per one-second window. A refused connection is closed by the
// caller, never queued.
// ---------------------------------------------------------------------------
class ConnectionLimiter {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionLimiter(std::size_t max_concurrent, std::size_t max_per_second);

    [[nodiscard]] bool TryAcquire(Clock::time_point now);
    void Release() noexcept;

    [[nodiscard]] std::size_t Active() const;

private:
    std::size_t max_concurrent_;
    std::size_t max_per_second_;
    mutable std::mutex mutex_;
    std::size_t active_ = 0;
    Clock::time_point window_start_{};
    std::size_t admitted_in_window_ = 0;
};

// ---------------------------------------------------------------------------
// HttpServer: MCP over HTTP (cpp-httplib).
//
// Routes:
//   POST /mcp, POST /   JSON-RPC request -> 200 application/json envelope
//   GET  /health, GET / {"status":"ok","service":<name>}
//   GET  /metrics       counters snapshot
//   GET  /sse           one tool-discovery event, then the stream ends
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(McpDispatcher& dispatcher, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind the listening socket. Fails when the address is unusable or the
    // port is taken.
    Result<void, Error> Bind();

    // Serve on a background thread. Requires a successful Bind().
    Result<void, Error> Start();

    // Stop accepting and wait up to shutdown_timeout for in-flight
    // connections. Returns false when the grace period ran out; the listener
    // is then still draining. Call Stop() again to keep waiting, or end the
    // process: the destructor joins the listener and blocks until the
    // remaining connections close.
    bool Stop();

    [[nodiscard]] int Port() const noexcept { return bound_port_; }
    [[nodiscard]] bool IsRunning() const;

private:
    struct Impl;

    void RegisterRoutes();

    McpDispatcher& dispatcher_;
    HttpServerOptions options_;
    ConnectionLimiter limiter_;
    std::unique_ptr<Impl> impl_;
    int bound_port_ = -1;
    std::thread listen_thread_;
    std::future<void> listen_done_;
};

} // namespace kmcp
