#include <kmcp/mcp/http_server.hpp>

#include <kmcp/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <utility>

#include <sys/socket.h>

namespace kmcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

// Releases a worker reservation and a limiter slot when a connection task
// ends, however it ends.
class ConnectionSlot {
public:
    ConnectionSlot(ConnectionLimiter& limiter, std::atomic<std::size_t>& busy)
        : limiter_(limiter), busy_(busy) {}
    ~ConnectionSlot() {
        busy_.fetch_sub(1);
        limiter_.Release();
    }

    ConnectionSlot(const ConnectionSlot&) = delete;
    ConnectionSlot& operator=(const ConnectionSlot&) = delete;

private:
    ConnectionLimiter& limiter_;
    std::atomic<std::size_t>& busy_;
};

// ---------------------------------------------------------------------------
// AdmissionTaskQueue: httplib task queue that runs each accepted connection
// on a fixed worker pool. A connection occupies its worker until it closes,
// so one is admitted only while a worker is free and the limiter agrees.
// Returning false from enqueue() makes httplib close the socket right away.
// ---------------------------------------------------------------------------
class AdmissionTaskQueue : public httplib::TaskQueue {
public:
    AdmissionTaskQueue(std::size_t workers, ConnectionLimiter& limiter,
                       ServerMetrics& metrics)
        : workers_(workers), pool_(workers), limiter_(limiter), metrics_(metrics) {}

    bool enqueue(std::function<void()> fn) override {
        if (!ReserveWorker()) {
            metrics_.CountRejectedConnection();
            LogDebug("http", "Connection rejected: all workers busy");
            return false;
        }
        if (!limiter_.TryAcquire(ConnectionLimiter::Clock::now())) {
            busy_.fetch_sub(1);
            metrics_.CountRejectedConnection();
            LogDebug("http", "Connection rejected: limit reached");
            return false;
        }
        bool queued = pool_.enqueue([this, fn = std::move(fn)] {
            ConnectionSlot slot(limiter_, busy_);
            fn();
        });
        if (!queued) {
            busy_.fetch_sub(1);
            limiter_.Release();
            metrics_.CountRejectedConnection();
        }
        return queued;
    }

    void shutdown() override { pool_.shutdown(); }

private:
    bool ReserveWorker() {
        auto busy = busy_.load();
        do {
            if (busy >= workers_) {
                return false;
            }
        } while (!busy_.compare_exchange_weak(busy, busy + 1));
        return true;
    }

    const std::size_t workers_;
    std::atomic<std::size_t> busy_{0};
    httplib::ThreadPool pool_;
    ConnectionLimiter& limiter_;
    ServerMetrics& metrics_;
};

std::string ErrorBody(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ConnectionLimiter
// ---------------------------------------------------------------------------
ConnectionLimiter::ConnectionLimiter(std::size_t max_concurrent,
                                     std::size_t max_per_second)
    : max_concurrent_(max_concurrent), max_per_second_(max_per_second) {}

bool ConnectionLimiter::TryAcquire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= max_concurrent_) {
        return false;
    }
    if (max_per_second_ > 0) {
        if (now - window_start_ >= std::chrono::seconds{1}) {
            window_start_ = now;
            admitted_in_window_ = 0;
        }
        if (admitted_in_window_ >= max_per_second_) {
            return false;
        }
        ++admitted_in_window_;
    }
    ++active_;
    return true;
}

void ConnectionLimiter::Release() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
}

std::size_t ConnectionLimiter::Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

// ---------------------------------------------------------------------------
// HttpServer
// ---------------------------------------------------------------------------
struct HttpServer::Impl {
    httplib::Server server;
};

HttpServer::HttpServer(McpDispatcher& dispatcher, HttpServerOptions options)
    : dispatcher_(dispatcher),
      options_(std::move(options)),
      limiter_(options_.max_connections, options_.max_connection_rate),
      impl_(std::make_unique<Impl>()) {
    auto& svr = impl_->server;
    auto& metrics = dispatcher_.Context().Metrics();
    const auto workers = options_.worker_threads == 0 ? 1 : options_.worker_threads;

    svr.new_task_queue = [this, workers, &metrics] {
        return new AdmissionTaskQueue(workers, limiter_, metrics);
    };
    // No SO_REUSEPORT: binding a port that is already in use must fail.
    svr.set_socket_options([](socket_t sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const void*>(&yes), sizeof(yes));
    });
    svr.set_keep_alive_timeout(options_.keep_alive.count());
    svr.set_read_timeout(options_.request_timeout.count(), 0);
    svr.set_write_timeout(options_.disconnect_timeout.count(), 0);
    svr.set_payload_max_length(options_.max_body_bytes);

    svr.set_default_headers({
        {"X-Content-Type-Options", "nosniff"},
        {"X-Frame-Options", "DENY"},
        {"X-XSS-Protection", "1; mode=block"},
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogInfo("http", req.method + " " + req.path + " " + std::to_string(res.status));
    });

    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        switch (res.status) {
            case 404: res.set_content(ErrorBody("Not found"), kJsonContentType); break;
            case 413: res.set_content(ErrorBody("Payload too large"), kJsonContentType); break;
            default:  res.set_content(ErrorBody("Request failed"), kJsonContentType); break;
        }
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // Non-standard exception type; the generic description stands.
        }
        LogError("http", "Unhandled exception on " + req.path + ": " + what);
        res.status = 500;
        res.set_content(ErrorBody("Internal server error"), kJsonContentType);
    });

    RegisterRoutes();
}

HttpServer::~HttpServer() {
    if (listen_thread_.joinable()) {
        impl_->server.stop();
        listen_thread_.join();
    }
}

void HttpServer::RegisterRoutes() {
    auto& svr = impl_->server;

    auto mcp = [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(dispatcher_.HandleMessage(req.body), kJsonContentType);
    };
    auto health = [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"status", "ok"},
            {"service", dispatcher_.Context().Info().name},
        };
        res.set_content(DumpJson(body), kJsonContentType);
    };

    svr.Post("/mcp", mcp);
    svr.Post("/", mcp);
    svr.Get("/health", health);
    svr.Get("/", health);

    svr.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(dispatcher_.Context().Metrics().Snapshot().dump(),
                        kJsonContentType);
    });

    svr.Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
        auto payload = ToolsListResult(dispatcher_.Context().Registry());
        payload["count"] = payload["tools"].size();
        res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
        res.set_header("X-Accel-Buffering", "no");
        res.set_content("data: " + DumpJson(payload) + "\n\n", "text/event-stream");
    });
}

Result<void, Error> HttpServer::Bind() {
    auto& svr = impl_->server;
    if (options_.port == 0) {
        bound_port_ = svr.bind_to_any_port(options_.host);
    } else if (svr.bind_to_port(options_.host, options_.port)) {
        bound_port_ = options_.port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ < 0) {
        return Result<void, Error>::Err(
            Error{"HttpServer::Bind",
                  "Cannot listen on " + options_.host + ":" +
                      std::to_string(options_.port) +
                      " (address in use or not available)",
                  ErrorCategory::Transport});
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> HttpServer::Start() {
    if (bound_port_ < 0) {
        return Result<void, Error>::Err(
            Error{"HttpServer::Start", "Start() called before a successful Bind()",
                  ErrorCategory::Transport});
    }
    if (listen_thread_.joinable()) {
        return Result<void, Error>::Err(
            Error{"HttpServer::Start", "Server is already running",
                  ErrorCategory::Transport});
    }

    std::packaged_task<void()> task([this] {
        if (!impl_->server.listen_after_bind()) {
            LogError("http", "Listener stopped unexpectedly");
        }
    });
    listen_done_ = task.get_future();
    listen_thread_ = std::thread(std::move(task));
    impl_->server.wait_until_ready();

    LogInfo("http", "Listening on " + options_.host + ":" + std::to_string(bound_port_) +
                        " (workers: " + std::to_string(options_.worker_threads) +
                        ", max connections: " + std::to_string(options_.max_connections) +
                        ", max rate: " + std::to_string(options_.max_connection_rate) + "/s)");
    return Result<void, Error>::Ok();
}

bool HttpServer::Stop() {
    if (!listen_thread_.joinable()) {
        return true;
    }

    LogInfo("http", "Stopping; waiting up to " +
                        std::to_string(options_.shutdown_timeout.count()) +
                        "s for in-flight requests");
    impl_->server.stop();

    if (listen_done_.wait_for(options_.shutdown_timeout) != std::future_status::ready) {
        LogWarn("http", "Shutdown grace period expired with " +
                            std::to_string(limiter_.Active()) +
                            " connection(s) still open");
        return false;
    }
    listen_thread_.join();
    LogInfo("http", "Stopped");
    return true;
}

bool HttpServer::IsRunning() const {
    return impl_->server.is_running();
}

} // namespace kmcp
