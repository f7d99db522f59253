#pragma once

#include <kmcp/core/log.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kmcp {

enum class TransportMode {
    Stdio,
    Http,
};

const char* TransportModeName(TransportMode mode) noexcept;

// Upper bound for the worker pool when it is derived from the CPU count.
constexpr std::size_t kMaxDefaultWorkerThreads = 16;
constexpr std::size_t kMaxWorkerThreads = 256;

struct HttpConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    std::optional<std::size_t> worker_threads;  // default: CPU count, capped
    std::size_t max_connections = 10000;
    std::size_t max_connection_rate = 1000;
    int keep_alive_seconds = 30;
    int request_timeout_seconds = 30;
    int disconnect_timeout_seconds = 2;
    int shutdown_timeout_seconds = 10;
    std::size_t max_body_bytes = 4 * 1024 * 1024;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::optional<std::string> file;
};

struct AppConfig {
    std::string server_name = "mcp-server";
    std::string server_version = "0.1.0";
    TransportMode transport = TransportMode::Stdio;
    HttpConfig http;
    LoggingConfig logging;
    nlohmann::json tools = nlohmann::json::object();  // tools.<name> -> object
};

// ---------------------------------------------------------------------------
// ConfigOverrides: values supplied by the environment or the command line.
// Unset fields leave the underlying configuration untouched.
// ---------------------------------------------------------------------------
struct ConfigOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> server_name;
    std::optional<std::string> server_version;
    std::optional<TransportMode> transport;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::size_t> worker_threads;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
};

} // namespace kmcp
