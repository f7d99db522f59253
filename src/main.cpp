#include <kmcp/config/config_loader.hpp>
#include <kmcp/core/log.hpp>
#include <kmcp/core/shutdown.hpp>
#include <kmcp/core/terminal.hpp>
#include <kmcp/core/version.hpp>
#include <kmcp/mcp/http_server.hpp>
#include <kmcp/mcp/mcp_dispatcher.hpp>
#include <kmcp/mcp/server_context.hpp>
#include <kmcp/mcp/stdio_server.hpp>
#include <kmcp/tools/builtin_tools.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;

// Fatal startup errors go to stderr directly: the logger may not exist yet,
// and stdout belongs to the protocol in stdio mode.
int Fail(const kmcp::Error& error) {
    std::cerr << "kmcp-server: " << error.ToString() << "\n";
    return error.ExitCode();
}

kmcp::Result<void, kmcp::Error> SetupLogging(const kmcp::LoggingConfig& logging) {
    std::unique_ptr<kmcp::ILogSink> sink;
    if (logging.file) {
        std::ofstream file(*logging.file, std::ios::app);
        if (!file) {
            return kmcp::Result<void, kmcp::Error>::Err(
                kmcp::Error{"SetupLogging", "Cannot open log file: " + *logging.file,
                            kmcp::ErrorCategory::Config});
        }
        sink = std::make_unique<kmcp::FileSink>(std::move(file), logging.format);
    } else if (logging.format == kmcp::LogFormat::Json) {
        sink = std::make_unique<kmcp::JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<kmcp::ColorConsoleSink>(kmcp::ShouldColorStderr());
    }
    kmcp::InitGlobalLogger(std::move(sink), logging.level);
    return kmcp::Result<void, kmcp::Error>::Ok();
}

kmcp::HttpServerOptions MakeHttpOptions(const kmcp::AppConfig& config) {
    const auto& http = config.http;
    kmcp::HttpServerOptions options;
    options.host = http.host;
    options.port = http.port;
    options.worker_threads = kmcp::ResolveWorkerThreads(config);
    options.max_connections = http.max_connections;
    options.max_connection_rate = http.max_connection_rate;
    options.keep_alive = std::chrono::seconds{http.keep_alive_seconds};
    options.request_timeout = std::chrono::seconds{http.request_timeout_seconds};
    options.disconnect_timeout = std::chrono::seconds{http.disconnect_timeout_seconds};
    options.shutdown_timeout = std::chrono::seconds{http.shutdown_timeout_seconds};
    options.max_body_bytes = http.max_body_bytes;
    return options;
}

int RunStdio(kmcp::McpDispatcher& dispatcher) {
    kmcp::InstallShutdownHandlers(/*close_stdin=*/true);
    kmcp::StdioServer server(dispatcher, std::cin, std::cout,
                             [] { return kmcp::ShutdownRequested(); });
    server.Run();
    return kExitSuccess;
}

int RunHttp(kmcp::McpDispatcher& dispatcher, const kmcp::AppConfig& config) {
    kmcp::InstallShutdownHandlers();

    kmcp::HttpServer server(dispatcher, MakeHttpOptions(config));
    auto bound = server.Bind();
    if (bound.IsErr()) {
        kmcp::LogError("main", bound.Error().ToString());
        return Fail(bound.Error());
    }
    auto started = server.Start();
    if (started.IsErr()) {
        kmcp::LogError("main", started.Error().ToString());
        return Fail(started.Error());
    }

    while (!kmcp::ShutdownRequested() && server.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    kmcp::LogInfo("main", "Shutdown requested");

    if (!server.Stop()) {
        // Connections still open after the grace period are abandoned;
        // joining their workers could block forever.
        kmcp::LogWarn("main", "Forcing exit");
        std::cerr.flush();
        std::_Exit(kExitSuccess);
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto env = kmcp::LoadFromEnv();
    if (env.IsErr()) {
        return Fail(env.Error());
    }
    auto cli = kmcp::LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Fail(cli.Error());
    }

    auto loaded = kmcp::LoadConfig(env.Value(), cli.Value());
    if (loaded.IsErr()) {
        return Fail(loaded.Error());
    }
    const kmcp::AppConfig config = std::move(loaded).Value();

    auto valid = kmcp::ValidateConfig(config);
    if (valid.IsErr()) {
        return Fail(valid.Error());
    }

    auto logging = SetupLogging(config.logging);
    if (logging.IsErr()) {
        return Fail(logging.Error());
    }

    auto registry = std::make_shared<kmcp::ToolRegistry>();
    auto registered = kmcp::RegisterBuiltinTools(*registry, config);
    if (registered.IsErr()) {
        kmcp::LogError("main", registered.Error().ToString());
        return Fail(registered.Error());
    }

    kmcp::ServerContext context(
        kmcp::ServerInfo{config.server_name, config.server_version},
        std::shared_ptr<const kmcp::ToolRegistry>(std::move(registry)));
    kmcp::McpDispatcher dispatcher(context);

    kmcp::LogInfo("main", "kmcp-server " + std::string(kmcp::kVersion) + " starting as '" +
                              config.server_name + "' v" + config.server_version +
                              " (transport: " + kmcp::TransportModeName(config.transport) +
                              ", tools: " + std::to_string(context.Registry().Size()) + ")");

    if (config.transport == kmcp::TransportMode::Http) {
        return RunHttp(dispatcher, config);
    }
    return RunStdio(dispatcher);
}
