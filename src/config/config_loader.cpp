#include <kmcp/config/config_loader.hpp>

#include <kmcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <thread>

namespace kmcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

std::string Lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Whole-string unsigned integer in [min, max].
std::optional<unsigned long long> ParseUnsigned(const std::string& text,
                                                unsigned long long min,
                                                unsigned long long max) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }
    try {
        auto value = std::stoull(text);
        if (value < min || value > max) {
            return std::nullopt;
        }
        return value;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Plain YAML scalars become the narrowest JSON type that holds them;
// quoted scalars always stay strings.
nlohmann::json ScalarToJson(const YAML::Node& node) {
    const auto& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

Result<void, Error> ParseHttpSection(const YAML::Node& http, HttpConfig& out) {
    if (!http.IsMap()) {
        return Result<void, Error>::Err(MakeConfigError("'http' must be a mapping"));
    }
    if (http["host"]) {
        out.host = http["host"].as<std::string>();
    }
    if (http["port"]) {
        out.port = http["port"].as<uint16_t>();
    }
    if (http["workers"]) {
        out.worker_threads = http["workers"].as<std::size_t>();
    }
    if (http["max_connections"]) {
        out.max_connections = http["max_connections"].as<std::size_t>();
    }
    if (http["max_connection_rate"]) {
        out.max_connection_rate = http["max_connection_rate"].as<std::size_t>();
    }
    if (http["keep_alive_seconds"]) {
        out.keep_alive_seconds = http["keep_alive_seconds"].as<int>();
    }
    if (http["request_timeout_seconds"]) {
        out.request_timeout_seconds = http["request_timeout_seconds"].as<int>();
    }
    if (http["disconnect_timeout_seconds"]) {
        out.disconnect_timeout_seconds = http["disconnect_timeout_seconds"].as<int>();
    }
    if (http["shutdown_timeout_seconds"]) {
        out.shutdown_timeout_seconds = http["shutdown_timeout_seconds"].as<int>();
    }
    if (http["max_body_bytes"]) {
        out.max_body_bytes = http["max_body_bytes"].as<std::size_t>();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ParseLoggingSection(const YAML::Node& logging, LoggingConfig& out) {
    if (!logging.IsMap()) {
        return Result<void, Error>::Err(MakeConfigError("'logging' must be a mapping"));
    }
    if (logging["level"]) {
        auto text = logging["level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid logging.level: '" + text + "'"));
        }
        out.level = *level;
    }
    if (logging["format"]) {
        auto text = logging["format"].as<std::string>();
        auto format = ParseLogFormat(text);
        if (!format) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid logging.format: '" + text + "'"));
        }
        out.format = *format;
    }
    if (logging["file"]) {
        out.file = logging["file"].as<std::string>();
    }
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Top level of the config file must be a mapping"));
    }

    try {
        if (root["name"]) {
            config.server_name = root["name"].as<std::string>();
        }
        if (root["version"]) {
            config.server_version = root["version"].as<std::string>();
        }
        if (root["transport"]) {
            auto text = root["transport"].as<std::string>();
            auto mode = ParseTransportMode(text);
            if (!mode) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid transport '" + text +
                                    "'. Must be 'stdio' or 'http'"));
            }
            config.transport = *mode;
        }
        if (root["http"]) {
            auto parsed = ParseHttpSection(root["http"], config.http);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(parsed).Error());
            }
        }
        if (root["logging"]) {
            auto parsed = ParseLoggingSection(root["logging"], config.logging);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(parsed).Error());
            }
        }
        if (root["tools"]) {
            auto tools = YamlToJson(root["tools"]);
            if (tools.is_null()) {
                tools = nlohmann::json::object();
            }
            if (!tools.is_object()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'tools' must be a mapping of tool name to settings"));
            }
            config.tools = std::move(tools);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in config: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

const char* TransportModeName(TransportMode mode) noexcept {
    switch (mode) {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::Http:  return "http";
    }
    return "stdio";
}

std::optional<TransportMode> ParseTransportMode(std::string_view text) {
    const auto lowered = Lower(text);
    if (lowered == "stdio") return TransportMode::Stdio;
    if (lowered == "http") return TransportMode::Http;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file '" + std::string(file_path) +
                            "': " + e.what()));
    }
    return ParseYamlRoot(root);
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
    return ParseYamlRoot(root);
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv) {
    ConfigOverrides overrides;

    if (auto val = getenv("KMCP_CONFIG")) {
        overrides.config_path = *val;
    }
    if (auto val = getenv("SERVER_NAME")) {
        overrides.server_name = *val;
    }
    if (auto val = getenv("SERVER_VERSION")) {
        overrides.server_version = *val;
    }
    if (auto val = getenv("MCP_TRANSPORT_MODE")) {
        auto mode = ParseTransportMode(*val);
        if (!mode) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid transport mode '" + *val +
                                "'. Must be 'stdio' or 'http'"));
        }
        overrides.transport = *mode;
    }
    if (auto val = getenv("HOST")) {
        overrides.host = *val;
    }
    if (auto val = getenv("PORT")) {
        auto port = ParseUnsigned(*val, 1, std::numeric_limits<uint16_t>::max());
        if (!port) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid PORT '" + *val + "'"));
        }
        overrides.port = static_cast<uint16_t>(*port);
    }
    if (auto val = getenv("WORKER_THREADS")) {
        auto workers = ParseUnsigned(*val, 1, kMaxWorkerThreads);
        if (!workers) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid WORKER_THREADS '" + *val + "'"));
        }
        overrides.worker_threads = static_cast<std::size_t>(*workers);
    }
    if (auto val = getenv("LOG_LEVEL")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid LOG_LEVEL '" + *val + "'"));
        }
        overrides.log_level = *level;
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

Result<ConfigOverrides, Error> LoadFromEnv() {
    return LoadFromEnv([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("kmcp-server", kVersion);
    program.add_description("MCP server speaking JSON-RPC 2.0 over stdio or HTTP.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file (default: ./kmcp.yaml if present)");
    program.add_argument("--transport")
        .help("Transport mode: stdio or http");
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("HTTP worker threads")
        .scan<'i', int>();
    program.add_argument("--name")
        .help("Server name reported to clients");
    program.add_argument("--server-version")
        .help("Server version reported to clients");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverrides overrides;

    if (auto val = program.present("--config")) {
        overrides.config_path = *val;
    }
    if (auto val = program.present("--transport")) {
        auto mode = ParseTransportMode(*val);
        if (!mode) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid --transport '" + *val +
                                "'. Must be 'stdio' or 'http'"));
        }
        overrides.transport = *mode;
    }
    if (auto val = program.present("--host")) {
        overrides.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > std::numeric_limits<uint16_t>::max()) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid --port " + std::to_string(*val)));
        }
        overrides.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present<int>("--workers")) {
        if (*val <= 0 || static_cast<std::size_t>(*val) > kMaxWorkerThreads) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid --workers " + std::to_string(*val)));
        }
        overrides.worker_threads = static_cast<std::size_t>(*val);
    }
    if (auto val = program.present("--name")) {
        overrides.server_name = *val;
    }
    if (auto val = program.present("--server-version")) {
        overrides.server_version = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid --log-level '" + *val + "'"));
        }
        overrides.log_level = *level;
    }
    if (program.get<bool>("--log-json")) {
        overrides.log_format = LogFormat::Json;
    }
    if (auto val = program.present("--log-file")) {
        overrides.log_file = *val;
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// ApplyOverrides / LoadConfig
// ---------------------------------------------------------------------------
AppConfig ApplyOverrides(AppConfig base, const ConfigOverrides& overrides) {
    if (overrides.server_name) {
        base.server_name = *overrides.server_name;
    }
    if (overrides.server_version) {
        base.server_version = *overrides.server_version;
    }
    if (overrides.transport) {
        base.transport = *overrides.transport;
    }
    if (overrides.host) {
        base.http.host = *overrides.host;
    }
    if (overrides.port) {
        base.http.port = *overrides.port;
    }
    if (overrides.worker_threads) {
        base.http.worker_threads = *overrides.worker_threads;
    }
    if (overrides.log_level) {
        base.logging.level = *overrides.log_level;
    }
    if (overrides.log_format) {
        base.logging.format = *overrides.log_format;
    }
    if (overrides.log_file) {
        base.logging.file = *overrides.log_file;
    }
    return base;
}

Result<AppConfig, Error> LoadConfig(const ConfigOverrides& env,
                                    const ConfigOverrides& cli) {
    auto path = cli.config_path ? cli.config_path : env.config_path;

    AppConfig base;
    if (path) {
        std::error_code ec;
        if (!std::filesystem::exists(*path, ec)) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config file not found: " + *path));
        }
        auto loaded = LoadFromYaml(*path);
        if (loaded.IsErr()) {
            return loaded;
        }
        base = std::move(loaded).Value();
    } else {
        std::error_code ec;
        if (std::filesystem::exists(kDefaultConfigFile, ec)) {
            auto loaded = LoadFromYaml(kDefaultConfigFile);
            if (loaded.IsErr()) {
                return loaded;
            }
            base = std::move(loaded).Value();
        }
    }

    return Result<AppConfig, Error>::Ok(
        ApplyOverrides(ApplyOverrides(std::move(base), env), cli));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server_name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.server_version.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server version must not be empty"));
    }
    if (!config.tools.is_object()) {
        return Result<void, Error>::Err(MakeConfigError("'tools' must be an object"));
    }
    if (config.transport == TransportMode::Stdio) {
        return Result<void, Error>::Ok();
    }

    const auto& http = config.http;
    if (http.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: http.host"));
    }
    if (http.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (http.worker_threads &&
        (*http.worker_threads == 0 || *http.worker_threads > kMaxWorkerThreads)) {
        return Result<void, Error>::Err(
            MakeConfigError("Worker threads must be between 1 and " +
                            std::to_string(kMaxWorkerThreads)));
    }
    if (http.max_connections == 0) {
        return Result<void, Error>::Err(MakeConfigError("max_connections must be positive"));
    }
    if (http.max_body_bytes == 0) {
        return Result<void, Error>::Err(MakeConfigError("max_body_bytes must be positive"));
    }
    if (http.keep_alive_seconds <= 0 || http.request_timeout_seconds <= 0 ||
        http.disconnect_timeout_seconds <= 0 || http.shutdown_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("HTTP timeouts must be positive"));
    }
    return Result<void, Error>::Ok();
}

std::size_t ResolveWorkerThreads(const AppConfig& config) {
    if (config.http.worker_threads) {
        return *config.http.worker_threads;
    }
    std::size_t cpus = std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(cpus, 1, kMaxDefaultWorkerThreads);
}

nlohmann::json GetToolConfig(const AppConfig& config, const std::string& tool_name) {
    if (!config.tools.is_object()) {
        return nlohmann::json::object();
    }
    auto it = config.tools.find(tool_name);
    if (it == config.tools.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

std::string GetEnvVar(const std::string& name, const std::string& fallback) {
    const char* value = std::getenv(name.c_str());
    return value != nullptr ? std::string(value) : fallback;
}

} // namespace kmcp
