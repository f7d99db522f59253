#include <catch2/catch_test_macros.hpp>

#include <kmcp/config/config_loader.hpp>

#include <map>
#include <optional>
#include <string>

using namespace kmcp;

// ===========================================================================
// Helpers
// ===========================================================================

namespace {

// Tests run from the build directory; derive the testdata path from this
// file's location in the source tree.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);            // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));   // .../test
    return test_root + "/testdata/" + filename;
}

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // anonymous namespace

// ===========================================================================
// Defaults
// ===========================================================================

TEST_CASE("AppConfig: defaults", "[config]") {
    AppConfig config;
    CHECK(config.server_name == "mcp-server");
    CHECK(config.server_version == "0.1.0");
    CHECK(config.transport == TransportMode::Stdio);
    CHECK(config.http.host == "0.0.0.0");
    CHECK(config.http.port == 3000);
    CHECK_FALSE(config.http.worker_threads.has_value());
    CHECK(config.http.max_connections == 10000);
    CHECK(config.http.max_connection_rate == 1000);
    CHECK(config.http.keep_alive_seconds == 30);
    CHECK(config.http.request_timeout_seconds == 30);
    CHECK(config.http.disconnect_timeout_seconds == 2);
    CHECK(config.http.shutdown_timeout_seconds == 10);
    CHECK(config.logging.level == LogLevel::Info);
    CHECK(config.tools.is_object());
}

TEST_CASE("ParseTransportMode: stdio and http only", "[config]") {
    CHECK(ParseTransportMode("stdio") == TransportMode::Stdio);
    CHECK(ParseTransportMode("HTTP") == TransportMode::Http);
    CHECK_FALSE(ParseTransportMode("sse").has_value());
    CHECK(std::string(TransportModeName(TransportMode::Http)) == "http");
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server_name == "weather-mcp");
    CHECK(config.server_version == "2.1.0");
    CHECK(config.transport == TransportMode::Http);

    CHECK(config.http.host == "127.0.0.1");
    CHECK(config.http.port == 8080);
    REQUIRE(config.http.worker_threads.has_value());
    CHECK(*config.http.worker_threads == 8);
    CHECK(config.http.max_connections == 500);
    CHECK(config.http.max_connection_rate == 50);
    CHECK(config.http.keep_alive_seconds == 15);
    CHECK(config.http.request_timeout_seconds == 20);
    CHECK(config.http.disconnect_timeout_seconds == 3);
    CHECK(config.http.shutdown_timeout_seconds == 5);
    CHECK(config.http.max_body_bytes == 65536);

    CHECK(config.logging.level == LogLevel::Debug);
    CHECK(config.logging.format == LogFormat::Json);
    REQUIRE(config.logging.file.has_value());
    CHECK(*config.logging.file == "/tmp/kmcp.log");
}

TEST_CASE("LoadFromYaml: tool settings keep their scalar types", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& tools = result.Value().tools;

    CHECK(tools["echo"]["prefix"] == "echo: ");

    const auto& lookup = tools["lookup"];
    CHECK(lookup["enabled"] == true);
    CHECK(lookup["retries"] == 3);
    CHECK(lookup["ratio"] == 0.5);
    CHECK(lookup["code"] == "007");  // quoted, stays a string
    REQUIRE(lookup["regions"].is_array());
    CHECK(lookup["regions"].size() == 2);
    CHECK(lookup["regions"][0] == "eu");
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server_name == "minimal-server");
    CHECK(config.server_version == "0.1.0");
    CHECK(config.transport == TransportMode::Stdio);
    CHECK(config.http.port == 3000);
    CHECK(config.tools.empty());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/kmcp.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown transport", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_transport.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("websocket") != std::string::npos);
}

TEST_CASE("LoadFromYaml: non-numeric port", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_port.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid value") != std::string::npos);
}

TEST_CASE("LoadFromYamlString: empty document yields defaults", "[config][yaml]") {
    auto result = LoadFromYamlString("");
    REQUIRE(result.IsOk());
    CHECK(result.Value().server_name == "mcp-server");
}

TEST_CASE("LoadFromYamlString: invalid logging level", "[config][yaml]") {
    auto result = LoadFromYamlString("logging:\n  level: loud\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("logging.level") != std::string::npos);
}

TEST_CASE("LoadFromYamlString: tools must be a mapping", "[config][yaml]") {
    auto result = LoadFromYamlString("tools: [echo]\n");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'tools'") != std::string::npos);
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: nothing set yields no overrides", "[config][env]") {
    auto result = LoadFromEnv(FakeEnv({}));
    REQUIRE(result.IsOk());
    const auto& o = result.Value();
    CHECK_FALSE(o.server_name.has_value());
    CHECK_FALSE(o.transport.has_value());
    CHECK_FALSE(o.port.has_value());
}

TEST_CASE("LoadFromEnv: reads all supported variables", "[config][env]") {
    auto result = LoadFromEnv(FakeEnv({
        {"SERVER_NAME", "env-server"},
        {"SERVER_VERSION", "9.9.9"},
        {"MCP_TRANSPORT_MODE", "http"},
        {"HOST", "127.0.0.1"},
        {"PORT", "4000"},
        {"WORKER_THREADS", "3"},
        {"LOG_LEVEL", "warn"},
        {"KMCP_CONFIG", "/etc/kmcp.yaml"},
    }));
    REQUIRE(result.IsOk());
    const auto& o = result.Value();

    CHECK(o.server_name == std::optional<std::string>("env-server"));
    CHECK(o.server_version == std::optional<std::string>("9.9.9"));
    CHECK(o.transport == TransportMode::Http);
    CHECK(o.host == std::optional<std::string>("127.0.0.1"));
    CHECK(o.port == std::optional<uint16_t>(4000));
    CHECK(o.worker_threads == std::optional<std::size_t>(3));
    CHECK(o.log_level == LogLevel::Warn);
    CHECK(o.config_path == std::optional<std::string>("/etc/kmcp.yaml"));
}

TEST_CASE("LoadFromEnv: invalid values are config errors", "[config][env]") {
    CHECK(LoadFromEnv(FakeEnv({{"PORT", "abc"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"PORT", "0"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"PORT", "70000"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"PORT", "-1"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"WORKER_THREADS", "0"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"MCP_TRANSPORT_MODE", "grpc"}})).IsErr());
    CHECK(LoadFromEnv(FakeEnv({{"LOG_LEVEL", "chatty"}})).IsErr());

    auto result = LoadFromEnv(FakeEnv({{"PORT", "abc"}}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("PORT") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments yields no overrides", "[config][cli]") {
    const char* argv[] = {"kmcp-server"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().transport.has_value());
    CHECK_FALSE(result.Value().log_format.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    const char* argv[] = {
        "kmcp-server",
        "--config", "custom.yaml",
        "--transport", "http",
        "--host", "localhost",
        "--port", "9000",
        "--workers", "2",
        "--name", "cli-server",
        "--server-version", "1.2.3",
        "--log-level", "debug",
        "--log-json",
        "--log-file", "server.log",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& o = result.Value();

    CHECK(o.config_path == std::optional<std::string>("custom.yaml"));
    CHECK(o.transport == TransportMode::Http);
    CHECK(o.host == std::optional<std::string>("localhost"));
    CHECK(o.port == std::optional<uint16_t>(9000));
    CHECK(o.worker_threads == std::optional<std::size_t>(2));
    CHECK(o.server_name == std::optional<std::string>("cli-server"));
    CHECK(o.server_version == std::optional<std::string>("1.2.3"));
    CHECK(o.log_level == LogLevel::Debug);
    CHECK(o.log_format == LogFormat::Json);
    CHECK(o.log_file == std::optional<std::string>("server.log"));
}

TEST_CASE("LoadFromCli: short config flag", "[config][cli]") {
    const char* argv[] = {"kmcp-server", "-c", "short.yaml"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().config_path == std::optional<std::string>("short.yaml"));
}

TEST_CASE("LoadFromCli: invalid values", "[config][cli]") {
    const char* bad_transport[] = {"kmcp-server", "--transport", "pipe"};
    CHECK(LoadFromCli(3, bad_transport).IsErr());

    const char* bad_port[] = {"kmcp-server", "--port", "0"};
    CHECK(LoadFromCli(3, bad_port).IsErr());

    const char* bad_workers[] = {"kmcp-server", "--workers", "1000"};
    CHECK(LoadFromCli(3, bad_workers).IsErr());

    const char* unknown[] = {"kmcp-server", "--frobnicate"};
    auto result = LoadFromCli(2, unknown);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// ApplyOverrides / LoadConfig
// ===========================================================================

TEST_CASE("ApplyOverrides: only set fields replace values", "[config]") {
    AppConfig base;
    base.server_name = "from-yaml";
    base.http.port = 8080;

    ConfigOverrides overrides;
    overrides.port = 9090;
    overrides.transport = TransportMode::Http;

    auto merged = ApplyOverrides(base, overrides);
    CHECK(merged.server_name == "from-yaml");
    CHECK(merged.http.port == 9090);
    CHECK(merged.transport == TransportMode::Http);
}

TEST_CASE("LoadConfig: CLI wins over env, env wins over YAML", "[config]") {
    ConfigOverrides env;
    env.config_path = TestDataPath("full_config.yaml");
    env.server_name = "env-name";
    env.port = 4000;

    ConfigOverrides cli;
    cli.port = 5000;

    auto result = LoadConfig(env, cli);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server_name == "env-name");  // env over YAML
    CHECK(config.http.port == 5000);          // CLI over env
    CHECK(config.server_version == "2.1.0");  // YAML over defaults
    CHECK(config.http.host == "127.0.0.1");
}

TEST_CASE("LoadConfig: explicit config path must exist", "[config]") {
    ConfigOverrides cli;
    cli.config_path = "/nonexistent/kmcp.yaml";

    auto result = LoadConfig({}, cli);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Config file not found") != std::string::npos);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());

    AppConfig http;
    http.transport = TransportMode::Http;
    CHECK(ValidateConfig(http).IsOk());
}

TEST_CASE("ValidateConfig: empty identity", "[config][validate]") {
    AppConfig config;
    config.server_name.clear();
    CHECK(ValidateConfig(config).IsErr());

    config = AppConfig{};
    config.server_version.clear();
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: HTTP settings checked only in HTTP mode", "[config][validate]") {
    AppConfig config;
    config.http.port = 0;
    CHECK(ValidateConfig(config).IsOk());

    config.transport = TransportMode::Http;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid port: 0");
}

TEST_CASE("ValidateConfig: worker and limit bounds", "[config][validate]") {
    AppConfig config;
    config.transport = TransportMode::Http;

    config.http.worker_threads = 0;
    CHECK(ValidateConfig(config).IsErr());
    config.http.worker_threads = kMaxWorkerThreads + 1;
    CHECK(ValidateConfig(config).IsErr());
    config.http.worker_threads = 4;
    CHECK(ValidateConfig(config).IsOk());

    config.http.max_connections = 0;
    CHECK(ValidateConfig(config).IsErr());
    config.http.max_connections = 10;

    config.http.shutdown_timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());
}

// ===========================================================================
// ResolveWorkerThreads / GetToolConfig
// ===========================================================================

TEST_CASE("ResolveWorkerThreads: explicit value wins", "[config]") {
    AppConfig config;
    config.http.worker_threads = 7;
    CHECK(ResolveWorkerThreads(config) == 7);
}

TEST_CASE("ResolveWorkerThreads: CPU default is capped", "[config]") {
    AppConfig config;
    auto workers = ResolveWorkerThreads(config);
    CHECK(workers >= 1);
    CHECK(workers <= kMaxDefaultWorkerThreads);
}

TEST_CASE("GetToolConfig: missing or malformed sections become empty objects", "[config]") {
    AppConfig config;
    config.tools = {{"echo", {{"prefix", ">> "}}}, {"broken", 42}};

    CHECK(GetToolConfig(config, "echo")["prefix"] == ">> ");
    CHECK(GetToolConfig(config, "missing") == nlohmann::json::object());
    CHECK(GetToolConfig(config, "broken") == nlohmann::json::object());
}

TEST_CASE("GetEnvVar: fallback when unset", "[config]") {
    CHECK(GetEnvVar("KMCP_TEST_SURELY_UNSET_VARIABLE", "fallback") == "fallback");
}
