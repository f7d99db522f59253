#pragma once

#include <kmcp/config/app_config.hpp>
#include <kmcp/core/result.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kmcp {

// File looked up in the working directory when --config is not given.
constexpr const char* kDefaultConfigFile = "kmcp.yaml";

std::optional<TransportMode> ParseTransportMode(std::string_view text);

// Parse a kmcp.yaml file on top of the defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Same, from YAML text already in memory.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml);

// Read SERVER_NAME, SERVER_VERSION, MCP_TRANSPORT_MODE, HOST, PORT,
// WORKER_THREADS and LOG_LEVEL. `getenv` is injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv);
Result<ConfigOverrides, Error> LoadFromEnv();

// Parse CLI arguments. --help/--version print and exit inside argparse.
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Fields set in overrides replace those in base.
AppConfig ApplyOverrides(AppConfig base, const ConfigOverrides& overrides);

// Defaults -> YAML (explicit path, or kmcp.yaml when present) -> env -> CLI.
Result<AppConfig, Error> LoadConfig(const ConfigOverrides& env,
                                    const ConfigOverrides& cli);

// Validate that values are present and sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Configured worker count, else CPU count capped at kMaxDefaultWorkerThreads.
std::size_t ResolveWorkerThreads(const AppConfig& config);

// tools.<name> as a JSON object; empty object when not configured.
nlohmann::json GetToolConfig(const AppConfig& config, const std::string& tool_name);

// Environment variable value or `fallback` when unset.
std::string GetEnvVar(const std::string& name, const std::string& fallback);

} // namespace kmcp
