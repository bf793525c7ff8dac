#pragma once

#include <mcp_agent/config/app_config.hpp>
#include <mcp_agent/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcp_agent {

// Parse an already-decoded payload object:
//   {"config": {...}, "task": "...", "context": {...}}
Result<RunPayload, Error> ParsePayload(const nlohmann::json& root);

// Parse a JSON payload string (the --json form).
Result<RunPayload, Error> LoadPayloadFromJson(std::string_view text);

// Parse a YAML payload file with the same schema as the JSON form.
Result<RunPayload, Error> LoadPayloadFromYaml(std::string_view file_path);

// Load a payload file; .yaml/.yml go through yaml-cpp, anything else is JSON.
Result<RunPayload, Error> LoadPayloadFromFile(std::string_view file_path);

// Parse CLI arguments. Exactly one of the positional payload path and
// --json must be given.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of a payload.
AppConfig MergeConfigs(RunPayload payload, const CliOptions& cli);

// Export KEY=VALUE lines of a dotenv file into the environment without
// overwriting variables that are already set. A missing file is not an
// error. Returns the number of variables exported.
Result<int, Error> LoadDotEnv(std::string_view file_path);

// If the payload carries no api_key, read it from api_key_env.
Result<AppConfig, Error> ResolveApiKey(AppConfig config);

// Validate the parts of the config the orchestrator relies on.
Result<void, Error> ValidateAgentConfig(const AgentConfig& config);

// Validate the full application config, including the resolved API key.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_agent
