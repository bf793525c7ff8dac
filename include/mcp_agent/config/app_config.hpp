#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_agent {

constexpr const char* kDefaultModel = "claude-3-5-sonnet-20241022";
constexpr const char* kDefaultApiKeyEnv = "ANTHROPIC_API_KEY";
constexpr const char* kDefaultBaseUrl = "https://api.anthropic.com";

// Launch parameters for one tool-hosting process.
struct ToolProviderSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // overrides on top of our environment
};

// What the conversation loop does when a tool dispatch fails.
enum class ToolErrorPolicy {
    Propagate,      // the run fails
    ReportToModel,  // an is_error tool result carries the message back
};

struct AgentConfig {
    std::optional<std::string> api_key;
    std::string model = kDefaultModel;
    int max_tokens = 4096;
    double temperature = 1.0;
    std::vector<ToolProviderSpec> tool_providers;
    ToolErrorPolicy tool_error_policy = ToolErrorPolicy::Propagate;
    int max_turns = 0;  // 0 = unlimited
};

struct Task {
    std::string instruction;
    std::optional<nlohmann::json> context;
};

// The run input: everything an external caller hands us.
struct RunPayload {
    AgentConfig config;
    Task task;
};

enum class OutputFormat {
    Json,
    Text,
};

// Payload plus process-level options (CLI, environment).
struct AppConfig {
    RunPayload payload;
    std::string api_key_env = kDefaultApiKeyEnv;
    std::string base_url = kDefaultBaseUrl;
    int timeout_seconds = 600;
    OutputFormat output = OutputFormat::Json;
};

// Command-line overrides. Unset optionals leave the payload value alone.
struct CliOptions {
    std::optional<std::string> payload_path;
    std::optional<std::string> payload_json;
    std::optional<std::string> model;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::optional<std::string> api_key_env;
    std::optional<std::string> base_url;
    std::optional<ToolErrorPolicy> tool_error_policy;
    std::optional<int> max_turns;
    std::optional<int> timeout_seconds;
    std::optional<OutputFormat> output;
    std::optional<std::string> log_file;
    bool log_json = false;
};

[[nodiscard]] const char* ToolErrorPolicyName(ToolErrorPolicy policy);

} // namespace mcp_agent
