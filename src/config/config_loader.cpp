#include <mcp_agent/config/config_loader.hpp>

#include <mcp_agent/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace mcp_agent {

const char* ToolErrorPolicyName(ToolErrorPolicy policy) {
    switch (policy) {
        case ToolErrorPolicy::Propagate:     return "propagate";
        case ToolErrorPolicy::ReportToModel: return "report";
    }
    return "propagate";
}

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::optional<ToolErrorPolicy> ParseToolErrorPolicy(const std::string& text) {
    if (text == "propagate") return ToolErrorPolicy::Propagate;
    if (text == "report") return ToolErrorPolicy::ReportToModel;
    return std::nullopt;
}

// Read an optional string-keyed field of `obj` into `out`; report a type
// mismatch with its dotted path.
template <typename T>
Result<void, Error> ReadField(const nlohmann::json& obj, const char* key,
                              const std::string& path, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return Result<void, Error>::Ok();
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        return Result<void, Error>::Err(MakeConfigError(
            "Field '" + path + key + "' has the wrong type"));
    }
    return Result<void, Error>::Ok();
}

Result<ToolProviderSpec, Error> ParseProviderSpec(const nlohmann::json& node,
                                                  const std::string& path) {
    if (!node.is_object()) {
        return Result<ToolProviderSpec, Error>::Err(
            MakeConfigError("Entry '" + path + "' must be an object"));
    }
    auto cmd = node.find("command");
    if (cmd == node.end() || !cmd->is_string()) {
        return Result<ToolProviderSpec, Error>::Err(
            MakeConfigError("Entry '" + path + "' missing string field 'command'"));
    }

    ToolProviderSpec spec;
    spec.command = cmd->get<std::string>();

    auto args = ReadField(node, "args", path + ".", spec.args);
    if (args.IsErr()) {
        return Result<ToolProviderSpec, Error>::Err(std::move(args).Error());
    }
    auto env = ReadField(node, "env", path + ".", spec.env);
    if (env.IsErr()) {
        return Result<ToolProviderSpec, Error>::Err(std::move(env).Error());
    }
    return Result<ToolProviderSpec, Error>::Ok(std::move(spec));
}

Result<AgentConfig, Error> ParseAgentConfig(const nlohmann::json& node) {
    if (!node.is_object()) {
        return Result<AgentConfig, Error>::Err(
            MakeConfigError("Field 'config' must be an object"));
    }

    AgentConfig config;
    const std::string path = "config.";

    std::string api_key;
    std::string policy;
    std::vector<Result<void, Error>> reads;
    reads.push_back(ReadField(node, "api_key", path, api_key));
    reads.push_back(ReadField(node, "model", path, config.model));
    reads.push_back(ReadField(node, "max_tokens", path, config.max_tokens));
    reads.push_back(ReadField(node, "temperature", path, config.temperature));
    reads.push_back(ReadField(node, "max_turns", path, config.max_turns));
    reads.push_back(ReadField(node, "tool_error_policy", path, policy));
    for (auto& r : reads) {
        if (r.IsErr()) {
            return Result<AgentConfig, Error>::Err(std::move(r).Error());
        }
    }

    if (!api_key.empty()) {
        config.api_key = api_key;
    }
    if (!policy.empty()) {
        auto parsed = ParseToolErrorPolicy(policy);
        if (!parsed) {
            return Result<AgentConfig, Error>::Err(MakeConfigError(
                "Unknown tool_error_policy '" + policy +
                "' (expected 'propagate' or 'report')"));
        }
        config.tool_error_policy = *parsed;
    }

    auto servers = node.find("mcp_servers");
    if (servers != node.end() && !servers->is_null()) {
        if (!servers->is_array()) {
            return Result<AgentConfig, Error>::Err(
                MakeConfigError("Field 'config.mcp_servers' must be an array"));
        }
        for (size_t i = 0; i < servers->size(); ++i) {
            auto spec = ParseProviderSpec(
                (*servers)[i], "config.mcp_servers[" + std::to_string(i) + "]");
            if (spec.IsErr()) {
                return Result<AgentConfig, Error>::Err(std::move(spec).Error());
            }
            config.tool_providers.push_back(std::move(spec).Value());
        }
    }

    return Result<AgentConfig, Error>::Ok(std::move(config));
}

// Plain YAML scalars get their natural JSON type; quoted scalars stay strings.
nlohmann::json YamlScalarToJson(const YAML::Node& node) {
    const auto& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
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
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return YamlScalarToJson(node);
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.substr(s.size() - suffix.size()) == suffix;
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Flags that main() consumes before argparse runs.
bool IsLoggingFlag(std::string_view arg) {
    return arg == "-v" || arg == "-vv" || arg == "--color" ||
           arg == "--color=true" || arg == "--no-color" ||
           arg == "--color=false" || arg == "--version";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Payload parsing
// ---------------------------------------------------------------------------
Result<RunPayload, Error> ParsePayload(const nlohmann::json& root) {
    if (!root.is_object()) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("Payload must be a JSON object"));
    }
    auto config_it = root.find("config");
    if (config_it == root.end()) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("Payload missing required field 'config'"));
    }
    auto task_it = root.find("task");
    if (task_it == root.end() || !task_it->is_string()) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("Payload missing required string field 'task'"));
    }

    auto config = ParseAgentConfig(*config_it);
    if (config.IsErr()) {
        return Result<RunPayload, Error>::Err(std::move(config).Error());
    }

    RunPayload payload;
    payload.config = std::move(config).Value();
    payload.task.instruction = task_it->get<std::string>();

    auto context_it = root.find("context");
    if (context_it != root.end() && !context_it->is_null()) {
        if (!context_it->is_object()) {
            return Result<RunPayload, Error>::Err(
                MakeConfigError("Field 'context' must be an object"));
        }
        payload.task.context = *context_it;
    }

    return Result<RunPayload, Error>::Ok(std::move(payload));
}

Result<RunPayload, Error> LoadPayloadFromJson(std::string_view text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("Payload is not valid JSON"));
    }
    return ParsePayload(root);
}

Result<RunPayload, Error> LoadPayloadFromYaml(std::string_view file_path) {
    // Conversion throws too, e.g. on a sequence used as a map key.
    nlohmann::json root;
    try {
        root = YamlToJson(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    return ParsePayload(root);
}

Result<RunPayload, Error> LoadPayloadFromFile(std::string_view file_path) {
    if (EndsWith(file_path, ".yaml") || EndsWith(file_path, ".yml")) {
        return LoadPayloadFromYaml(file_path);
    }

    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<RunPayload, Error>::Err(
            MakeConfigError("File not found: " + std::string(file_path)));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return LoadPayloadFromJson(buffer.str());
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-agent", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("payload")
        .help("Path to a JSON or YAML run payload")
        .nargs(argparse::nargs_pattern::optional);
    program.add_argument("--json")
        .help("Inline JSON run payload");

    program.add_argument("--model")
        .help("Override the completion model");
    program.add_argument("--max-tokens")
        .help("Override the maximum output tokens")
        .scan<'i', int>();
    program.add_argument("--temperature")
        .help("Override the sampling temperature")
        .scan<'g', double>();
    program.add_argument("--api-key-env")
        .help("Environment variable holding the API key (default ANTHROPIC_API_KEY)");
    program.add_argument("--base-url")
        .help("Completion API base URL");
    program.add_argument("--tool-error-policy")
        .help("propagate (fail the run) or report (tell the model)");
    program.add_argument("--max-turns")
        .help("Stop after this many completion calls (0 = unlimited)")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("Completion API read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--output")
        .help("Result format: json or text");
    program.add_argument("--log-json")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Also append JSON log lines to this file");

    program.add_epilog(
        "Logging: -v (info), -vv (debug), --color / --no-color.\n"
        "The API key is read from config.api_key or the --api-key-env variable.");

    std::vector<const char*> args;
    for (int i = 0; i < argc; ++i) {
        if (i > 0 && IsLoggingFlag(argv[i])) continue;
        args.push_back(argv[i]);
    }

    try {
        program.parse_args(static_cast<int>(args.size()), args.data());
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.payload_path = program.present("payload");
    cli.payload_json = program.present("--json");
    if (cli.payload_path.has_value() == cli.payload_json.has_value()) {
        return Result<CliOptions, Error>::Err(MakeConfigError(
            "Provide exactly one of <payload file> or --json '<payload>'"));
    }

    cli.model = program.present("--model");
    cli.max_tokens = program.present<int>("--max-tokens");
    cli.temperature = program.present<double>("--temperature");
    cli.api_key_env = program.present("--api-key-env");
    cli.base_url = program.present("--base-url");
    cli.max_turns = program.present<int>("--max-turns");
    cli.timeout_seconds = program.present<int>("--timeout");
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");

    if (auto val = program.present("--tool-error-policy")) {
        auto policy = ParseToolErrorPolicy(*val);
        if (!policy) {
            return Result<CliOptions, Error>::Err(MakeConfigError(
                "Invalid --tool-error-policy: " + *val));
        }
        cli.tool_error_policy = *policy;
    }
    if (auto val = program.present("--output")) {
        if (*val == "json") {
            cli.output = OutputFormat::Json;
        } else if (*val == "text") {
            cli.output = OutputFormat::Text;
        } else {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --output: " + *val));
        }
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(RunPayload payload, const CliOptions& cli) {
    AppConfig merged;
    merged.payload = std::move(payload);
    auto& agent = merged.payload.config;

    if (cli.model) agent.model = *cli.model;
    if (cli.max_tokens) agent.max_tokens = *cli.max_tokens;
    if (cli.temperature) agent.temperature = *cli.temperature;
    if (cli.tool_error_policy) agent.tool_error_policy = *cli.tool_error_policy;
    if (cli.max_turns) agent.max_turns = *cli.max_turns;

    if (cli.api_key_env) merged.api_key_env = *cli.api_key_env;
    if (cli.base_url) merged.base_url = *cli.base_url;
    if (cli.timeout_seconds) merged.timeout_seconds = *cli.timeout_seconds;
    if (cli.output) merged.output = *cli.output;

    return merged;
}

// ---------------------------------------------------------------------------
// LoadDotEnv
// ---------------------------------------------------------------------------
Result<int, Error> LoadDotEnv(std::string_view file_path) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<int, Error>::Ok(0);
    }

    int exported = 0;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = Trim(trimmed.substr(7));
        }

        auto eq = trimmed.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<int, Error>::Err(MakeConfigError(
                std::string(file_path) + ":" + std::to_string(line_no) +
                ": expected KEY=VALUE"));
        }
        auto key = Trim(trimmed.substr(0, eq));
        auto value = Trim(trimmed.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = Trim(value.substr(0, hash));
            }
        }

        if (std::getenv(key.c_str()) != nullptr) continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        }
    }
    return Result<int, Error>::Ok(exported);
}

// ---------------------------------------------------------------------------
// ResolveApiKey
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKey(AppConfig config) {
    auto& api_key = config.payload.config.api_key;
    if (api_key.has_value() && !api_key->empty()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    const char* env_val = std::getenv(config.api_key_env.c_str());
    if (env_val == nullptr || *env_val == '\0') {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "API key must be provided in config.api_key or the " +
            config.api_key_env + " environment variable"));
    }
    api_key = env_val;
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
Result<void, Error> ValidateAgentConfig(const AgentConfig& config) {
    if (config.model.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: model"));
    }
    if (config.max_tokens <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "max_tokens must be positive, got " + std::to_string(config.max_tokens)));
    }
    if (config.temperature < 0.0 || config.temperature > 1.0) {
        return Result<void, Error>::Err(
            MakeConfigError("temperature must be between 0 and 1"));
    }
    if (config.max_turns < 0) {
        return Result<void, Error>::Err(MakeConfigError("max_turns must not be negative"));
    }
    for (size_t i = 0; i < config.tool_providers.size(); ++i) {
        if (config.tool_providers[i].command.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "config.mcp_servers[" + std::to_string(i) + "].command is empty"));
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto agent = ValidateAgentConfig(config.payload.config);
    if (agent.IsErr()) {
        return agent;
    }
    if (!config.payload.config.api_key.has_value() ||
        config.payload.config.api_key->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing API key"));
    }
    if (config.base_url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing base URL"));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Timeout must be positive, got " + std::to_string(config.timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_agent
