#include <mcp_agent/agent/agent_orchestrator.hpp>
#include <mcp_agent/cli/output_formatter.hpp>
#include <mcp_agent/completion/anthropic_client.hpp>
#include <mcp_agent/config/config_loader.hpp>
#include <mcp_agent/core/log.hpp>
#include <mcp_agent/core/terminal.hpp>
#include <mcp_agent/core/version.hpp>
#include <mcp_agent/mcp/stdio_connector.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 2;

std::atomic<bool> g_cancel_requested{false};

void HandleTerminationSignal(int /*signum*/) {
    g_cancel_requested.store(true);
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "mcp-agent " << mcp_agent::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// Console logs go to stderr; a --log-file adds a JSON-lines copy.
std::unique_ptr<mcp_agent::ILogSink> MakeLogSink(const mcp_agent::CliOptions& cli,
                                                 bool use_color) {
    using namespace mcp_agent;

    std::unique_ptr<ILogSink> console;
    if (cli.log_json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(use_color);
    }
    if (!cli.log_file.has_value()) {
        return console;
    }

    auto file = std::make_unique<FileSink>(*cli.log_file);
    if (!file->IsOpen()) {
        std::cerr << "warning: cannot open log file " << *cli.log_file << "\n";
        return console;
    }
    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(console));
    sinks.push_back(std::move(file));
    return std::make_unique<TeeSink>(std::move(sinks));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_agent;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Parse verbosity and color flags.
    auto log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v")  { log_level = LogLevel::Info; }
        else if (arg == "--color" || arg == "--color=true") { force_color = true; }
        else if (arg == "--no-color" || arg == "--color=false") { force_no_color = true; }
    }
    if (NoColorEnvSet()) { force_no_color = true; }
    const bool log_color = !force_no_color && (force_color || IsStderrTty());
    const bool out_color = !force_no_color && (force_color || IsStdoutTty());

    auto dotenv = LoadDotEnv(".env");

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter(false, log_color).PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    Logger logger(MakeLogSink(cli, log_color), log_level);
    if (dotenv.IsErr()) {
        logger.Warn("config", "Ignoring .env: " + dotenv.Error().message);
    } else if (dotenv.Value() > 0) {
        logger.Debug("config", "Loaded " + std::to_string(dotenv.Value()) +
                                   " variable(s) from .env");
    }

    const bool json_output = !cli.output.has_value() || *cli.output == OutputFormat::Json;
    OutputFormatter formatter(json_output, out_color);

    auto payload = cli.payload_json.has_value()
        ? LoadPayloadFromJson(*cli.payload_json)
        : LoadPayloadFromFile(*cli.payload_path);
    if (payload.IsErr()) {
        formatter.PrintError(payload.Error());
        return kExitConfig;
    }

    auto config = ResolveApiKey(MergeConfigs(std::move(payload).Value(), cli));
    if (config.IsErr()) {
        formatter.PrintError(config.Error());
        return config.Error().ExitCode();
    }
    const auto app = std::move(config).Value();

    auto valid = ValidateConfig(app);
    if (valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    logger.Info("agent", "model=" + app.payload.config.model + " providers=" +
                             std::to_string(app.payload.config.tool_providers.size()) +
                             " tool_error_policy=" +
                             ToolErrorPolicyName(app.payload.config.tool_error_policy));

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, HandleTerminationSignal);
    std::signal(SIGTERM, HandleTerminationSignal);

    AnthropicClientOptions client_options;
    client_options.base_url = app.base_url;
    client_options.read_timeout = std::chrono::seconds(app.timeout_seconds);
    AnthropicClient client(*app.payload.config.api_key, logger, client_options);

    StdioProviderConnector connector(logger);
    AgentOrchestrator orchestrator(client, connector, logger);

    auto result = orchestrator.Run(app.payload.config, app.payload.task, &g_cancel_requested);
    if (result.IsErr()) {
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    formatter.PrintRunResult(result.Value());
    return kExitSuccess;
}
