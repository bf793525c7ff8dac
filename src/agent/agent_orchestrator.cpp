#include <mcp_agent/agent/agent_orchestrator.hpp>
#include <mcp_agent/agent/tool_registry.hpp>
#include <mcp_agent/config/config_loader.hpp>

#include <utility>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// ProviderConnections
// ---------------------------------------------------------------------------
ProviderConnections::ProviderConnections(Logger& logger) : logger_(logger) {}

ProviderConnections::~ProviderConnections() {
    CloseAll();
}

IToolProvider& ProviderConnections::Add(std::unique_ptr<IToolProvider> provider) {
    providers_.push_back(std::move(provider));
    return *providers_.back();
}

void ProviderConnections::CloseAll() noexcept {
    for (auto& provider : providers_) {
        if (!provider) continue;
        provider->Close();
        provider.reset();
    }
    if (!providers_.empty()) {
        logger_.Debug("agent", "Closed " + std::to_string(providers_.size()) +
                                   " provider connection(s)");
    }
    providers_.clear();
}

// ---------------------------------------------------------------------------
// BuildInitialPrompt
// ---------------------------------------------------------------------------
std::string BuildInitialPrompt(const Task& task, Logger& logger) {
    std::string prompt = task.instruction;
    if (!task.context.has_value()) {
        return prompt;
    }
    const auto& context = *task.context;
    if (context.is_null() || ((context.is_object() || context.is_array()) && context.empty())) {
        return prompt;
    }
    try {
        prompt += "\n\nAdditional context:\n" + context.dump(2);
    } catch (const nlohmann::json::exception& e) {
        logger.Warn("agent", std::string("Ignoring context that failed to serialize: ") +
                                 e.what());
    }
    return prompt;
}

// ---------------------------------------------------------------------------
// AgentOrchestrator
// ---------------------------------------------------------------------------
AgentOrchestrator::AgentOrchestrator(ICompletionClient& client,
                                     IProviderConnector& connector,
                                     Logger& logger)
    : client_(client), connector_(connector), logger_(logger) {}

Result<RunResult, Error> AgentOrchestrator::Run(const AgentConfig& config,
                                                const Task& task,
                                                const std::atomic<bool>* cancel) {
    auto valid = ValidateAgentConfig(config);
    if (valid.IsErr()) {
        return Result<RunResult, Error>::Err(std::move(valid).Error());
    }

    ProviderConnections connections(logger_);
    ToolRegistry registry(logger_);

    for (size_t i = 0; i < config.tool_providers.size(); ++i) {
        const auto& spec = config.tool_providers[i];
        const auto label = "mcp_servers[" + std::to_string(i) + "] '" + spec.command + "'";

        auto connected = connector_.Connect(spec);
        if (connected.IsErr()) {
            logger_.Warn("agent", "Skipping " + label + ": " + connected.Error().ToString());
            continue;
        }
        auto provider = std::move(connected).Value();

        auto tools = provider->ListTools();
        if (tools.IsErr()) {
            logger_.Warn("agent", "Skipping " + label + ": " + tools.Error().ToString());
            provider->Close();
            continue;
        }
        registry.Register(connections.Add(std::move(provider)), std::move(tools).Value());
    }

    logger_.Info("agent", std::to_string(registry.ProviderCount()) + " of " +
                              std::to_string(config.tool_providers.size()) +
                              " provider(s) connected, " +
                              std::to_string(registry.AllTools().size()) + " tool(s) available");

    LoopOptions options;
    options.model = config.model;
    options.max_tokens = config.max_tokens;
    options.temperature = config.temperature;
    options.tool_error_policy = config.tool_error_policy;
    options.max_turns = config.max_turns;
    options.cancel = cancel;

    ConversationLoop loop(client_, registry, options, logger_);
    auto outcome = loop.Run({Message::UserText(BuildInitialPrompt(task, logger_))});

    connections.CloseAll();

    if (outcome.IsErr()) {
        return Result<RunResult, Error>::Err(std::move(outcome).Error());
    }

    auto loop_outcome = std::move(outcome).Value();
    logger_.Info("agent", "Finished after " + std::to_string(loop_outcome.completion_calls) +
                              " completion call(s) and " +
                              std::to_string(loop_outcome.tool_dispatches) + " tool call(s), " +
                              std::to_string(loop_outcome.total_usage.input_tokens) + " input / " +
                              std::to_string(loop_outcome.total_usage.output_tokens) +
                              " output token(s) in total");

    RunResult result;
    result.response = std::move(loop_outcome.final_text);
    result.model = config.model;
    result.stop_reason = std::move(loop_outcome.stop_reason);
    result.usage = loop_outcome.usage;
    return Result<RunResult, Error>::Ok(std::move(result));
}

} // namespace mcp_agent
