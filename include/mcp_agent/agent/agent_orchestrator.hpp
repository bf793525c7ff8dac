#pragma once

#include <mcp_agent/agent/conversation_loop.hpp>
#include <mcp_agent/completion/i_completion_client.hpp>
#include <mcp_agent/config/app_config.hpp>
#include <mcp_agent/core/log.hpp>
#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>
#include <mcp_agent/mcp/i_tool_provider.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// RunResult: the outcome of one task.
// ---------------------------------------------------------------------------
struct RunResult {
    std::string response;
    std::string model;
    std::string stop_reason;
    Usage usage;
};

// ---------------------------------------------------------------------------
// ProviderConnections: owns every provider opened during a run.
//
// CloseAll() closes each provider independently: one provider failing to
// close does not keep the others open. The destructor calls CloseAll().
// ---------------------------------------------------------------------------
class ProviderConnections {
public:
    explicit ProviderConnections(Logger& logger);
    ~ProviderConnections();

    ProviderConnections(const ProviderConnections&) = delete;
    ProviderConnections& operator=(const ProviderConnections&) = delete;

    IToolProvider& Add(std::unique_ptr<IToolProvider> provider);
    void CloseAll() noexcept;

    [[nodiscard]] size_t Size() const noexcept { return providers_.size(); }

private:
    std::vector<std::unique_ptr<IToolProvider>> providers_;
    Logger& logger_;
};

// Instruction plus, when a non-empty context is present,
// "\n\nAdditional context:\n" and the context as indented JSON. A context
// that fails to serialize is logged and left out.
[[nodiscard]] std::string BuildInitialPrompt(const Task& task, Logger& logger);

// ---------------------------------------------------------------------------
// AgentOrchestrator: runs one task end to end.
//
//   1. validate the config (nothing is launched on a Config error)
//   2. connect providers in declaration order; failures are skipped
//   3. run the conversation loop
//   4. close every provider, on every exit path
// ---------------------------------------------------------------------------
class AgentOrchestrator {
public:
    AgentOrchestrator(ICompletionClient& client,
                      IProviderConnector& connector,
                      Logger& logger);

    [[nodiscard]] Result<RunResult, Error> Run(const AgentConfig& config,
                                               const Task& task,
                                               const std::atomic<bool>* cancel = nullptr);

private:
    ICompletionClient& client_;
    IProviderConnector& connector_;
    Logger& logger_;
};

} // namespace mcp_agent
