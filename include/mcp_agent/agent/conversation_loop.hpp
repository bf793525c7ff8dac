#pragma once

#include <mcp_agent/agent/tool_registry.hpp>
#include <mcp_agent/completion/i_completion_client.hpp>
#include <mcp_agent/config/app_config.hpp>
#include <mcp_agent/core/log.hpp>
#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <vector>

namespace mcp_agent {

enum class LoopState {
    AwaitingModel,
    ModelWantsTool,
    ExecutingTool,
    Done,
    Failed,
};

[[nodiscard]] const char* LoopStateName(LoopState state);

struct LoopOptions {
    std::string model;
    int max_tokens = 4096;
    double temperature = 1.0;
    ToolErrorPolicy tool_error_policy = ToolErrorPolicy::Propagate;
    int max_turns = 0;                         // 0 = unlimited
    const std::atomic<bool>* cancel = nullptr;  // checked before each call
};

struct LoopOutcome {
    std::string final_text;
    std::string stop_reason;
    Usage usage;        // as reported by the last completion call
    Usage total_usage;  // summed over every completion call
    int completion_calls = 0;
    int tool_dispatches = 0;
};

// Text results pass through untouched; anything else is JSON-encoded. Never
// throws.
[[nodiscard]] std::string SerializeToolResult(const nlohmann::json& result);

// ---------------------------------------------------------------------------
// ConversationLoop: request / execute / continue until the model stops
// asking for tools.
//
// One tool call per turn: only the first tool_use block of a response is
// executed. Each executed turn appends exactly two messages: the assistant
// message with every block of the response, then a user message holding
// one tool_result block.
// ---------------------------------------------------------------------------
class ConversationLoop {
public:
    ConversationLoop(ICompletionClient& client,
                     const ToolRegistry& registry,
                     LoopOptions options,
                     Logger& logger);

    [[nodiscard]] Result<LoopOutcome, Error> Run(std::vector<Message> initial);

    [[nodiscard]] const std::vector<Message>& Messages() const noexcept { return messages_; }
    [[nodiscard]] LoopState State() const noexcept { return state_; }

private:
    Result<LoopOutcome, Error> Fail(Error error);
    void Transition(LoopState next);
    bool Cancelled() const;

    ICompletionClient& client_;
    const ToolRegistry& registry_;
    LoopOptions options_;
    Logger& logger_;
    std::vector<Message> messages_;
    LoopState state_ = LoopState::AwaitingModel;
};

} // namespace mcp_agent
