#include <mcp_agent/agent/conversation_loop.hpp>

#include <string>
#include <utility>

namespace mcp_agent {

const char* LoopStateName(LoopState state) {
    switch (state) {
        case LoopState::AwaitingModel:  return "awaiting_model";
        case LoopState::ModelWantsTool: return "model_wants_tool";
        case LoopState::ExecutingTool:  return "executing_tool";
        case LoopState::Done:           return "done";
        case LoopState::Failed:         return "failed";
    }
    return "failed";
}

std::string SerializeToolResult(const nlohmann::json& result) {
    if (result.is_string()) {
        return result.get<std::string>();
    }
    try {
        return result.dump();
    } catch (const nlohmann::json::type_error&) {
        // Invalid UTF-8 somewhere in the value.
        return result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}

ConversationLoop::ConversationLoop(ICompletionClient& client,
                                   const ToolRegistry& registry,
                                   LoopOptions options,
                                   Logger& logger)
    : client_(client),
      registry_(registry),
      options_(std::move(options)),
      logger_(logger) {}

bool ConversationLoop::Cancelled() const {
    return options_.cancel != nullptr && options_.cancel->load();
}

void ConversationLoop::Transition(LoopState next) {
    if (next == state_) {
        return;
    }
    logger_.Debug("loop", std::string(LoopStateName(state_)) + " -> " + LoopStateName(next));
    state_ = next;
}

Result<LoopOutcome, Error> ConversationLoop::Fail(Error error) {
    Transition(LoopState::Failed);
    logger_.Error("loop", error.ToString());
    return Result<LoopOutcome, Error>::Err(std::move(error));
}

Result<LoopOutcome, Error> ConversationLoop::Run(std::vector<Message> initial) {
    messages_ = std::move(initial);
    state_ = LoopState::AwaitingModel;
    logger_.Debug("loop", std::string("start in ") + LoopStateName(state_));

    std::optional<std::vector<ToolDescriptor>> tools;
    auto catalog = registry_.AllTools();
    if (!catalog.empty()) {
        tools = std::move(catalog);
    }

    LoopOutcome outcome;
    while (true) {
        // -- AwaitingModel ----------------------------------------------------
        if (Cancelled()) {
            return Fail(Error{"Run", "", std::nullopt, "Run cancelled",
                              std::nullopt, ErrorCategory::Cancelled});
        }
        if (options_.max_turns > 0 && outcome.completion_calls >= options_.max_turns) {
            logger_.Warn("loop", "Stopping after " + std::to_string(outcome.completion_calls) +
                                     " completion call(s) (max_turns)");
            outcome.stop_reason = std::string(kStopReasonMaxTurns);
            Transition(LoopState::Done);
            return Result<LoopOutcome, Error>::Ok(std::move(outcome));
        }

        CompletionRequest request;
        request.model = options_.model;
        request.max_tokens = options_.max_tokens;
        request.temperature = options_.temperature;
        request.messages = messages_;
        request.tools = tools;

        auto response_result = client_.CreateCompletion(request);
        ++outcome.completion_calls;
        if (response_result.IsErr()) {
            return Fail(std::move(response_result).Error());
        }
        auto response = std::move(response_result).Value();
        outcome.usage = response.usage;
        outcome.total_usage += response.usage;
        outcome.final_text = CollectText(response.content);
        outcome.stop_reason = response.stop_reason;

        if (!response.WantsToolUse()) {
            Transition(LoopState::Done);
            return Result<LoopOutcome, Error>::Ok(std::move(outcome));
        }

        auto tool_use = FindFirstToolUse(response.content);
        if (!tool_use) {
            logger_.Warn("loop", "stop_reason is tool_use but no tool_use block present");
            Transition(LoopState::Done);
            return Result<LoopOutcome, Error>::Ok(std::move(outcome));
        }

        // -- ModelWantsTool ---------------------------------------------------
        Transition(LoopState::ModelWantsTool);
        messages_.push_back(Message::AssistantBlocks(std::move(response.content)));

        // -- ExecutingTool ----------------------------------------------------
        Transition(LoopState::ExecutingTool);
        if (Cancelled()) {
            return Fail(Error{"Run", tool_use->name, std::nullopt,
                              "Run cancelled before tool dispatch", std::nullopt,
                              ErrorCategory::Cancelled});
        }

        logger_.Info("loop", "Calling tool '" + tool_use->name + "'");
        auto dispatched = registry_.Dispatch(tool_use->name, tool_use->input);
        ++outcome.tool_dispatches;

        if (dispatched.IsOk()) {
            messages_.push_back(Message::ToolResult(
                tool_use->id, SerializeToolResult(dispatched.Value())));
        } else if (options_.tool_error_policy == ToolErrorPolicy::ReportToModel) {
            const auto& err = dispatched.Error();
            logger_.Warn("loop", "Tool '" + tool_use->name + "' failed, reporting to model: " +
                                     err.message);
            messages_.push_back(Message::ToolResult(tool_use->id, "Error: " + err.message,
                                                    true));
        } else {
            return Fail(std::move(dispatched).Error());
        }

        Transition(LoopState::AwaitingModel);
    }
}

} // namespace mcp_agent
