#pragma once

#include <mcp_agent/completion/i_completion_client.hpp>

#include <deque>
#include <string>
#include <vector>

namespace mcp_agent::testing {

// ---------------------------------------------------------------------------
// MockCompletionClient: hand-written mock for offline loop tests.
//
// Usage:
//   MockCompletionClient mock;
//   mock.Enqueue(MockCompletionClient::TextResponse("4"));
//   auto result = mock.CreateCompletion(request);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Requests()[0].messages.size() == 1);
//
// Responses are consumed FIFO. Every request is recorded by value, so the
// message list seen by each call can be inspected afterwards. An empty queue
// yields an Internal error rather than a crash.
// ---------------------------------------------------------------------------
class MockCompletionClient : public ICompletionClient {
public:
    MockCompletionClient() = default;

    void Enqueue(Result<CompletionResponse, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueResponse(CompletionResponse response) {
        Enqueue(Result<CompletionResponse, Error>::Ok(std::move(response)));
    }

    [[nodiscard]] Result<CompletionResponse, Error> CreateCompletion(
        const CompletionRequest& request) override {
        requests_.push_back(request);
        if (responses_.empty()) {
            return Result<CompletionResponse, Error>::Err(Error{
                "CreateCompletion", "mock", std::nullopt,
                "MockCompletionClient: no response queued", std::nullopt,
                ErrorCategory::Internal});
        }
        auto next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    [[nodiscard]] size_t CallCount() const noexcept { return requests_.size(); }
    [[nodiscard]] const std::vector<CompletionRequest>& Requests() const noexcept {
        return requests_;
    }
    [[nodiscard]] size_t Pending() const noexcept { return responses_.size(); }

    // -- Canned responses ----------------------------------------------------

    static CompletionResponse TextResponse(const std::string& text,
                                           const std::string& stop_reason = "end_turn",
                                           Usage usage = {10, 5}) {
        CompletionResponse r;
        r.id = "msg_mock";
        r.model = "mock-model";
        r.stop_reason = stop_reason;
        r.content.push_back(TextBlock{text});
        r.usage = usage;
        return r;
    }

    static CompletionResponse ToolUseResponse(const std::string& tool_use_id,
                                              const std::string& tool_name,
                                              nlohmann::json input,
                                              const std::string& preamble = "",
                                              Usage usage = {10, 5}) {
        CompletionResponse r;
        r.id = "msg_mock";
        r.model = "mock-model";
        r.stop_reason = "tool_use";
        if (!preamble.empty()) {
            r.content.push_back(TextBlock{preamble});
        }
        r.content.push_back(ToolUseBlock{tool_use_id, tool_name, std::move(input)});
        r.usage = usage;
        return r;
    }

private:
    std::deque<Result<CompletionResponse, Error>> responses_;
    std::vector<CompletionRequest> requests_;
};

} // namespace mcp_agent::testing
