#pragma once

#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// CompletionRequest: one call to the completion API.
//
// `tools` is nullopt when the catalog is empty; the encoded request then
// carries no "tools" key at all.
// ---------------------------------------------------------------------------
struct CompletionRequest {
    std::string model;
    int max_tokens = 0;
    double temperature = 1.0;
    std::vector<Message> messages;
    std::optional<std::vector<ToolDescriptor>> tools;
};

// ---------------------------------------------------------------------------
// CompletionResponse: what the loop needs from a completion API reply.
// ---------------------------------------------------------------------------
struct CompletionResponse {
    std::string id;
    std::string model;
    std::string stop_reason;
    std::vector<ContentBlock> content;
    Usage usage;

    [[nodiscard]] bool WantsToolUse() const noexcept {
        return stop_reason == kStopReasonToolUse;
    }
};

// ---------------------------------------------------------------------------
// ICompletionClient: the completion API boundary.
//
// The conversation loop depends on this interface only, so it can run
// against MockCompletionClient in tests. Never throws on expected failures.
// ---------------------------------------------------------------------------
class ICompletionClient {
public:
    virtual ~ICompletionClient() = default;

    ICompletionClient(const ICompletionClient&) = delete;
    ICompletionClient& operator=(const ICompletionClient&) = delete;
    ICompletionClient(ICompletionClient&&) = delete;
    ICompletionClient& operator=(ICompletionClient&&) = delete;

    [[nodiscard]] virtual Result<CompletionResponse, Error> CreateCompletion(
        const CompletionRequest& request) = 0;

protected:
    ICompletionClient() = default;
};

} // namespace mcp_agent
