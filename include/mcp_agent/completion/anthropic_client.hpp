#pragma once

#include <mcp_agent/completion/i_completion_client.hpp>
#include <mcp_agent/core/log.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcp_agent {

constexpr const char* kAnthropicVersion = "2023-06-01";

struct AnthropicClientOptions {
    std::string base_url = "https://api.anthropic.com";
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{600};
};

// ---------------------------------------------------------------------------
// AnthropicClient: ICompletionClient over the Messages API using
// cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. Every call is one
// POST /v1/messages; non-2xx statuses map through Error::FromHttpStatus.
// ---------------------------------------------------------------------------
class AnthropicClient : public ICompletionClient {
public:
    AnthropicClient(std::string api_key,
                    Logger& logger,
                    const AnthropicClientOptions& options = {});
    ~AnthropicClient() override;

    AnthropicClient(const AnthropicClient&) = delete;
    AnthropicClient& operator=(const AnthropicClient&) = delete;
    AnthropicClient(AnthropicClient&&) = delete;
    AnthropicClient& operator=(AnthropicClient&&) = delete;

    [[nodiscard]] Result<CompletionResponse, Error> CreateCompletion(
        const CompletionRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_agent
