#pragma once

#include <mcp_agent/completion/i_completion_client.hpp>
#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>

#include <nlohmann/json.hpp>

namespace mcp_agent {

// Wire encoding of the Anthropic Messages API.

[[nodiscard]] nlohmann::json EncodeContentBlock(const ContentBlock& block);

// {"role": ..., "content": "<text>" | [blocks...]}
[[nodiscard]] nlohmann::json EncodeMessage(const Message& message);

[[nodiscard]] nlohmann::json EncodeTool(const ToolDescriptor& tool);

// {model, max_tokens, temperature, messages, tools?}
[[nodiscard]] nlohmann::json EncodeRequest(const CompletionRequest& request);

// Decode one content block. Unknown block types come back as OpaqueBlock.
[[nodiscard]] Result<ContentBlock, Error> DecodeContentBlock(
    const nlohmann::json& node);

// Decode a /v1/messages response body. Missing or mistyped required fields
// are Completion errors.
[[nodiscard]] Result<CompletionResponse, Error> DecodeResponse(
    const nlohmann::json& body);

} // namespace mcp_agent
