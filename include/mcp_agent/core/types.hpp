#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// ToolDescriptor: one entry of the flat tool catalog shown to the model.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// Content blocks. A message's block list is a sequence of these; the
// alternative index is the discriminant.
// ---------------------------------------------------------------------------
struct TextBlock {
    std::string text;
};

// An assistant-issued tool invocation.
struct ToolUseBlock {
    std::string id;
    std::string name;
    nlohmann::json input;
};

// The answer to a ToolUseBlock, carried in a user message.
struct ToolResultBlock {
    std::string tool_use_id;
    std::string content;
    bool is_error = false;
};

// A block type this client does not interpret (e.g. "thinking"). Kept
// verbatim so the assistant turn can be replayed unchanged.
struct OpaqueBlock {
    nlohmann::json raw;
};

using ContentBlock =
    std::variant<TextBlock, ToolUseBlock, ToolResultBlock, OpaqueBlock>;

enum class Role {
    User,
    Assistant,
};

[[nodiscard]] const char* RoleName(Role role);

// ---------------------------------------------------------------------------
// Message: one entry of the conversation. Content is either plain text or
// an ordered block list.
// ---------------------------------------------------------------------------
struct Message {
    Role role = Role::User;
    std::variant<std::string, std::vector<ContentBlock>> content;

    static Message UserText(std::string text);
    static Message AssistantBlocks(std::vector<ContentBlock> blocks);
    static Message ToolResult(std::string tool_use_id, std::string content,
                              bool is_error = false);

    [[nodiscard]] bool IsText() const noexcept { return content.index() == 0; }
    [[nodiscard]] const std::string& Text() const { return std::get<0>(content); }
    [[nodiscard]] const std::vector<ContentBlock>& Blocks() const {
        return std::get<1>(content);
    }
};

// Concatenation of every TextBlock, in order.
[[nodiscard]] std::string CollectText(const std::vector<ContentBlock>& blocks);

// First ToolUseBlock in the list, or nullopt.
[[nodiscard]] std::optional<ToolUseBlock> FindFirstToolUse(
    const std::vector<ContentBlock>& blocks);

// ---------------------------------------------------------------------------
// Usage: token counters reported by the completion API.
// ---------------------------------------------------------------------------
struct Usage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;

    Usage& operator+=(const Usage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        return *this;
    }

    bool operator==(const Usage& other) const {
        return input_tokens == other.input_tokens &&
               output_tokens == other.output_tokens;
    }
};

// Stop reasons the loop distinguishes. Anything else is terminal.
constexpr std::string_view kStopReasonToolUse = "tool_use";
constexpr std::string_view kStopReasonEndTurn = "end_turn";
constexpr std::string_view kStopReasonMaxTurns = "max_turns";

} // namespace mcp_agent
