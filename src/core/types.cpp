#include <mcp_agent/core/types.hpp>

#include <utility>

namespace mcp_agent {

const char* RoleName(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

Message Message::UserText(std::string text) {
    Message m;
    m.role = Role::User;
    m.content = std::move(text);
    return m;
}

Message Message::AssistantBlocks(std::vector<ContentBlock> blocks) {
    Message m;
    m.role = Role::Assistant;
    m.content = std::move(blocks);
    return m;
}

Message Message::ToolResult(std::string tool_use_id, std::string content,
                            bool is_error) {
    Message m;
    m.role = Role::User;
    m.content = std::vector<ContentBlock>{
        ToolResultBlock{std::move(tool_use_id), std::move(content), is_error}};
    return m;
}

std::string CollectText(const std::vector<ContentBlock>& blocks) {
    std::string text;
    for (const auto& block : blocks) {
        if (const auto* t = std::get_if<TextBlock>(&block)) {
            text += t->text;
        }
    }
    return text;
}

std::optional<ToolUseBlock> FindFirstToolUse(
    const std::vector<ContentBlock>& blocks) {
    for (const auto& block : blocks) {
        if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            return *use;
        }
    }
    return std::nullopt;
}

} // namespace mcp_agent
