#include <catch2/catch_test_macros.hpp>

#include <mcp_agent/core/types.hpp>

using namespace mcp_agent;

// ===========================================================================
// Message constructors
// ===========================================================================

TEST_CASE("Message::UserText: user role with plain text", "[types]") {
    auto m = Message::UserText("What is 2+2?");
    CHECK(m.role == Role::User);
    REQUIRE(m.IsText());
    CHECK(m.Text() == "What is 2+2?");
}

TEST_CASE("Message::AssistantBlocks: keeps every block in order", "[types]") {
    std::vector<ContentBlock> blocks{
        TextBlock{"Let me check."},
        ToolUseBlock{"toolu_1", "add", {{"a", 2}, {"b", 2}}},
        OpaqueBlock{{{"type", "thinking"}, {"thinking", "..."}}},
    };
    auto m = Message::AssistantBlocks(blocks);
    CHECK(m.role == Role::Assistant);
    REQUIRE_FALSE(m.IsText());
    REQUIRE(m.Blocks().size() == 3);
    CHECK(std::holds_alternative<TextBlock>(m.Blocks()[0]));
    CHECK(std::holds_alternative<ToolUseBlock>(m.Blocks()[1]));
    CHECK(std::holds_alternative<OpaqueBlock>(m.Blocks()[2]));
}

TEST_CASE("Message::ToolResult: single tool_result block in a user message", "[types]") {
    auto m = Message::ToolResult("toolu_9", "Error: boom", true);
    CHECK(m.role == Role::User);
    REQUIRE(m.Blocks().size() == 1);
    const auto& block = std::get<ToolResultBlock>(m.Blocks()[0]);
    CHECK(block.tool_use_id == "toolu_9");
    CHECK(block.content == "Error: boom");
    CHECK(block.is_error);

    auto ok = Message::ToolResult("toolu_1", "4");
    CHECK_FALSE(std::get<ToolResultBlock>(ok.Blocks()[0]).is_error);
}

TEST_CASE("RoleName: wire names", "[types]") {
    CHECK(std::string(RoleName(Role::User)) == "user");
    CHECK(std::string(RoleName(Role::Assistant)) == "assistant");
}

// ===========================================================================
// Block helpers
// ===========================================================================

TEST_CASE("CollectText: concatenates text blocks only", "[types]") {
    std::vector<ContentBlock> blocks{
        TextBlock{"The answer "},
        ToolUseBlock{"toolu_1", "add", nlohmann::json::object()},
        TextBlock{"is 4"},
    };
    CHECK(CollectText(blocks) == "The answer is 4");
    CHECK(CollectText({}).empty());
}

TEST_CASE("FindFirstToolUse: returns the first tool_use block", "[types]") {
    std::vector<ContentBlock> blocks{
        TextBlock{"two calls"},
        ToolUseBlock{"toolu_1", "first", nlohmann::json::object()},
        ToolUseBlock{"toolu_2", "second", nlohmann::json::object()},
    };
    auto use = FindFirstToolUse(blocks);
    REQUIRE(use.has_value());
    CHECK(use->id == "toolu_1");
    CHECK(use->name == "first");

    CHECK_FALSE(FindFirstToolUse({TextBlock{"no tools"}}).has_value());
}

TEST_CASE("Usage: accumulates with +=", "[types]") {
    Usage total;
    total += Usage{10, 5};
    total += Usage{7, 3};
    CHECK(total == Usage{17, 8});
}
