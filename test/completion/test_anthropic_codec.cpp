#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <mcp_agent/completion/anthropic_codec.hpp>

using namespace mcp_agent;
using nlohmann::json;

// ===========================================================================
// Encoding
// ===========================================================================

TEST_CASE("EncodeMessage: plain text becomes a content string", "[completion][codec]") {
    auto j = EncodeMessage(Message::UserText("What is 2+2?"));
    CHECK(j == json{{"role", "user"}, {"content", "What is 2+2?"}});
}

TEST_CASE("EncodeMessage: assistant turn keeps every block", "[completion][codec]") {
    auto thinking = json{{"type", "thinking"}, {"thinking", "hmm"}, {"signature", "s"}};
    auto m = Message::AssistantBlocks({
        OpaqueBlock{thinking},
        TextBlock{"Adding."},
        ToolUseBlock{"toolu_1", "add", {{"a", 2}, {"b", 2}}},
    });

    auto j = EncodeMessage(m);
    CHECK(j["role"] == "assistant");
    REQUIRE(j["content"].size() == 3);
    CHECK(j["content"][0] == thinking);
    CHECK(j["content"][1] == json{{"type", "text"}, {"text", "Adding."}});
    CHECK(j["content"][2] == json{{"type", "tool_use"},
                                  {"id", "toolu_1"},
                                  {"name", "add"},
                                  {"input", {{"a", 2}, {"b", 2}}}});
}

TEST_CASE("EncodeContentBlock: tool_use with null input sends an empty object",
          "[completion][codec]") {
    auto j = EncodeContentBlock(ToolUseBlock{"toolu_1", "now", nullptr});
    CHECK(j["input"] == json::object());
}

TEST_CASE("EncodeContentBlock: is_error only when set", "[completion][codec]") {
    auto ok = EncodeContentBlock(ToolResultBlock{"toolu_1", "4", false});
    CHECK(ok == json{{"type", "tool_result"}, {"tool_use_id", "toolu_1"}, {"content", "4"}});

    auto err = EncodeContentBlock(ToolResultBlock{"toolu_2", "Error: boom", true});
    CHECK(err["is_error"] == true);
}

TEST_CASE("EncodeTool: description optional, schema defaults to object",
          "[completion][codec]") {
    auto full = EncodeTool(ToolDescriptor{"read_file", "Read a file",
                                          {{"type", "object"},
                                           {"properties", {{"path", {{"type", "string"}}}}}}});
    CHECK(full["description"] == "Read a file");
    CHECK(full["input_schema"]["properties"]["path"]["type"] == "string");

    auto bare = EncodeTool(ToolDescriptor{"now", "", nullptr});
    CHECK_FALSE(bare.contains("description"));
    CHECK(bare["input_schema"] == json{{"type", "object"}});
}

TEST_CASE("EncodeRequest: tools key only when a catalog is given", "[completion][codec]") {
    CompletionRequest request;
    request.model = "claude-3-5-sonnet-20241022";
    request.max_tokens = 1024;
    request.temperature = 0.3;
    request.messages.push_back(Message::UserText("hi"));

    auto without = EncodeRequest(request);
    CHECK(without["model"] == "claude-3-5-sonnet-20241022");
    CHECK(without["max_tokens"] == 1024);
    CHECK(without["temperature"].get<double>() == Catch::Approx(0.3));
    CHECK(without["messages"].size() == 1);
    CHECK_FALSE(without.contains("tools"));

    request.tools = std::vector<ToolDescriptor>{
        ToolDescriptor{"echo", "Echo text", {{"type", "object"}}},
        ToolDescriptor{"add", "Add numbers", {{"type", "object"}}},
    };
    auto with = EncodeRequest(request);
    REQUIRE(with["tools"].size() == 2);
    CHECK(with["tools"][0]["name"] == "echo");
    CHECK(with["tools"][1]["name"] == "add");
}

// ===========================================================================
// Decoding
// ===========================================================================

TEST_CASE("DecodeResponse: tool_use response", "[completion][codec]") {
    auto body = json::parse(R"({
        "id": "msg_01",
        "type": "message",
        "role": "assistant",
        "model": "claude-3-5-sonnet-20241022",
        "stop_reason": "tool_use",
        "content": [
            {"type": "text", "text": "Let me add those."},
            {"type": "tool_use", "id": "toolu_01", "name": "add", "input": {"a": 2, "b": 2}}
        ],
        "usage": {"input_tokens": 120, "output_tokens": 42}
    })");

    auto result = DecodeResponse(body);
    REQUIRE(result.IsOk());
    const auto& r = result.Value();
    CHECK(r.id == "msg_01");
    CHECK(r.model == "claude-3-5-sonnet-20241022");
    CHECK(r.stop_reason == "tool_use");
    CHECK(r.WantsToolUse());
    REQUIRE(r.content.size() == 2);
    CHECK(std::get<TextBlock>(r.content[0]).text == "Let me add those.");
    const auto& use = std::get<ToolUseBlock>(r.content[1]);
    CHECK(use.id == "toolu_01");
    CHECK(use.input == json{{"a", 2}, {"b", 2}});
    CHECK(r.usage == Usage{120, 42});
}

TEST_CASE("DecodeResponse: unknown block types are kept verbatim", "[completion][codec]") {
    auto body = json::parse(R"({
        "stop_reason": "end_turn",
        "content": [
            {"type": "thinking", "thinking": "...", "signature": "abc"},
            {"type": "text", "text": "4"}
        ]
    })");
    auto result = DecodeResponse(body);
    REQUIRE(result.IsOk());
    const auto& r = result.Value();
    CHECK_FALSE(r.WantsToolUse());
    REQUIRE(std::holds_alternative<OpaqueBlock>(r.content[0]));
    CHECK(std::get<OpaqueBlock>(r.content[0]).raw["signature"] == "abc");
    CHECK(r.usage == Usage{0, 0});
}

TEST_CASE("DecodeResponse: tool_use without input gets an empty object",
          "[completion][codec]") {
    auto body = json::parse(
        R"({"stop_reason":"tool_use","content":[{"type":"tool_use","id":"t","name":"now"}]})");
    auto result = DecodeResponse(body);
    REQUIRE(result.IsOk());
    CHECK(std::get<ToolUseBlock>(result.Value().content[0]).input == json::object());
}

TEST_CASE("DecodeResponse: malformed bodies are Completion errors", "[completion][codec]") {
    auto expect_error = [](const json& body, const std::string& message) {
        auto result = DecodeResponse(body);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Completion);
        CHECK(result.Error().operation == "DecodeResponse");
        CHECK(result.Error().message == message);
    };

    expect_error(json::array(), "Response body is not a JSON object");
    expect_error(json{{"stop_reason", "end_turn"}}, "Response missing 'content' array");
    expect_error(json::parse(R"({"content":[{"text":"no type"}]})"),
                 "Content block without a string 'type'");
    expect_error(json::parse(R"({"content":[{"type":"text","text":5}]})"),
                 "Text block without a string 'text'");
    expect_error(json::parse(R"({"content":[{"type":"tool_use","name":"add"}]})"),
                 "tool_use block without string 'id' and 'name'");
}

TEST_CASE("DecodeResponse: wrongly typed metadata fields are errors, not exceptions",
          "[completion][codec]") {
    auto decode = [](const std::string& text) {
        Result<CompletionResponse, Error> result =
            Result<CompletionResponse, Error>::Err(Error{});
        CHECK_NOTHROW(result = DecodeResponse(json::parse(text)));
        return result;
    };

    auto null_id = decode(
        R"({"id":null,"content":[{"type":"text","text":"hi"}],"stop_reason":"end_turn"})");
    REQUIRE(null_id.IsErr());
    CHECK(null_id.Error().category == ErrorCategory::Completion);
    CHECK(null_id.Error().message == "Response field 'id' is not a string");

    auto numeric_model = decode(R"({"model":7,"content":[]})");
    REQUIRE(numeric_model.IsErr());
    CHECK(numeric_model.Error().message == "Response field 'model' is not a string");

    auto null_input = decode(
        R"({"content":[],"usage":{"input_tokens":null,"output_tokens":3}})");
    REQUIRE(null_input.IsErr());
    CHECK(null_input.Error().message == "Usage field 'input_tokens' is not an integer");

    auto text_output = decode(
        R"({"content":[],"usage":{"input_tokens":3,"output_tokens":"many"}})");
    REQUIRE(text_output.IsErr());
    CHECK(text_output.Error().message == "Usage field 'output_tokens' is not an integer");

    auto usage_array = decode(R"({"content":[],"usage":[1,2]})");
    REQUIRE(usage_array.IsErr());
    CHECK(usage_array.Error().message == "Response field 'usage' is not an object");
}

TEST_CASE("DecodeResponse: absent metadata fields keep their defaults", "[completion][codec]") {
    auto result = DecodeResponse(json::parse(R"({"content":[],"usage":{"output_tokens":9}})"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().id.empty());
    CHECK(result.Value().model.empty());
    CHECK(result.Value().usage.input_tokens == 0);
    CHECK(result.Value().usage.output_tokens == 9);
}
