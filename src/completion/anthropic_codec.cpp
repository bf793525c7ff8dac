#include <mcp_agent/completion/anthropic_codec.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

namespace mcp_agent {

namespace {

Error MakeDecodeError(const std::string& message) {
    return Error{"DecodeResponse", "/v1/messages", std::nullopt, message,
                 std::nullopt, ErrorCategory::Completion};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json EncodeContentBlock(const ContentBlock& block) {
    if (const auto* text = std::get_if<TextBlock>(&block)) {
        return {{"type", "text"}, {"text", text->text}};
    }
    if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
        return {{"type", "tool_use"},
                {"id", use->id},
                {"name", use->name},
                {"input", use->input.is_null() ? nlohmann::json::object()
                                               : use->input}};
    }
    if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
        nlohmann::json j = {{"type", "tool_result"},
                            {"tool_use_id", result->tool_use_id},
                            {"content", result->content}};
        if (result->is_error) {
            j["is_error"] = true;
        }
        return j;
    }
    return std::get<OpaqueBlock>(block).raw;
}

nlohmann::json EncodeMessage(const Message& message) {
    nlohmann::json j;
    j["role"] = RoleName(message.role);
    if (message.IsText()) {
        j["content"] = message.Text();
    } else {
        auto blocks = nlohmann::json::array();
        for (const auto& block : message.Blocks()) {
            blocks.push_back(EncodeContentBlock(block));
        }
        j["content"] = std::move(blocks);
    }
    return j;
}

nlohmann::json EncodeTool(const ToolDescriptor& tool) {
    nlohmann::json j;
    j["name"] = tool.name;
    if (!tool.description.empty()) {
        j["description"] = tool.description;
    }
    j["input_schema"] = tool.input_schema.is_object()
                            ? tool.input_schema
                            : nlohmann::json{{"type", "object"}};
    return j;
}

nlohmann::json EncodeRequest(const CompletionRequest& request) {
    nlohmann::json j;
    j["model"] = request.model;
    j["max_tokens"] = request.max_tokens;
    j["temperature"] = request.temperature;

    auto messages = nlohmann::json::array();
    for (const auto& m : request.messages) {
        messages.push_back(EncodeMessage(m));
    }
    j["messages"] = std::move(messages);

    if (request.tools.has_value()) {
        auto tools = nlohmann::json::array();
        for (const auto& t : *request.tools) {
            tools.push_back(EncodeTool(t));
        }
        j["tools"] = std::move(tools);
    }
    return j;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
Result<ContentBlock, Error> DecodeContentBlock(const nlohmann::json& node) {
    if (!node.is_object() || !node.contains("type") || !node["type"].is_string()) {
        return Result<ContentBlock, Error>::Err(
            MakeDecodeError("Content block without a string 'type'"));
    }
    const auto type = node["type"].get<std::string>();

    if (type == "text") {
        auto it = node.find("text");
        if (it == node.end() || !it->is_string()) {
            return Result<ContentBlock, Error>::Err(
                MakeDecodeError("Text block without a string 'text'"));
        }
        return Result<ContentBlock, Error>::Ok(TextBlock{it->get<std::string>()});
    }

    if (type == "tool_use") {
        auto id = node.find("id");
        auto name = node.find("name");
        if (id == node.end() || !id->is_string() ||
            name == node.end() || !name->is_string()) {
            return Result<ContentBlock, Error>::Err(
                MakeDecodeError("tool_use block without string 'id' and 'name'"));
        }
        ToolUseBlock use;
        use.id = id->get<std::string>();
        use.name = name->get<std::string>();
        auto input = node.find("input");
        use.input = (input == node.end() || input->is_null())
                        ? nlohmann::json::object()
                        : *input;
        return Result<ContentBlock, Error>::Ok(std::move(use));
    }

    return Result<ContentBlock, Error>::Ok(OpaqueBlock{node});
}

Result<CompletionResponse, Error> DecodeResponse(const nlohmann::json& body) {
    if (!body.is_object()) {
        return Result<CompletionResponse, Error>::Err(
            MakeDecodeError("Response body is not a JSON object"));
    }

    auto content = body.find("content");
    if (content == body.end() || !content->is_array()) {
        return Result<CompletionResponse, Error>::Err(
            MakeDecodeError("Response missing 'content' array"));
    }

    CompletionResponse response;
    for (auto [key, field] : {std::pair<const char*, std::string*>{"id", &response.id},
                              std::pair<const char*, std::string*>{"model", &response.model}}) {
        auto it = body.find(key);
        if (it == body.end()) {
            continue;
        }
        if (!it->is_string()) {
            return Result<CompletionResponse, Error>::Err(
                MakeDecodeError(std::string("Response field '") + key + "' is not a string"));
        }
        *field = it->get<std::string>();
    }

    auto stop = body.find("stop_reason");
    if (stop != body.end() && stop->is_string()) {
        response.stop_reason = stop->get<std::string>();
    }

    for (const auto& node : *content) {
        auto block = DecodeContentBlock(node);
        if (block.IsErr()) {
            return Result<CompletionResponse, Error>::Err(std::move(block).Error());
        }
        response.content.push_back(std::move(block).Value());
    }

    auto usage = body.find("usage");
    if (usage != body.end() && !usage->is_null()) {
        if (!usage->is_object()) {
            return Result<CompletionResponse, Error>::Err(
                MakeDecodeError("Response field 'usage' is not an object"));
        }
        for (auto [key, field] :
             {std::pair<const char*, int64_t*>{"input_tokens", &response.usage.input_tokens},
              std::pair<const char*, int64_t*>{"output_tokens", &response.usage.output_tokens}}) {
            auto it = usage->find(key);
            if (it == usage->end()) {
                continue;
            }
            if (!it->is_number_integer()) {
                return Result<CompletionResponse, Error>::Err(MakeDecodeError(
                    std::string("Usage field '") + key + "' is not an integer"));
            }
            *field = it->get<int64_t>();
        }
    }

    return Result<CompletionResponse, Error>::Ok(std::move(response));
}

} // namespace mcp_agent
