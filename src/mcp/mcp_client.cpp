#include <mcp_agent/mcp/mcp_client.hpp>
#include <mcp_agent/core/version.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace mcp_agent {

namespace {

constexpr int kMaxToolPages = 64;

Error MakeProviderError(const std::string& operation,
                        const std::string& provider,
                        const std::string& message,
                        ErrorCategory category = ErrorCategory::Provider) {
    return Error{operation, provider, std::nullopt, message, std::nullopt, category};
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string ExtractJsonRpcError(const nlohmann::json& error) {
    std::string msg;
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        msg = error["message"].get<std::string>();
    }
    if (msg.empty()) msg = "json-rpc error";
    return msg;
}

// Servers differ in how they reject an unknown tool name: some use
// "method not found", most use "invalid params" with a message.
bool IsUnknownToolError(std::optional<int> code, const std::string& message) {
    if (!code) return false;
    if (*code == kJsonRpcMethodNotFound) return true;
    if (*code != kJsonRpcInvalidParams) return false;
    const auto lower = ToLower(message);
    return lower.find("unknown tool") != std::string::npos ||
           lower.find("not found") != std::string::npos;
}

} // anonymous namespace

McpClient::McpClient(std::string name,
                     std::unique_ptr<IMessageTransport> transport,
                     Logger& logger,
                     std::chrono::milliseconds request_timeout)
    : name_(std::move(name)),
      transport_(std::move(transport)),
      logger_(logger),
      request_timeout_(request_timeout) {}

McpClient::~McpClient() {
    Close();
}

// ---------------------------------------------------------------------------
// JSON-RPC plumbing
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> McpClient::Request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::optional<int>* rpc_code) {
    using R = Result<nlohmann::json, Error>;
    if (closed_) {
        return R::Err(MakeProviderError(method, name_, "Connection is closed",
                                        ErrorCategory::Connection));
    }

    const auto id = next_id_++;
    nlohmann::json req;
    req["jsonrpc"] = "2.0";
    req["id"] = id;
    req["method"] = method;
    req["params"] = params;

    const auto deadline = std::chrono::steady_clock::now() + request_timeout_;
    auto sent = transport_->Send(req, request_timeout_);
    if (sent.IsErr()) {
        auto err = std::move(sent).Error();
        err.operation = method;
        err.endpoint = name_;
        return R::Err(std::move(err));
    }

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        const auto remaining = deadline > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
            : std::chrono::milliseconds(0);

        auto received = transport_->Receive(remaining);
        if (received.IsErr()) {
            auto err = std::move(received).Error();
            err.operation = method;
            err.endpoint = name_;
            return R::Err(std::move(err));
        }
        auto msg = std::move(received).Value();
        if (!msg.is_object()) {
            logger_.Debug("mcp", name_ + ": skipping non-object message");
            continue;
        }

        // Server-initiated traffic.
        if (msg.contains("method")) {
            const auto server_method = msg["method"].is_string()
                ? msg["method"].get<std::string>() : std::string();
            if (!msg.contains("id")) {
                logger_.Debug("mcp", name_ + ": notification " + server_method);
                continue;
            }
            nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
            if (server_method == "ping") {
                reply["result"] = nlohmann::json::object();
            } else {
                reply["error"] = {{"code", kJsonRpcMethodNotFound},
                                  {"message", "Method not supported by client: " +
                                                  server_method}};
            }
            auto answered = transport_->Send(reply, request_timeout_);
            if (answered.IsErr()) {
                logger_.Debug("mcp", name_ + ": failed to answer " + server_method +
                                         ": " + answered.Error().message);
            }
            continue;
        }

        if (!msg.contains("id") || msg["id"] != nlohmann::json(id)) {
            logger_.Debug("mcp", name_ + ": skipping response with unexpected id");
            continue;
        }

        if (msg.contains("error") && !msg["error"].is_null()) {
            const auto& error = msg["error"];
            if (rpc_code != nullptr && error.is_object() && error.contains("code") &&
                error["code"].is_number_integer()) {
                *rpc_code = error["code"].get<int>();
            }
            auto err = MakeProviderError(method, name_, ExtractJsonRpcError(error));
            if (error.is_object() && error.contains("data")) {
                err.detail = error["data"].dump();
            }
            return R::Err(std::move(err));
        }
        if (!msg.contains("result")) {
            return R::Err(MakeProviderError(method, name_, "Response missing result"));
        }
        return R::Ok(std::move(msg["result"]));
    }
}

Result<void, Error> McpClient::Notify(const std::string& method) {
    nlohmann::json note = {{"jsonrpc", "2.0"}, {"method", method}};
    return transport_->Send(note, request_timeout_);
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
Result<void, Error> McpClient::Initialize() {
    nlohmann::json params;
    params["protocolVersion"] = kMcpProtocolVersion;
    params["capabilities"] = nlohmann::json::object();
    params["clientInfo"] = {{"name", "mcp-agent"}, {"version", kVersion}};

    auto result = Request("initialize", params);
    if (result.IsErr()) {
        auto err = std::move(result).Error();
        if (err.category == ErrorCategory::Provider) {
            err.category = ErrorCategory::Connection;
        }
        return Result<void, Error>::Err(std::move(err));
    }

    const auto& init = result.Value();
    if (init.is_object() && init.contains("serverInfo")) {
        server_info_ = init["serverInfo"];
    }
    if (init.is_object() && init.contains("protocolVersion") &&
        init["protocolVersion"].is_string()) {
        logger_.Debug("mcp", name_ + ": protocol " +
                                 init["protocolVersion"].get<std::string>());
    }

    auto notified = Notify("notifications/initialized");
    if (notified.IsErr()) {
        return notified;
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ListTools: follows nextCursor pagination.
// ---------------------------------------------------------------------------
Result<std::vector<ToolDescriptor>, Error> McpClient::ListTools() {
    using R = Result<std::vector<ToolDescriptor>, Error>;
    std::vector<ToolDescriptor> out;
    std::string cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (!cursor.empty()) params["cursor"] = cursor;

        auto result = Request("tools/list", params);
        if (result.IsErr()) {
            return R::Err(std::move(result).Error());
        }
        const auto& r = result.Value();
        if (!r.is_object() || !r.contains("tools") || !r["tools"].is_array()) {
            return R::Err(MakeProviderError("tools/list", name_,
                                            "Result missing 'tools' array"));
        }

        for (const auto& t : r["tools"]) {
            if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
                logger_.Debug("mcp", name_ + ": skipping tool entry without a name");
                continue;
            }
            ToolDescriptor tool;
            tool.name = t["name"].get<std::string>();
            if (t.contains("description") && t["description"].is_string()) {
                tool.description = t["description"].get<std::string>();
            }
            tool.input_schema = (t.contains("inputSchema") && t["inputSchema"].is_object())
                                    ? t["inputSchema"]
                                    : nlohmann::json{{"type", "object"}};
            out.push_back(std::move(tool));
        }

        if (r.contains("nextCursor") && r["nextCursor"].is_string()) {
            cursor = r["nextCursor"].get<std::string>();
            if (cursor.empty()) break;
        } else {
            break;
        }
    }
    return R::Ok(std::move(out));
}

// ---------------------------------------------------------------------------
// CallTool
// ---------------------------------------------------------------------------
Result<nlohmann::json, ToolCallFailure> McpClient::CallTool(
    const std::string& name, const nlohmann::json& input) {
    using R = Result<nlohmann::json, ToolCallFailure>;

    nlohmann::json params;
    params["name"] = name;
    params["arguments"] = input.is_null() ? nlohmann::json::object() : input;

    std::optional<int> code;
    auto result = Request("tools/call", params, &code);
    if (result.IsOk()) {
        return R::Ok(std::move(result).Value());
    }

    auto err = std::move(result).Error();
    if (IsUnknownToolError(code, err.message)) {
        err.category = ErrorCategory::NotFound;
        return R::Err(ToolCallFailure{ToolCallFailure::Kind::NotPresent, std::move(err)});
    }
    if (err.category == ErrorCategory::Provider) {
        err.category = ErrorCategory::Tool;
    }
    return R::Err(ToolCallFailure{ToolCallFailure::Kind::Failed, std::move(err)});
}

void McpClient::Close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (transport_) {
        transport_->Close();
    }
}

} // namespace mcp_agent
