#pragma once

#include <mcp_agent/core/log.hpp>
#include <mcp_agent/mcp/i_message_transport.hpp>
#include <mcp_agent/mcp/i_tool_provider.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcp_agent {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// JSON-RPC error codes the client inspects.
constexpr int kJsonRpcMethodNotFound = -32601;
constexpr int kJsonRpcInvalidParams = -32602;

// ---------------------------------------------------------------------------
// McpClient: MCP client side over any IMessageTransport.
//
// Requests are strictly sequential: one request is in flight at a time and
// its response is matched by id. Server notifications are skipped; server
// "ping" requests are answered.
// ---------------------------------------------------------------------------
class McpClient : public IToolProvider {
public:
    McpClient(std::string name,
              std::unique_ptr<IMessageTransport> transport,
              Logger& logger,
              std::chrono::milliseconds request_timeout = std::chrono::seconds(60));
    ~McpClient() override;

    // initialize + notifications/initialized.
    [[nodiscard]] Result<void, Error> Initialize();

    [[nodiscard]] const std::string& Name() const override { return name_; }
    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools() override;
    [[nodiscard]] Result<nlohmann::json, ToolCallFailure> CallTool(
        const std::string& name, const nlohmann::json& input) override;
    void Close() noexcept override;

    // serverInfo from the initialize response, if any.
    [[nodiscard]] const nlohmann::json& ServerInfo() const noexcept { return server_info_; }

private:
    // Send a request and wait for its result. On a JSON-RPC error response
    // `rpc_code` (if given) receives the error code.
    Result<nlohmann::json, Error> Request(const std::string& method,
                                          const nlohmann::json& params,
                                          std::optional<int>* rpc_code = nullptr);
    Result<void, Error> Notify(const std::string& method);

    std::string name_;
    std::unique_ptr<IMessageTransport> transport_;
    Logger& logger_;
    std::chrono::milliseconds request_timeout_;
    int64_t next_id_ = 1;
    bool closed_ = false;
    nlohmann::json server_info_;
};

} // namespace mcp_agent
