#include <mcp_agent/mcp/stdio_connector.hpp>
#include <mcp_agent/mcp/mcp_client.hpp>
#include <mcp_agent/mcp/stdio_transport.hpp>

namespace mcp_agent {

StdioProviderConnector::StdioProviderConnector(Logger& logger,
                                               std::chrono::milliseconds request_timeout)
    : logger_(logger), request_timeout_(request_timeout) {}

Result<std::unique_ptr<IToolProvider>, Error> StdioProviderConnector::Connect(
    const ToolProviderSpec& spec) {
    using R = Result<std::unique_ptr<IToolProvider>, Error>;

    auto transport = StdioTransport::Launch(spec, logger_);
    if (transport.IsErr()) {
        return R::Err(std::move(transport).Error());
    }

    auto client = std::make_unique<McpClient>(spec.command, std::move(transport).Value(),
                                              logger_, request_timeout_);
    auto init = client->Initialize();
    if (init.IsErr()) {
        client->Close();
        auto err = std::move(init).Error();
        err.message = "MCP handshake failed: " + err.message;
        return R::Err(std::move(err));
    }

    logger_.Info("mcp", "Connected to '" + spec.command + "'");
    return R::Ok(std::move(client));
}

} // namespace mcp_agent
