#pragma once

#include <mcp_agent/core/log.hpp>
#include <mcp_agent/mcp/i_tool_provider.hpp>

#include <chrono>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// StdioProviderConnector: launches a provider process and runs the MCP
// handshake. A process that starts but fails the handshake is shut down
// before the error is returned.
// ---------------------------------------------------------------------------
class StdioProviderConnector : public IProviderConnector {
public:
    explicit StdioProviderConnector(
        Logger& logger,
        std::chrono::milliseconds request_timeout = std::chrono::seconds(60));

    [[nodiscard]] Result<std::unique_ptr<IToolProvider>, Error> Connect(
        const ToolProviderSpec& spec) override;

private:
    Logger& logger_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace mcp_agent
