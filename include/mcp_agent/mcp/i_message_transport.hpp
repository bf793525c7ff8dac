#pragma once

#include <mcp_agent/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// IMessageTransport: a bidirectional channel of JSON messages.
//
// McpClient speaks JSON-RPC over this; tests substitute MockTransport.
// ---------------------------------------------------------------------------
class IMessageTransport {
public:
    virtual ~IMessageTransport() = default;

    IMessageTransport(const IMessageTransport&) = delete;
    IMessageTransport& operator=(const IMessageTransport&) = delete;
    IMessageTransport(IMessageTransport&&) = delete;
    IMessageTransport& operator=(IMessageTransport&&) = delete;

    // Write one message, giving up after `timeout` if the peer stops
    // reading. Timeout on expiry, Connection when the peer is gone.
    [[nodiscard]] virtual Result<void, Error> Send(const nlohmann::json& message,
                                                   std::chrono::milliseconds timeout) = 0;

    // Wait up to `timeout` for the next message. Timeout on expiry,
    // Connection when the peer is gone.
    [[nodiscard]] virtual Result<nlohmann::json, Error> Receive(
        std::chrono::milliseconds timeout) = 0;

    // Idempotent.
    virtual void Close() noexcept = 0;

protected:
    IMessageTransport() = default;
};

} // namespace mcp_agent
