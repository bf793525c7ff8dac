#pragma once

#include <mcp_agent/config/app_config.hpp>
#include <mcp_agent/core/log.hpp>
#include <mcp_agent/mcp/i_message_transport.hpp>

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON over a child process's
// stdin/stdout.
//
// The child inherits our stderr and our environment with the spec's env
// overrides applied. Close() ends the child: stdin is closed first, then
// SIGTERM, then SIGKILL, each after a grace period.
// ---------------------------------------------------------------------------
class StdioTransport : public IMessageTransport {
public:
    // Spawn `spec.command` (PATH lookup) with `spec.args`. Fails with a
    // Connection error if the process cannot be started.
    [[nodiscard]] static Result<std::unique_ptr<StdioTransport>, Error> Launch(
        const ToolProviderSpec& spec, Logger& logger,
        std::chrono::milliseconds grace_period = std::chrono::milliseconds(500));

    ~StdioTransport() override;

    [[nodiscard]] Result<void, Error> Send(const nlohmann::json& message,
                                           std::chrono::milliseconds timeout) override;
    [[nodiscard]] Result<nlohmann::json, Error> Receive(
        std::chrono::milliseconds timeout) override;
    void Close() noexcept override;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

    // Exit status collected by Close(), if the child has been reaped.
    [[nodiscard]] std::optional<int> ExitStatus() const noexcept { return exit_status_; }

private:
    StdioTransport(pid_t pid, int stdin_fd, int stdout_fd, std::string command,
                   Logger& logger, std::chrono::milliseconds grace_period);

    // Wait up to `timeout` for the child to exit. True if it was reaped.
    bool WaitForExit(std::chrono::milliseconds timeout) noexcept;

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::string command_;
    Logger& logger_;
    std::chrono::milliseconds grace_period_;
    std::string buffer_;
    bool closed_ = false;
    std::optional<int> exit_status_;
};

} // namespace mcp_agent
