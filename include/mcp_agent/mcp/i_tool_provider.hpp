#pragma once

#include <mcp_agent/config/app_config.hpp>
#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// ToolCallFailure: why a provider did not produce a result.
//
// NotPresent: the provider does not know the tool (dispatch may try the next
// provider). Failed: the provider knows the tool but the call went wrong.
// ---------------------------------------------------------------------------
struct ToolCallFailure {
    enum class Kind {
        NotPresent,
        Failed,
    };

    Kind kind = Kind::Failed;
    Error error;

    [[nodiscard]] const char* KindName() const noexcept {
        return kind == Kind::NotPresent ? "not_present" : "failed";
    }
};

// ---------------------------------------------------------------------------
// IToolProvider: one live connection to one tool-hosting process.
// ---------------------------------------------------------------------------
class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    IToolProvider(const IToolProvider&) = delete;
    IToolProvider& operator=(const IToolProvider&) = delete;
    IToolProvider(IToolProvider&&) = delete;
    IToolProvider& operator=(IToolProvider&&) = delete;

    // Label used in logs and diagnostics.
    [[nodiscard]] virtual const std::string& Name() const = 0;

    // Full tool catalog of this provider, all pages.
    [[nodiscard]] virtual Result<std::vector<ToolDescriptor>, Error> ListTools() = 0;

    // Invoke one tool. The returned JSON is the provider's raw result.
    [[nodiscard]] virtual Result<nlohmann::json, ToolCallFailure> CallTool(
        const std::string& name, const nlohmann::json& input) = 0;

    // Release the connection. Idempotent and never throws; failures are
    // logged by the implementation.
    virtual void Close() noexcept = 0;

protected:
    IToolProvider() = default;
};

// ---------------------------------------------------------------------------
// IProviderConnector: turns a launch spec into a handshaken provider.
// ---------------------------------------------------------------------------
class IProviderConnector {
public:
    virtual ~IProviderConnector() = default;

    IProviderConnector(const IProviderConnector&) = delete;
    IProviderConnector& operator=(const IProviderConnector&) = delete;
    IProviderConnector(IProviderConnector&&) = delete;
    IProviderConnector& operator=(IProviderConnector&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<IToolProvider>, Error> Connect(
        const ToolProviderSpec& spec) = 0;

protected:
    IProviderConnector() = default;
};

} // namespace mcp_agent
