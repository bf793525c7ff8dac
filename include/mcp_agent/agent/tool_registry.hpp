#pragma once

#include <mcp_agent/core/log.hpp>
#include <mcp_agent/core/result.hpp>
#include <mcp_agent/core/types.hpp>
#include <mcp_agent/mcp/i_tool_provider.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// ToolRegistry: flat tool catalog over every connected provider.
//
// Providers are kept in registration order. The catalog is their tool lists
// concatenated, duplicates included. Dispatch probes providers in the same
// order; the first provider whose CallTool succeeds wins. Providers are
// borrowed, not owned.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(Logger& logger);

    void Register(IToolProvider& provider, std::vector<ToolDescriptor> tools);

    [[nodiscard]] std::vector<ToolDescriptor> AllTools() const;
    [[nodiscard]] size_t ProviderCount() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

    // NotFound naming the tool when every provider fails; the per-provider
    // failures are listed in Error::detail.
    [[nodiscard]] Result<nlohmann::json, Error> Dispatch(
        const std::string& name, const nlohmann::json& input) const;

private:
    struct Entry {
        IToolProvider* provider;
        std::vector<ToolDescriptor> tools;
    };

    std::vector<Entry> entries_;
    Logger& logger_;
};

} // namespace mcp_agent
