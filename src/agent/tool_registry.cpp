#include <mcp_agent/agent/tool_registry.hpp>

#include <utility>

namespace mcp_agent {

ToolRegistry::ToolRegistry(Logger& logger) : logger_(logger) {}

void ToolRegistry::Register(IToolProvider& provider, std::vector<ToolDescriptor> tools) {
    logger_.Info("registry", "Registered " + std::to_string(tools.size()) +
                                 " tool(s) from '" + provider.Name() + "'");
    entries_.push_back(Entry{&provider, std::move(tools)});
}

std::vector<ToolDescriptor> ToolRegistry::AllTools() const {
    std::vector<ToolDescriptor> all;
    for (const auto& entry : entries_) {
        all.insert(all.end(), entry.tools.begin(), entry.tools.end());
    }
    return all;
}

Result<nlohmann::json, Error> ToolRegistry::Dispatch(const std::string& name,
                                                     const nlohmann::json& input) const {
    std::string probes;
    for (const auto& entry : entries_) {
        auto result = entry.provider->CallTool(name, input);
        if (result.IsOk()) {
            logger_.Debug("registry", "'" + name + "' handled by '" +
                                          entry.provider->Name() + "'");
            return Result<nlohmann::json, Error>::Ok(std::move(result).Value());
        }

        const auto& failure = result.Error();
        const auto line = entry.provider->Name() + ": " + failure.KindName() +
                          ": " + failure.error.message;
        logger_.Debug("registry", "'" + name + "' probe failed on " + line);
        if (!probes.empty()) probes += "; ";
        probes += line;
    }

    Error err{"Dispatch", name, std::nullopt,
              "Tool '" + name + "' not found in any provider", std::nullopt,
              ErrorCategory::NotFound};
    if (!probes.empty()) {
        err.detail = probes;
    }
    return Result<nlohmann::json, Error>::Err(std::move(err));
}

} // namespace mcp_agent
