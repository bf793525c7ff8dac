#pragma once

#include <mcp_agent/agent/agent_orchestrator.hpp>
#include <mcp_agent/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace mcp_agent {

// The run output object: {response, model, stop_reason, usage{...}}.
[[nodiscard]] nlohmann::json RunResultToJson(const RunResult& result);

// ---------------------------------------------------------------------------
// OutputFormatter: JSON or human-readable output of a run.
//
// Results go to `out`, errors to `err`. When color_mode is true and
// json_mode is false, tables are rendered with FTXUI and messages use ANSI
// escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // JSON mode: the run output object, indented. Text mode: the response
    // text followed by a table of run metadata.
    void PrintRunResult(const RunResult& result) const;

    // JSON mode: a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mcp_agent
