#include <mcp_agent/cli/output_formatter.hpp>
#include <mcp_agent/core/terminal.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace mcp_agent {

namespace {

using namespace mcp_agent::ansi;

std::string DumpJson(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

nlohmann::json RunResultToJson(const RunResult& result) {
    nlohmann::json j;
    j["response"] = result.response;
    j["model"] = result.model;
    j["stop_reason"] = result.stop_reason;
    j["usage"] = {{"input_tokens", result.usage.input_tokens},
                  {"output_tokens", result.usage.output_tokens}};
    return j;
}

void OutputFormatter::PrintRunResult(const RunResult& result) const {
    if (json_mode_) {
        out_ << DumpJson(RunResultToJson(result), 2) << "\n";
        return;
    }

    out_ << result.response;
    if (result.response.empty() || result.response.back() != '\n') {
        out_ << "\n";
    }
    out_ << "\n";
    PrintTable({"model", "stop_reason", "input_tokens", "output_tokens"},
               {{result.model, result.stop_reason,
                 std::to_string(result.usage.input_tokens),
                 std::to_string(result.usage.output_tokens)}});
}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << DumpJson(arr) << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    const auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (!error.endpoint.empty()) {
            err_ << kDim << " [" << error.endpoint << "]" << kReset;
        }
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.detail.has_value() && !error.detail->empty()) {
            err_ << "  " << kDim << "Detail: " << kReset << error.detail.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.endpoint.empty()) {
        err_ << " [" << error.endpoint << "]";
    }
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  Detail: " << error.detail.value() << "\n";
    }
}

} // namespace mcp_agent
