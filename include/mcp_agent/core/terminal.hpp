#pragma once

namespace mcp_agent {

namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored result output).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace mcp_agent
