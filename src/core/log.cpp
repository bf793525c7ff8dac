#include <mcp_agent/core/log.hpp>
#include <mcp_agent/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_agent {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Fixed-width 5-char level tag (right-padded).
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string HhMmSsNow() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time_t_now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        out_ << Iso8601Now()
             << " [" << LevelName(level) << "] "
             << "[" << component << "] "
             << message << '\n';
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTag(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Iso8601Now()},
        {"level", LevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Tool output can carry arbitrary bytes; never let a log line throw.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), json_(file_) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    json_.Write(level, component, message);
}

// ---------------------------------------------------------------------------
// TeeSink
// ---------------------------------------------------------------------------
TeeSink::TeeSink(std::vector<std::unique_ptr<ILogSink>> sinks)
    : sinks_(std::move(sinks)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto& sink : sinks_) {
        if (sink) sink->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {
    if (!sink_) {
        sink_ = std::make_unique<NullSink>();
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

} // namespace mcp_agent
