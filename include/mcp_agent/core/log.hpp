#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_agent {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Discards everything.
class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// Color console sink: colored, compact output to a stream.
// When use_color is false, writes "<iso8601> [LEVEL] [component] message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink: machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// File sink: JSON lines appended to a file it owns.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
    JsonSink json_;
};

// Fans every message out to several sinks.
class TeeSink : public ILogSink {
public:
    explicit TeeSink(std::vector<std::unique_ptr<ILogSink>> sinks);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// ---------------------------------------------------------------------------
// Logger: thread-safe, level-filtering front end over a sink.
//
// There is no process-wide logger: main() builds one and passes it by
// reference to every component that logs.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

} // namespace mcp_agent
