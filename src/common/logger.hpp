#pragma once

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

// Shared destination for log lines. Without a file it only mirrors to stderr
// (when enabled), which is what the foreground daemon and the tests use.
class LogSink {
public:
    LogSink() = default;
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    // Appends to `path`, creating parent directories. Failure is not fatal.
    bool open(const std::string& path);
    void close();

    void set_verbose(bool verbose) { verbose_ = verbose; }
    void set_mirror_stderr(bool mirror) { mirror_stderr_ = mirror; }
    bool verbose() const { return verbose_; }

    void write(std::string_view level, std::string_view context, std::string_view msg);

private:
    std::mutex mutex_;
    FILE* file_ = nullptr;
    bool verbose_ = false;
    bool mirror_stderr_ = false;
};

// Cheap handle tagging every line with a component name.
class Logger {
public:
    Logger(LogSink& sink, std::string context)
        : sink_(&sink), context_(std::move(context)) {}

    void info(std::string_view msg) const { sink_->write("INFO", context_, msg); }
    void warn(std::string_view msg) const { sink_->write("WARN", context_, msg); }
    void error(std::string_view msg) const { sink_->write("ERROR", context_, msg); }
    void debug(std::string_view msg) const {
        if (sink_->verbose()) sink_->write("DEBUG", context_, msg);
    }

private:
    LogSink* sink_;
    std::string context_;
};
