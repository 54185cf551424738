#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <climits>

// Usage:
//   auto logger = std::make_shared<Logger>("node");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   logger->info("TcpAcceptLoop: listening on tcp://0.0.0.0:5555");
// Every sink filters on its own level; the logger name prefixes each line.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& logger_name, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    static std::string format(LogLevel level, const std::string& logger_name, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "]";
        if (!logger_name.empty()) oss << "[" << logger_name << "]";
        oss << " " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info;
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& logger_name, const std::string& message) override {
        if (level < min_level_) return;
        // Background loops log concurrently; keep lines whole.
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format(level, logger_name, message) << std::endl;
    }

private:
    std::mutex mutex_;
};

/** In-memory sink; tests inspect what the transport logged. */
class VectorSink : public LogSink {
public:
    VectorSink() { min_level_ = LogLevel::Debug; }

    void log(LogLevel level, const std::string& logger_name, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format(level, logger_name, message));
        levels_.push_back(level);
    }

    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }

    // Number of captured lines at or above min_level containing needle.
    size_t count_containing(const std::string& needle, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level && lines_[i].find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("frame-messenger") {}

    explicit Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
