#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace sock_scan {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Accepts error|warn|info|debug|trace (case-insensitive).
bool parse_log_level(const std::string& name, LogLevel& out);
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return static_cast<int>(level) <= static_cast<int>(level_.load()); }

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void trace(const std::string& message) { log(LogLevel::Trace, message); }

private:
    Logger() = default;
    static const char* prefix(LogLevel level);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
