#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace webrepl {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }
    // tag names the subsystem: transfer, console, ws, cli
    void log(LogLevel lvl, const char* tag, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace webrepl
