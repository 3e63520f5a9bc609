#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace piecemeal {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Parses "trace", "debug", "info", "warn" or "error"; returns fallback otherwise.
LogLevel parse_log_level(const std::string& name, LogLevel fallback);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }
    void set_output(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::FILE* out_ = stderr;
    const char* level_str(LogLevel lvl);
};

} // namespace piecemeal
