#ifndef CLAMM_LOG_HPP
#define CLAMM_LOG_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace clamm {

// =============================================================================
// Logging
// =============================================================================

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

// "trace", "debug", "info", "warn", "error" or "off".
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(std::string_view name);
const char* to_string(LogLevel level);

// Level-filtered line logger: "[clamm] [level] message"
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream* sink = &std::cerr)
        : level_(level), sink_(sink) {}

    LogLevel level() const { return level_; }
    void set_level(LogLevel level) { level_ = level; }
    void set_sink(std::ostream* sink) { sink_ = sink; }

    bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_ && sink_ != nullptr;
    }

    template <typename... Args>
    void trace(const Args&... args) const { log(LogLevel::Trace, args...); }
    template <typename... Args>
    void debug(const Args&... args) const { log(LogLevel::Debug, args...); }
    template <typename... Args>
    void info(const Args&... args) const { log(LogLevel::Info, args...); }
    template <typename... Args>
    void warn(const Args&... args) const { log(LogLevel::Warn, args...); }
    template <typename... Args>
    void error(const Args&... args) const { log(LogLevel::Error, args...); }

    template <typename... Args>
    void log(LogLevel level, const Args&... args) const {
        if (!enabled(level)) return;
        std::ostringstream line;
        (line << ... << args);
        write(level, line.str());
    }

private:
    void write(LogLevel level, const std::string& message) const;

    LogLevel level_;
    std::ostream* sink_;
};

} // namespace clamm

#endif // CLAMM_LOG_HPP
