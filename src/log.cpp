// =============================================================================
// log.cpp - Log levels and line output
// =============================================================================

#include "clamm/log.hpp"

#include <stdexcept>

namespace clamm {

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::write(LogLevel level, const std::string& message) const {
    *sink_ << "[clamm] [" << to_string(level) << "] " << message << '\n';
}

} // namespace clamm
