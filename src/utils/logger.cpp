#include "logger.hpp"

#include <cstdio>

namespace subghz {

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarning:
            return "WARNING";
        case LogLevel::kError:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

Logger::Logger() {
#ifdef SUBGHZ_BUILD_ARDUINO
    handler_ = std::make_unique<SerialLogHandler>();
#else
    handler_ = std::make_unique<ConsoleLogHandler>();
#endif
}

void Logger::Reset() {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    min_log_level_ = LogLevel::kDebug;
#ifdef SUBGHZ_BUILD_ARDUINO
    handler_ = std::make_unique<SerialLogHandler>();
#else
    handler_ = std::make_unique<ConsoleLogHandler>();
#endif
}

void Logger::LogBytes(LogLevel level, const char* label,
                      const std::vector<uint8_t>& bytes) {
    if (!IsEnabled(level)) {
        return;
    }

    std::string line(label);
    line += ":";
    char hex[4];
    for (uint8_t byte : bytes) {
        // Room for " XX" and the ".." marker
        if (line.size() + 3 + 2 > LOGGER_BUFFER_SIZE) {
            line += "..";
            break;
        }
        snprintf(hex, sizeof(hex), " %02X", byte);
        line += hex;
    }
    LogMessage(level, line);
}

void Logger::LogMessage(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    if (level >= min_log_level_ && handler_) {
        handler_->Write(level, message);
    }
}

// Global logger instance
Logger LOG;

}  // namespace subghz
