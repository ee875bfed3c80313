// File: src/core/logging.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

namespace apo {

enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4,
};

enum class LogComponent : uint8_t {
    CONFIG,
    STORAGE,
    CACHE,
    LEARNING,
    OPTIMIZER,
};

const char* ToString(LogLevel level);
const char* ToString(LogComponent component);

// Parse LogLevel from string ("debug", "info", "warn", "error", "off")
LogLevel ParseLogLevel(const std::string& str);

/// Process-wide minimum severity for diagnostics written to std::cerr
class LogManager {
public:
    static LogManager& Instance() {
        static LogManager instance;
        return instance;
    }

    void SetMinLevel(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel GetMinLevel() const { return min_level_.load(std::memory_order_relaxed); }

    bool ShouldLog(LogLevel level) const {
        return level != LogLevel::OFF && level >= GetMinLevel();
    }

    /// Write one formatted line
    void Write(LogLevel level, LogComponent component, const std::string& message);

private:
    LogManager() = default;
    std::atomic<LogLevel> min_level_{LogLevel::WARN};
};

} // namespace apo

// The message expression is only evaluated when the level is enabled.
#define APO_LOG(level, component, message)                                   \
    do {                                                                     \
        if (::apo::LogManager::Instance().ShouldLog(level)) {                \
            std::ostringstream apo_log_oss_;                                 \
            apo_log_oss_ << message;                                         \
            ::apo::LogManager::Instance().Write(level, component,            \
                                                apo_log_oss_.str());         \
        }                                                                    \
    } while (0)
