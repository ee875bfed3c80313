// File: src/core/logging.cpp
#include "core/logging.hpp"
#include "core/types.hpp"
#include <mutex>
#include <stdexcept>

namespace apo {

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

const char* ToString(LogComponent component) {
    switch (component) {
        case LogComponent::CONFIG: return "config";
        case LogComponent::STORAGE: return "storage";
        case LogComponent::CACHE: return "cache";
        case LogComponent::LEARNING: return "learning";
        case LogComponent::OPTIMIZER: return "optimizer";
        default: return "unknown";
    }
}

LogLevel ParseLogLevel(const std::string& str) {
    if (str == "debug" || str == "DEBUG") return LogLevel::DEBUG;
    if (str == "info" || str == "INFO") return LogLevel::INFO;
    if (str == "warn" || str == "WARN") return LogLevel::WARN;
    if (str == "error" || str == "ERROR") return LogLevel::ERROR;
    if (str == "off" || str == "OFF") return LogLevel::OFF;
    throw std::invalid_argument("Unknown LogLevel: " + str);
}

void LogManager::Write(LogLevel level, LogComponent component, const std::string& message) {
    // Serialize whole lines so concurrent writers do not interleave
    static std::mutex write_mutex;

    std::ostringstream line;
    line << Timestamp::Now().ToString()
         << " [" << ToString(level) << "] [" << ToString(component) << "] "
         << message << "\n";

    std::lock_guard<std::mutex> lock(write_mutex);
    std::cerr << line.str();
}

} // namespace apo
