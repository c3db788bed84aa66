#include "../include/private_analytics/logging.hpp"

#include <iostream>
#include <mutex>

namespace private_analytics {

namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& currentSink() {
    static LogSink sink;
    return sink;
}

LogLevel& currentLevel() {
    static LogLevel level = LogLevel::Info;
    return level;
}

} // namespace

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void logMessage(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex());
    if (level < currentLevel()) return;

    if (currentSink()) {
        currentSink()(level, component, message);
        return;
    }
    std::clog << "[" << logLevelName(level) << "] " << component << ": " << message << std::endl;
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentSink() = std::move(sink);
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentLevel() = level;
}

} // namespace private_analytics
