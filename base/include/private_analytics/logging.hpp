#ifndef PRIVATE_ANALYTICS_LOGGING_HPP
#define PRIVATE_ANALYTICS_LOGGING_HPP

#include <functional>
#include <string>

namespace private_analytics {

enum class LogLevel {
    Debug, Info, Warning, Error
};

typedef std::function<void(LogLevel, const std::string&, const std::string&)> LogSink;

// Messages must never carry event content, contributor tokens or matched PHI text.
void logMessage(LogLevel level, const std::string& component, const std::string& message);

// replaces the default std::clog sink; an empty sink restores it
void setLogSink(LogSink sink);
void setLogLevel(LogLevel level);

std::string logLevelName(LogLevel level);

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_LOGGING_HPP
