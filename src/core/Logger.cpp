#include "core/Logger.h"

namespace ntm {

std::function<void(const std::string&, LogLevel)> Logger::s_Callback;

void Logger::Log(const std::string& message) {
    if (s_Callback) s_Callback(message, LogLevel::Info);
}
void Logger::LogWarning(const std::string& message) {
    if (s_Callback) s_Callback(message, LogLevel::Warning);
}
void Logger::LogError(const std::string& message) {
    if (s_Callback) s_Callback(message, LogLevel::Error);
}

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

} // namespace ntm
