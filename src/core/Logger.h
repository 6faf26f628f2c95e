// Logger.h
#pragma once
#include <string>
#include <functional>

namespace ntm {

enum class LogLevel {
    Info,
    Warning,
    Error
};

class Logger {
public:
    static void Log(const std::string& message);
    static void LogWarning(const std::string& message);
    static void LogError(const std::string& message);

    // Messages are dropped while no callback is installed.
    static void SetCallback(std::function<void(const std::string&, LogLevel)> cb) { s_Callback = cb; }
    static void ClearCallback() { s_Callback = nullptr; }

private:
    static std::function<void(const std::string&, LogLevel)> s_Callback;
};

const char* ToString(LogLevel level);

} // namespace ntm
