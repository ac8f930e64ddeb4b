#pragma once

#include <cstdarg>
#include <string_view>

namespace otadump {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none" (case-insensitive).
bool ParseLogLevel(std::string_view name, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const { return lvl >= Level(); }

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::otadump::Logger::Instance().LogWithSource(::otadump::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::otadump::Logger::Instance().LogWithSource(::otadump::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::otadump::Logger::Instance().LogWithSource(::otadump::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::otadump::Logger::Instance().LogWithSource(::otadump::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace otadump
