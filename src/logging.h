#pragma once

#include <string>
#include <string_view>

enum class LogLevel
{
    Debug = 0,
    Info,
    Warning,
    Error
};

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool ParseLogLevel(std::string_view text, LogLevel& level);
const char* LogLevelName(LogLevel level);

void LogDebug(std::string_view message);
void LogInfo(std::string_view message);
void LogWarning(std::string_view message);
void LogError(std::string_view message);

void LogDebugF(const char* format, ...);
void LogInfoF(const char* format, ...);
void LogWarningF(const char* format, ...);
void LogErrorF(const char* format, ...);
