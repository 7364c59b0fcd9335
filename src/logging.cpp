#include "logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace
{
    constexpr std::string_view kTag = "[MCP]";

    std::atomic<int> g_minimumLevel{static_cast<int>(LogLevel::Info)};

    std::mutex& logMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    bool enabled(LogLevel level)
    {
        return static_cast<int>(level) >= g_minimumLevel.load(std::memory_order_relaxed);
    }

    std::string formatMessage(const char* format, va_list args)
    {
        va_list copy;
        va_copy(copy, args);
        int required = std::vsnprintf(nullptr, 0, format, copy);
        va_end(copy);

        if(required <= 0)
            return {};

        std::string buffer(static_cast<size_t>(required), '\0');
        std::vsnprintf(buffer.data(), buffer.size() + 1, format, args);
        return buffer;
    }

    void writeLog(LogLevel level, std::string_view message)
    {
        if(!enabled(level))
            return;

        const std::string_view levelName = LogLevelName(level);
        std::string composed;
        composed.reserve(levelName.size() + kTag.size() + message.size() + 5);
        composed.append("[").append(levelName).append("] ").append(kTag).append(" ").append(message).append("\n");

        // stdout carries the protocol; diagnostics stay on stderr
        std::lock_guard<std::mutex> guard(logMutex());
        std::fwrite(composed.data(), 1, composed.size(), stderr);
        std::fflush(stderr);
    }

    void logFormatted(LogLevel level, const char* format, va_list args)
    {
        if(!enabled(level))
            return;

        std::string message = formatMessage(format, args);
        writeLog(level, message);
    }
}

void SetLogLevel(LogLevel level)
{
    g_minimumLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return static_cast<LogLevel>(g_minimumLevel.load(std::memory_order_relaxed));
}

bool ParseLogLevel(std::string_view text, LogLevel& level)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if(lowered == "debug" || lowered == "trace")
        level = LogLevel::Debug;
    else if(lowered == "info" || lowered == "notice")
        level = LogLevel::Info;
    else if(lowered == "warning" || lowered == "warn")
        level = LogLevel::Warning;
    else if(lowered == "error" || lowered == "critical" || lowered == "alert" || lowered == "emergency")
        level = LogLevel::Error;
    else
        return false;

    return true;
}

const char* LogLevelName(LogLevel level)
{
    switch(level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

void LogDebug(std::string_view message)
{
    writeLog(LogLevel::Debug, message);
}

void LogInfo(std::string_view message)
{
    writeLog(LogLevel::Info, message);
}

void LogWarning(std::string_view message)
{
    writeLog(LogLevel::Warning, message);
}

void LogError(std::string_view message)
{
    writeLog(LogLevel::Error, message);
}

void LogDebugF(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    logFormatted(LogLevel::Debug, format, args);
    va_end(args);
}

void LogInfoF(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    logFormatted(LogLevel::Info, format, args);
    va_end(args);
}

void LogWarningF(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    logFormatted(LogLevel::Warning, format, args);
    va_end(args);
}

void LogErrorF(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    logFormatted(LogLevel::Error, format, args);
    va_end(args);
}
