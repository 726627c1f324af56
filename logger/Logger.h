#pragma once

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <inttypes.h> // for logging int64 with PRId64
namespace logger
{
enum class Level
{
    ERROR,
    WARN,
    INFO,
    DBG
};

extern Level _logLevel;
void setup(const char* logToFile, bool logToStdOut, bool logToStdErr, Level level, size_t backlogSize = 4096);
void stop();
bool isActive();

void logv(const char* logLevel, const char* logGroup, const char* format, va_list args);
void flushLog();

__attribute__((format(printf, 1, 3))) inline void info(const char* format, const char* logGroup, ...)
{
    if (logger::_logLevel < Level::INFO)
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv("INFO", logGroup, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void warn(const char* format, const char* logGroup, ...)
{
    if (_logLevel < Level::WARN)
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv("WARN", logGroup, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void error(const char* format, const char* logGroup, ...)
{
    va_list arglist;
    va_start(arglist, logGroup);
    logv("ERROR", logGroup, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void debug(const char* format, const char* logGroup, ...)
{
    if (logger::_logLevel < Level::DBG)
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv("DEBUG", logGroup, format, arglist);
    va_end(arglist);
}

Level parseLevel(const char* levelName, Level fallback);

class LoggableId
{
    const static int maxLength = 64;
    char _value[maxLength];
    static std::atomic<size_t> _lastInstanceId;
    const size_t _instanceId;

public:
    explicit LoggableId(const char* instancePrefix) : _instanceId(++_lastInstanceId)
    {
        snprintf(_value, maxLength, "%s-%zu", instancePrefix, _instanceId);
    }

    inline const char* c_str() const { return _value; }
    inline size_t getInstanceId() const { return _instanceId; }
};

} // namespace logger
