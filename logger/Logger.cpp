#include "Logger.h"
#include "LoggerThread.h"
#include "utils/Time.h"
#include <cstring>
#include <memory>
#include <pthread.h>
#include <strings.h>

namespace logger
{

Level _logLevel = Level::INFO;
std::atomic<size_t> LoggableId::_lastInstanceId;

std::unique_ptr<LoggerThread> _logThread;

void setup(const char* logFileName, bool logToStdOut, bool logToStdErr, Level level, size_t backlogSize)
{
    stop();
    _logLevel = level;
    _logThread.reset(new LoggerThread(logFileName, logToStdOut, logToStdErr, backlogSize));
}

void stop()
{
    if (_logThread)
    {
        _logThread->stop();
        _logThread.reset();
    }
}

bool isActive()
{
    return _logThread != nullptr;
}

void logv(const char* logLevel, const char* logGroup, const char* format, va_list args)
{
    if (_logThread)
    {
        auto timestamp = utils::Time::now();
        auto threadId = (void*)pthread_self();
        _logThread->post(timestamp, logLevel, logGroup, threadId, format, args);
    }
}

void flushLog()
{
    if (!_logThread)
    {
        return;
    }
    _logThread->awaitLogDrained(utils::Time::ms * 500);
}

Level parseLevel(const char* levelName, const Level fallback)
{
    if (!levelName)
    {
        return fallback;
    }
    if (strcasecmp(levelName, "DEBUG") == 0 || strcasecmp(levelName, "DBG") == 0)
    {
        return Level::DBG;
    }
    if (strcasecmp(levelName, "INFO") == 0)
    {
        return Level::INFO;
    }
    if (strcasecmp(levelName, "WARN") == 0)
    {
        return Level::WARN;
    }
    if (strcasecmp(levelName, "ERROR") == 0)
    {
        return Level::ERROR;
    }
    return fallback;
}

} // namespace logger
