#include "LoggerThread.h"
#include "concurrency/ThreadUtils.h"
#include "utils/Time.h"
#include <cstring>
#include <ctime>

namespace logger
{

const auto timeStringLength = 32;

LoggerThread::LoggerThread(const char* logFileName, bool logStdOut, bool logStdErr, size_t backlogSize)
    : _running(true),
      _logQueue(backlogSize),
      _logFile(logFileName && std::strlen(logFileName) > 0 ? fopen(logFileName, "a+") : nullptr),
      _logStdOut(logStdOut),
      _logStdErr(logStdErr),
      _droppedLogs(0),
      _thread(new std::thread([this] { this->run(); }))
{
}

LoggerThread::~LoggerThread()
{
    stop();
}

namespace
{

inline void formatTo(FILE* fh, const char* localTime, const char* level, const void* threadId, const char* message)
{
    fprintf(fh, "%s %s [%p]%s\n", localTime, level, threadId, message);
}

} // namespace

void LoggerThread::write(const LogItem& item)
{
    char localTime[timeStringLength];
    formatTime(item.timestamp, localTime);

    if (_logStdOut)
    {
        formatTo(stdout, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
    if (_logStdErr && !std::strcmp(item.logLevel, "ERROR"))
    {
        formatTo(stderr, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
    if (_logFile)
    {
        formatTo(_logFile, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
}

void LoggerThread::run()
{
    concurrency::setThreadName("Logger");

    for (;;)
    {
        bool gotLogItem = false;
        LogItem item;
        while (_logQueue.pop(item))
        {
            gotLogItem = true;
            write(item);
        }

        if (gotLogItem)
        {
            if (_logStdOut)
            {
                fflush(stdout);
            }
            if (_logStdErr)
            {
                fflush(stderr);
            }
            if (_logFile)
            {
                fflush(_logFile);
            }
        }

        if (!_running.load(std::memory_order_relaxed) && _logQueue.empty())
        {
            break;
        }
        _logQueue.waitForItems(50);
    }

    if (_logFile)
    {
        fclose(_logFile);
        _logFile = nullptr;
    }
}

/**
 * logLevel must be static eternal const string in memory.
 */
void LoggerThread::post(std::chrono::system_clock::time_point timestamp,
    const char* logLevel,
    const char* logGroup,
    void* threadId,
    const char* format,
    va_list args)
{
    va_list args2ndSprintf;
    va_copy(args2ndSprintf, args);

    const int maxMessageLength = 300;
    char smallMessage[maxMessageLength + 1];
    const int groupLength = snprintf(smallMessage, sizeof(smallMessage), "[%s] ", logGroup);
    const int messageLength = groupLength < 0
        ? -1
        : vsnprintf(smallMessage + groupLength, sizeof(smallMessage) - groupLength, format, args);
    if (messageLength < 0)
    {
        va_end(args2ndSprintf);
        return;
    }

    LogItem log;
    log.timestamp = timestamp;
    log.logLevel = logLevel;
    log.threadId = threadId;
    const int logLength = messageLength + groupLength;
    if (logLength <= maxMessageLength)
    {
        log.message.assign(smallMessage, logLength);
    }
    else
    {
        log.message.resize(logLength);
        snprintf(&log.message[0], logLength + 1, "[%s] ", logGroup);
        vsnprintf(&log.message[groupLength], logLength + 1 - groupLength, format, args2ndSprintf);
    }
    va_end(args2ndSprintf);

    if (!_logQueue.push(std::move(log)))
    {
        ++_droppedLogs;
    }
}

void LoggerThread::stop()
{
    _running = false;
    if (_thread && _thread->joinable())
    {
        _thread->join();
    }
}

void LoggerThread::formatTime(const std::chrono::system_clock::time_point timestamp, char* output)
{
    using namespace std::chrono;
    const std::time_t currentTime = system_clock::to_time_t(timestamp);
    tm currentLocalTime = {};
    localtime_r(&currentTime, &currentLocalTime);

    const auto ms = duration_cast<milliseconds>(timestamp.time_since_epoch()).count();

    snprintf(output,
        timeStringLength,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        currentLocalTime.tm_year + 1900,
        currentLocalTime.tm_mon + 1,
        currentLocalTime.tm_mday,
        currentLocalTime.tm_hour,
        currentLocalTime.tm_min,
        currentLocalTime.tm_sec,
        static_cast<int>(ms % 1000));
}

void LoggerThread::awaitLogDrained(uint64_t timeoutNs)
{
    const auto start = utils::Time::getRawAbsoluteTime();
    while (!_logQueue.empty() && _running.load() &&
        utils::Time::diffLT(start, utils::Time::getRawAbsoluteTime(), timeoutNs))
    {
        std::this_thread::yield();
    }
}

} // namespace logger
