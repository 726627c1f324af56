#pragma once
#include "concurrency/SafeQueue.h"
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

namespace logger
{

class LoggerThread
{
    struct LogItem
    {
        std::chrono::system_clock::time_point timestamp;
        const char* logLevel = nullptr;
        void* threadId = nullptr;
        std::string message;
    };

public:
    LoggerThread(const char* logFileName, bool logStdOut, bool logStdErr, size_t backlogSize);
    ~LoggerThread();

    void post(std::chrono::system_clock::time_point timestamp,
        const char* logLevel,
        const char* logGroup,
        void* threadId,
        const char* format,
        va_list args);

    void stop();

    void awaitLogDrained(uint64_t timeoutNs);

    static void formatTime(const std::chrono::system_clock::time_point timestamp, char* output);

    uint32_t getDroppedLogCount() const { return _droppedLogs; }

private:
    void run();
    void write(const LogItem& item);

    std::atomic_bool _running;
    concurrency::LockFullQueue<LogItem> _logQueue;
    FILE* _logFile;
    const bool _logStdOut;
    const bool _logStdErr;
    std::atomic_uint32_t _droppedLogs;
    std::unique_ptr<std::thread> _thread; // must be last
};
} // namespace logger
