#pragma once
#include <chrono>
#include <cstdint>

namespace utils
{

// Override this and provide implementation in initialize.
// Tests install a virtual clock to drive session timers deterministically.
class TimeSource
{
public:
    virtual ~TimeSource() = default;

    virtual uint64_t getAbsoluteTime() const = 0;
    virtual void nanoSleep(uint64_t nanoSeconds) = 0;
    virtual std::chrono::system_clock::time_point wallClock() const = 0;
    virtual void advance(uint64_t nanoSeconds) = 0;
};

namespace Time
{

void initialize();
void initialize(TimeSource& timeSource);

/**
 * Returns absolute time since some machine specific point in time in nanoseconds.
 */
uint64_t getAbsoluteTime();
uint64_t getRawAbsoluteTime();
void nanoSleep(uint64_t ns);

std::chrono::system_clock::time_point now();

void rawNanoSleep(int64_t ns);
uint64_t rawAbsoluteTime();

constexpr uint64_t us = 1000;
constexpr uint64_t ms = 1000 * us;
constexpr uint64_t sec = ms * 1000;
constexpr uint64_t minute = sec * 60;

constexpr int64_t diff(const uint64_t a, const uint64_t b)
{
    return static_cast<int64_t>(b - a);
}

constexpr bool diffLT(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) < static_cast<int64_t>(value);
}

constexpr bool diffLE(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) <= static_cast<int64_t>(value);
}

constexpr bool diffGT(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) > static_cast<int64_t>(value);
}

constexpr bool diffGE(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) >= static_cast<int64_t>(value);
}
} // namespace Time

} // namespace utils
