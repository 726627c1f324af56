#include "utils/Time.h"
#include <algorithm>
#include <ctime>
#include <limits>

namespace utils
{

namespace Time
{
// global time source
utils::TimeSource* _timeSource = nullptr;

class TimeSourceImpl final : public utils::TimeSource
{
public:
    uint64_t getAbsoluteTime() const override { return rawAbsoluteTime(); }

    void nanoSleep(uint64_t ns) override { rawNanoSleep(static_cast<int64_t>(ns)); }
    void advance(uint64_t ns) override { rawNanoSleep(static_cast<int64_t>(ns)); }

    std::chrono::system_clock::time_point wallClock() const override { return std::chrono::system_clock::now(); }
};
TimeSourceImpl _defaultTimeSource;

void initialize()
{
    initialize(_defaultTimeSource);
}

void initialize(TimeSource& timeSource)
{
    _timeSource = &timeSource;
}

namespace
{
utils::TimeSource& activeSource()
{
    return _timeSource ? *_timeSource : _defaultTimeSource;
}
} // namespace

uint64_t getAbsoluteTime()
{
    return activeSource().getAbsoluteTime();
}

uint64_t getRawAbsoluteTime()
{
    return _defaultTimeSource.getAbsoluteTime();
}

std::chrono::system_clock::time_point now()
{
    return activeSource().wallClock();
}

void nanoSleep(uint64_t ns)
{
    activeSource().nanoSleep(ns);
}

// OS sleep bypass TimeSource
void rawNanoSleep(int64_t ns)
{
    ns = (ns > 0 ? ns : 0);
    ns = std::min(ns, static_cast<int64_t>(std::numeric_limits<int32_t>::max()) * int64_t(1000'000'000));
    const timespec sleepTime = {static_cast<long>(ns / 1000'000'000UL), static_cast<long>(ns % 1000'000'000UL)};
    ::nanosleep(&sleepTime, nullptr);
}

uint64_t rawAbsoluteTime()
{
    timespec timeSpec = {};
    clock_gettime(CLOCK_MONOTONIC, &timeSpec);
    return static_cast<uint64_t>(timeSpec.tv_sec) * 1000000000ULL + static_cast<uint64_t>(timeSpec.tv_nsec);
}

} // namespace Time

} // namespace utils
