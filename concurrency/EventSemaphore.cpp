#include "concurrency/EventSemaphore.h"
#include <chrono>

using namespace std::chrono_literals;

namespace concurrency
{

void EventSemaphore::post()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _flag = true;
    _condition.notify_all();
}

bool EventSemaphore::await(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _condition.wait_for(lock, timeoutMs * 1ms, [this]() { return _flag; });
}

void EventSemaphore::reset()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _flag = false;
}

} // namespace concurrency
