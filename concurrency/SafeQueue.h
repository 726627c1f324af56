#pragma once
#include "concurrency/EventSemaphore.h"
#include <mutex>
#include <queue>

namespace concurrency
{

// Bounded multi producer queue. push fails when full.
template <typename T>
class LockFullQueue
{
public:
    explicit LockFullQueue(size_t maxSize) : _maxSize(maxSize) {}

    bool pop(T& target)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue.empty())
        {
            return false;
        }
        target = std::move(_queue.front());
        _queue.pop();
        if (_queue.empty())
        {
            _hasItems.reset();
        }
        return true;
    }

    bool push(T&& obj)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_queue.size() >= _maxSize)
        {
            return false;
        }
        _queue.push(std::move(obj));
        _hasItems.post();
        return true;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queue.size();
    }

    size_t capacity() const { return _maxSize; }

    bool empty() const { return size() == 0; }

    bool waitForItems(int timeoutMs) { return _hasItems.await(timeoutMs); }

private:
    const size_t _maxSize;
    std::queue<T> _queue;
    mutable std::mutex _mutex;
    concurrency::EventSemaphore _hasItems;
};

} // namespace concurrency
