#include "pairing/DataChannel.h"
#include <algorithm>

namespace pairing
{

void DataChannel::addListener(IEvents* listener)
{
    if (listener && std::find(_listeners.begin(), _listeners.end(), listener) == _listeners.end())
    {
        _listeners.push_back(listener);
    }
}

void DataChannel::removeListener(IEvents* listener)
{
    _listeners.erase(std::remove(_listeners.begin(), _listeners.end(), listener), _listeners.end());
}

// Listeners may unsubscribe from within a callback, so iterate over a snapshot.
void DataChannel::notifyOpen()
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onDataChannelOpen(this);
    }
}

void DataChannel::notifyClosed()
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onDataChannelClosed(this);
    }
}

void DataChannel::notifyError(const std::string& reason)
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onDataChannelError(this, reason);
    }
}

void DataChannel::notifyMessage(const uint8_t* data, size_t length)
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onDataChannelMessage(this, data, length);
    }
}

} // namespace pairing
