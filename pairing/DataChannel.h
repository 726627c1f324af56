#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pairing
{

// Ordered bidirectional message channel handed out by a PeerTransport.
// Events are delivered on the thread that drives the owning transport.
class DataChannel
{
public:
    class IEvents
    {
    public:
        virtual void onDataChannelOpen(DataChannel* channel) = 0;
        virtual void onDataChannelClosed(DataChannel* channel) = 0;
        virtual void onDataChannelError(DataChannel* channel, const std::string& reason) = 0;
        virtual void onDataChannelMessage(DataChannel* channel, const uint8_t* data, size_t length) = 0;
    };

    enum class State
    {
        CONNECTING,
        OPEN,
        CLOSED
    };

    explicit DataChannel(const std::string& label) : _label(label) {}
    DataChannel(const DataChannel&) = delete;
    virtual ~DataChannel() = default;

    const std::string& getLabel() const { return _label; }
    bool isOpen() const { return getState() == State::OPEN; }

    virtual State getState() const = 0;
    virtual bool send(const uint8_t* data, size_t length) = 0;
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;

    void addListener(IEvents* listener);
    void removeListener(IEvents* listener);

protected:
    void notifyOpen();
    void notifyClosed();
    void notifyError(const std::string& reason);
    void notifyMessage(const uint8_t* data, size_t length);

private:
    const std::string _label;
    std::vector<IEvents*> _listeners;
};

} // namespace pairing
