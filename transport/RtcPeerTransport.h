#pragma once

#include "concurrency/SafeQueue.h"
#include "logger/Logger.h"
#include "pairing/PeerTransport.h"
#include <memory>
#include <rtc/rtc.hpp>
#include <string>
#include <vector>

namespace transport
{

class RtcDataChannel;

struct TransportEvent
{
    enum class Type
    {
        LOCAL_CANDIDATE,
        GATHERING_COMPLETE,
        INCOMING_CHANNEL,
        ICE_STATE,
        CONNECTION_STATE,
        CHANNEL_OPEN,
        CHANNEL_CLOSED,
        CHANNEL_ERROR,
        CHANNEL_MESSAGE
    };

    Type type = Type::GATHERING_COMPLETE;
    std::string text;
    std::vector<uint8_t> data;
    std::shared_ptr<RtcDataChannel> channel;
    pairing::IceState iceState = pairing::IceState::NEW;
    pairing::PeerConnectionState connectionState = pairing::PeerConnectionState::NEW;
};

using TransportEventQueue = concurrency::LockFullQueue<TransportEvent>;

class RtcDataChannel : public pairing::DataChannel, public std::enable_shared_from_this<RtcDataChannel>
{
public:
    RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel, std::weak_ptr<TransportEventQueue> events);
    ~RtcDataChannel();

    // Hooks library callbacks. They only queue events and never touch listeners.
    void attach();
    void dispatch(const TransportEvent& event);

    State getState() const override;
    bool send(const uint8_t* data, size_t length) override;
    bool send(const std::string& text) override;
    void close() override;

private:
    std::shared_ptr<rtc::DataChannel> _channel;
    std::weak_ptr<TransportEventQueue> _events;
};

/**
 * PeerTransport on libdatachannel. Library callbacks arrive on its own threads
 * and are queued. Call processEvents from the thread that owns the pairing
 * session to deliver them.
 */
class RtcPeerTransport : public pairing::PeerTransport
{
public:
    explicit RtcPeerTransport(size_t eventBacklog = 1024);
    ~RtcPeerTransport();

    bool generateCertificate() override;
    bool createSession(const std::vector<std::string>& iceServers, IEvents* eventSink) override;

    std::shared_ptr<pairing::DataChannel> createDataChannel(const std::string& label, bool ordered) override;

    std::string createOffer() override;
    std::string createAnswer() override;
    std::string getLocalDescription() const override;

    bool setLocalDescription(pairing::DescriptionType type, const std::string& sdp) override;
    bool setRemoteDescription(pairing::DescriptionType type, const std::string& sdp) override;
    bool rollbackLocalDescription() override;

    bool addRemoteCandidate(const std::string& candidateLine, const std::string& mid) override;

    void close() override;

    // Returns number of events delivered.
    size_t processEvents();
    bool waitForEvents(int timeoutMs);

private:
    logger::LoggableId _loggableId;
    rtc::Configuration _rtcConfig;
    std::shared_ptr<TransportEventQueue> _events;
    std::shared_ptr<rtc::PeerConnection> _peerConnection;
    IEvents* _eventSink;
};

} // namespace transport
