#include "transport/RtcPeerTransport.h"
#include "pairing/SdpScanner.h"
#include <variant>

namespace transport
{

namespace
{
pairing::IceState toIceState(rtc::PeerConnection::IceState state)
{
    switch (state)
    {
    case rtc::PeerConnection::IceState::New:
        return pairing::IceState::NEW;
    case rtc::PeerConnection::IceState::Checking:
        return pairing::IceState::CHECKING;
    case rtc::PeerConnection::IceState::Connected:
        return pairing::IceState::CONNECTED;
    case rtc::PeerConnection::IceState::Completed:
        return pairing::IceState::COMPLETED;
    case rtc::PeerConnection::IceState::Disconnected:
        return pairing::IceState::DISCONNECTED;
    case rtc::PeerConnection::IceState::Failed:
        return pairing::IceState::FAILED;
    case rtc::PeerConnection::IceState::Closed:
        return pairing::IceState::CLOSED;
    }
    return pairing::IceState::NEW;
}

pairing::PeerConnectionState toConnectionState(rtc::PeerConnection::State state)
{
    switch (state)
    {
    case rtc::PeerConnection::State::New:
        return pairing::PeerConnectionState::NEW;
    case rtc::PeerConnection::State::Connecting:
        return pairing::PeerConnectionState::CONNECTING;
    case rtc::PeerConnection::State::Connected:
        return pairing::PeerConnectionState::CONNECTED;
    case rtc::PeerConnection::State::Disconnected:
        return pairing::PeerConnectionState::DISCONNECTED;
    case rtc::PeerConnection::State::Failed:
        return pairing::PeerConnectionState::FAILED;
    case rtc::PeerConnection::State::Closed:
        return pairing::PeerConnectionState::CLOSED;
    }
    return pairing::PeerConnectionState::NEW;
}

rtc::Description::Type toRtcType(pairing::DescriptionType type)
{
    return type == pairing::DescriptionType::OFFER ? rtc::Description::Type::Offer : rtc::Description::Type::Answer;
}

void postTo(const std::weak_ptr<TransportEventQueue>& weakQueue, TransportEvent&& event)
{
    auto queue = weakQueue.lock();
    if (queue && !queue->push(std::move(event)))
    {
        logger::warn("transport event queue full, event dropped", "RtcPeerTransport");
    }
}
} // namespace

RtcDataChannel::RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel, std::weak_ptr<TransportEventQueue> events)
    : pairing::DataChannel(channel->label()),
      _channel(channel),
      _events(events)
{
}

RtcDataChannel::~RtcDataChannel()
{
    _channel->resetCallbacks();
}

void RtcDataChannel::attach()
{
    std::weak_ptr<RtcDataChannel> weakSelf = shared_from_this();
    auto events = _events;

    _channel->onOpen([weakSelf, events]() {
        TransportEvent event;
        event.type = TransportEvent::Type::CHANNEL_OPEN;
        event.channel = weakSelf.lock();
        if (event.channel)
        {
            postTo(events, std::move(event));
        }
    });

    _channel->onClosed([weakSelf, events]() {
        TransportEvent event;
        event.type = TransportEvent::Type::CHANNEL_CLOSED;
        event.channel = weakSelf.lock();
        if (event.channel)
        {
            postTo(events, std::move(event));
        }
    });

    _channel->onError([weakSelf, events](std::string error) {
        TransportEvent event;
        event.type = TransportEvent::Type::CHANNEL_ERROR;
        event.text = std::move(error);
        event.channel = weakSelf.lock();
        if (event.channel)
        {
            postTo(events, std::move(event));
        }
    });

    _channel->onMessage([weakSelf, events](rtc::message_variant message) {
        TransportEvent event;
        event.type = TransportEvent::Type::CHANNEL_MESSAGE;
        event.channel = weakSelf.lock();
        if (!event.channel)
        {
            return;
        }

        if (auto* binary = std::get_if<rtc::binary>(&message))
        {
            event.data.reserve(binary->size());
            for (auto b : *binary)
            {
                event.data.push_back(std::to_integer<uint8_t>(b));
            }
        }
        else if (auto* text = std::get_if<std::string>(&message))
        {
            event.data.assign(text->begin(), text->end());
        }
        postTo(events, std::move(event));
    });
}

void RtcDataChannel::dispatch(const TransportEvent& event)
{
    switch (event.type)
    {
    case TransportEvent::Type::CHANNEL_OPEN:
        notifyOpen();
        break;
    case TransportEvent::Type::CHANNEL_CLOSED:
        notifyClosed();
        break;
    case TransportEvent::Type::CHANNEL_ERROR:
        notifyError(event.text);
        break;
    case TransportEvent::Type::CHANNEL_MESSAGE:
        notifyMessage(event.data.data(), event.data.size());
        break;
    default:
        break;
    }
}

pairing::DataChannel::State RtcDataChannel::getState() const
{
    if (_channel->isOpen())
    {
        return State::OPEN;
    }
    return _channel->isClosed() ? State::CLOSED : State::CONNECTING;
}

bool RtcDataChannel::send(const uint8_t* data, const size_t length)
{
    try
    {
        return _channel->send(reinterpret_cast<const std::byte*>(data), length);
    }
    catch (const std::exception& e)
    {
        logger::warn("send on %s failed: %s", "RtcDataChannel", getLabel().c_str(), e.what());
        return false;
    }
}

bool RtcDataChannel::send(const std::string& text)
{
    try
    {
        return _channel->send(text);
    }
    catch (const std::exception& e)
    {
        logger::warn("send on %s failed: %s", "RtcDataChannel", getLabel().c_str(), e.what());
        return false;
    }
}

void RtcDataChannel::close()
{
    if (!_channel->isClosed())
    {
        _channel->close();
    }
}

RtcPeerTransport::RtcPeerTransport(const size_t eventBacklog)
    : _loggableId("RtcPeerTransport"),
      _events(std::make_shared<TransportEventQueue>(eventBacklog)),
      _eventSink(nullptr)
{
}

RtcPeerTransport::~RtcPeerTransport()
{
    close();
}

bool RtcPeerTransport::generateCertificate()
{
    // The library creates the certificate along with the peer connection.
    _rtcConfig.certificateType = rtc::CertificateType::Ecdsa;
    return true;
}

bool RtcPeerTransport::createSession(const std::vector<std::string>& iceServers, IEvents* eventSink)
{
    _rtcConfig.iceServers.clear();
    for (const auto& url : iceServers)
    {
        _rtcConfig.iceServers.emplace_back(url);
    }
    _rtcConfig.disableAutoNegotiation = true;

    try
    {
        _peerConnection = std::make_shared<rtc::PeerConnection>(_rtcConfig);
    }
    catch (const std::exception& e)
    {
        logger::error("failed to create peer connection: %s", _loggableId.c_str(), e.what());
        return false;
    }
    _eventSink = eventSink;

    std::weak_ptr<TransportEventQueue> events = _events;
    _peerConnection->onLocalCandidate([events](rtc::Candidate candidate) {
        TransportEvent event;
        event.type = TransportEvent::Type::LOCAL_CANDIDATE;
        event.text = candidate.candidate();
        postTo(events, std::move(event));
    });

    _peerConnection->onGatheringStateChange([events](rtc::PeerConnection::GatheringState state) {
        if (state == rtc::PeerConnection::GatheringState::Complete)
        {
            TransportEvent event;
            event.type = TransportEvent::Type::GATHERING_COMPLETE;
            postTo(events, std::move(event));
        }
    });

    _peerConnection->onIceStateChange([events](rtc::PeerConnection::IceState state) {
        TransportEvent event;
        event.type = TransportEvent::Type::ICE_STATE;
        event.iceState = toIceState(state);
        postTo(events, std::move(event));
    });

    _peerConnection->onStateChange([events](rtc::PeerConnection::State state) {
        TransportEvent event;
        event.type = TransportEvent::Type::CONNECTION_STATE;
        event.connectionState = toConnectionState(state);
        postTo(events, std::move(event));
    });

    _peerConnection->onDataChannel([events](std::shared_ptr<rtc::DataChannel> rtcChannel) {
        auto channel = std::make_shared<RtcDataChannel>(rtcChannel, events);
        channel->attach();

        TransportEvent event;
        event.type = TransportEvent::Type::INCOMING_CHANNEL;
        event.channel = channel;
        postTo(events, std::move(event));
    });

    return true;
}

std::shared_ptr<pairing::DataChannel> RtcPeerTransport::createDataChannel(const std::string& label, const bool ordered)
{
    if (!_peerConnection)
    {
        return nullptr;
    }

    try
    {
        rtc::DataChannelInit init;
        init.reliability.unordered = !ordered;
        auto channel = std::make_shared<RtcDataChannel>(_peerConnection->createDataChannel(label, init), _events);
        channel->attach();
        return channel;
    }
    catch (const std::exception& e)
    {
        logger::error("failed to create data channel %s: %s", _loggableId.c_str(), label.c_str(), e.what());
        return nullptr;
    }
}

std::string RtcPeerTransport::createOffer()
{
    if (!_peerConnection)
    {
        return "";
    }

    try
    {
        return std::string(_peerConnection->createOffer());
    }
    catch (const std::exception& e)
    {
        logger::error("createOffer failed: %s", _loggableId.c_str(), e.what());
        return "";
    }
}

std::string RtcPeerTransport::createAnswer()
{
    if (!_peerConnection)
    {
        return "";
    }

    try
    {
        return std::string(_peerConnection->createAnswer());
    }
    catch (const std::exception& e)
    {
        logger::error("createAnswer failed: %s", _loggableId.c_str(), e.what());
        return "";
    }
}

std::string RtcPeerTransport::getLocalDescription() const
{
    if (!_peerConnection)
    {
        return "";
    }

    auto description = _peerConnection->localDescription();
    return description ? std::string(*description) : std::string();
}

// The library always generates its own local description, so only the ICE
// credentials of the supplied text are applied.
bool RtcPeerTransport::setLocalDescription(const pairing::DescriptionType type, const std::string& sdp)
{
    if (!_peerConnection)
    {
        return false;
    }

    rtc::LocalDescriptionInit init;
    const auto credentials = pairing::SdpScanner::extractIceCredentials(sdp);
    if (credentials.isSet())
    {
        init.iceUfrag = credentials.get().ufrag;
        init.icePwd = credentials.get().pwd;
    }

    try
    {
        _peerConnection->setLocalDescription(toRtcType(type), init);
        return true;
    }
    catch (const std::exception& e)
    {
        logger::error("setLocalDescription %s failed: %s", _loggableId.c_str(), pairing::toString(type), e.what());
        return false;
    }
}

bool RtcPeerTransport::setRemoteDescription(const pairing::DescriptionType type, const std::string& sdp)
{
    if (!_peerConnection)
    {
        return false;
    }

    try
    {
        _peerConnection->setRemoteDescription(rtc::Description(sdp, toRtcType(type)));
        return true;
    }
    catch (const std::exception& e)
    {
        logger::error("setRemoteDescription %s failed: %s", _loggableId.c_str(), pairing::toString(type), e.what());
        return false;
    }
}

bool RtcPeerTransport::rollbackLocalDescription()
{
    if (!_peerConnection)
    {
        return false;
    }

    try
    {
        _peerConnection->setLocalDescription(rtc::Description::Type::Rollback);
        return true;
    }
    catch (const std::exception& e)
    {
        logger::error("rollback failed: %s", _loggableId.c_str(), e.what());
        return false;
    }
}

bool RtcPeerTransport::addRemoteCandidate(const std::string& candidateLine, const std::string& mid)
{
    if (!_peerConnection)
    {
        return false;
    }

    try
    {
        _peerConnection->addRemoteCandidate(rtc::Candidate(candidateLine, mid));
        return true;
    }
    catch (const std::exception& e)
    {
        logger::warn("addRemoteCandidate failed: %s", _loggableId.c_str(), e.what());
        return false;
    }
}

void RtcPeerTransport::close()
{
    _eventSink = nullptr;
    if (_peerConnection)
    {
        _peerConnection->close();
        _peerConnection.reset();
    }
}

bool RtcPeerTransport::waitForEvents(const int timeoutMs)
{
    return _events->waitForItems(timeoutMs);
}

size_t RtcPeerTransport::processEvents()
{
    size_t count = 0;
    TransportEvent event;
    while (_events->pop(event))
    {
        ++count;
        if (event.channel)
        {
            if (event.type == TransportEvent::Type::INCOMING_CHANNEL)
            {
                if (_eventSink)
                {
                    _eventSink->onIncomingDataChannel(this, event.channel);
                }
            }
            else
            {
                event.channel->dispatch(event);
            }
            event.channel.reset();
            continue;
        }

        if (!_eventSink)
        {
            continue;
        }

        switch (event.type)
        {
        case TransportEvent::Type::LOCAL_CANDIDATE:
            _eventSink->onLocalCandidate(this, event.text);
            break;
        case TransportEvent::Type::GATHERING_COMPLETE:
            _eventSink->onGatheringComplete(this);
            break;
        case TransportEvent::Type::ICE_STATE:
            _eventSink->onIceStateChanged(this, event.iceState);
            break;
        case TransportEvent::Type::CONNECTION_STATE:
            _eventSink->onConnectionStateChanged(this, event.connectionState);
            break;
        default:
            break;
        }
    }
    return count;
}

} // namespace transport
