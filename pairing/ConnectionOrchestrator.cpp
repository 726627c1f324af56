#include "pairing/ConnectionOrchestrator.h"
#include "pairing/CredentialDeriver.h"
#include "pairing/PacketCodec.h"
#include "pairing/SdpReconstructor.h"
#include "pairing/SdpScanner.h"
#include "utils/Format.h"
#include "utils/Time.h"
#include <algorithm>

namespace pairing
{

namespace
{
const char* REMOTE_MID = "0";
const char* BOOTSTRAP_CHANNEL_LABEL = "init";

size_t maxCandidates(const config::Config& config)
{
    return config.pairing.maxCandidates == 0 ? DEFAULT_MAX_CANDIDATES : config.pairing.maxCandidates.get();
}

uint64_t sessionTimeoutNs(const config::Config& config)
{
    const uint32_t timeoutMs = config.pairing.timeout == 0 ? DEFAULT_TIMEOUT_MS : config.pairing.timeout.get();
    return timeoutMs * utils::Time::ms;
}

uint64_t gatherTimeoutNs(const config::Config& config)
{
    const uint32_t timeoutMs =
        config.pairing.gatherTimeout == 0 ? DEFAULT_GATHER_TIMEOUT_MS : config.pairing.gatherTimeout.get();
    return timeoutMs * utils::Time::ms;
}

const std::string& channelLabel(const config::Config& config)
{
    static const std::string defaultLabel = "qwbp";
    return config.pairing.channelLabel.get().empty() ? defaultLabel : config.pairing.channelLabel.get();
}

bool isExpired(const utils::Optional<uint64_t>& deadline, const uint64_t timestamp)
{
    return deadline.isSet() && utils::Time::diffGE(deadline.get(), timestamp, 0);
}
} // namespace

ConnectionOrchestrator::ConnectionOrchestrator(const config::Config& config, std::unique_ptr<PeerTransport> transport)
    : _loggableId("ConnectionOrchestrator"),
      _config(config),
      _transport(std::move(transport)),
      _sessionCreated(false),
      _state(SessionState::IDLE),
      _observedCandidateCount(0)
{
}

ConnectionOrchestrator::~ConnectionOrchestrator()
{
    _listeners.clear();
    close();
}

void ConnectionOrchestrator::addEventListener(IEvents* listener)
{
    if (!listener || std::find(_listeners.begin(), _listeners.end(), listener) != _listeners.end())
    {
        return;
    }
    _listeners.push_back(listener);

    if (_state == SessionState::CONNECTED && _dataChannel && _dataChannel->isOpen())
    {
        listener->onDataChannelReady(this, _dataChannel);
    }
}

void ConnectionOrchestrator::removeEventListener(IEvents* listener)
{
    _listeners.erase(std::remove(_listeners.begin(), _listeners.end(), listener), _listeners.end());
}

bool ConnectionOrchestrator::initialize()
{
    if (_state != SessionState::IDLE)
    {
        throw ConnectionError(utils::format("Cannot initialize in state: %s", toString(_state)), _state);
    }
    if (!_transport)
    {
        throw ConnectionError("No peer transport", _state);
    }

    setState(SessionState::GATHERING);
    _gatherDeadline.set(utils::Time::getAbsoluteTime() + gatherTimeoutNs(_config));

    if (!_transport->generateCertificate())
    {
        fail(ConnectionError("Certificate generation failed", _state));
        return false;
    }

    if (!_transport->createSession(_config.pairing.iceServers, this))
    {
        fail(ConnectionError("Failed to create peer connection", _state));
        return false;
    }
    _sessionCreated = true;

    // Offers without a media section carry no ICE attributes, so a channel is
    // opened first only to get one.
    _bootstrapChannel = _transport->createDataChannel(BOOTSTRAP_CHANNEL_LABEL, true);
    if (!_bootstrapChannel)
    {
        fail(ConnectionError("Failed to create data channel", _state));
        return false;
    }

    const auto offer = _transport->createOffer();
    if (offer.empty())
    {
        fail(ConnectionError("Failed to create offer", _state));
        return false;
    }

    std::string localOffer;
    try
    {
        const auto fingerprint = SdpScanner::extractFingerprint(offer);
        _localCredentials = CredentialDeriver::deriveCredentials(fingerprint);
        _localFingerprint.set(fingerprint);
        localOffer = SdpScanner::replaceIceCredentials(offer, _localCredentials);
    }
    catch (const PairingError& e)
    {
        fail(ConnectionError(std::string(e.getMessage()), _state));
        return false;
    }

    logger::debug("local fingerprint %s, ufrag %s",
        _loggableId.c_str(),
        CredentialDeriver::formatFingerprint(_localFingerprint.get()).c_str(),
        _localCredentials.ufrag.c_str());

    if (!_transport->setLocalDescription(DescriptionType::OFFER, localOffer))
    {
        fail(ConnectionError("Failed to set local description", _state));
        return false;
    }

    return !isTerminal(_state);
}

std::vector<uint8_t> ConnectionOrchestrator::getPayload() const
{
    if (_state != SessionState::DISPLAYING && _state != SessionState::SCANNED_ONE)
    {
        throw ConnectionError(utils::format("Cannot get payload in state: %s", toString(_state)), _state);
    }

    return PacketCodec::encode(_localFingerprint.get(), _localCandidates);
}

bool ConnectionOrchestrator::processScannedPayload(const uint8_t* data, const size_t length)
{
    if (_state != SessionState::DISPLAYING && _state != SessionState::SCANNED_ONE)
    {
        throw ConnectionError(utils::format("Cannot process payload in state: %s", toString(_state)), _state);
    }
    if (_peer.isSet())
    {
        throw ConnectionError("Peer already scanned", _state);
    }
    if (!data || !PacketCodec::isValidPacket(data, length))
    {
        throw ConnectionError("Invalid QWBP packet", _state);
    }

    const auto packet = PacketCodec::decode(data, length);
    if (CredentialDeriver::compareFingerprints(_localFingerprint.get(), packet.fingerprint) == 0)
    {
        logger::warn("scanned own payload", _loggableId.c_str());
        throw SelfConnectionError(_state);
    }

    PeerInfo peer;
    peer.fingerprint = packet.fingerprint;
    peer.candidates = packet.candidates;
    peer.credentials = CredentialDeriver::deriveCredentials(packet.fingerprint);
    _peer.set(std::move(peer));

    logger::info("peer %s scanned, %zu candidates",
        _loggableId.c_str(),
        CredentialDeriver::generateSessionId(packet.fingerprint).c_str(),
        packet.candidates.size());

    if (_state == SessionState::DISPLAYING)
    {
        setState(SessionState::SCANNED_ONE);
    }

    return negotiate();
}

utils::Optional<std::string> ConnectionOrchestrator::getShortAuthString() const
{
    if (!_localFingerprint.isSet() || !_peer.isSet())
    {
        return utils::Optional<std::string>();
    }
    return utils::Optional<std::string>(
        CredentialDeriver::generateSas(_localFingerprint.get(), _peer.get().fingerprint));
}

void ConnectionOrchestrator::close()
{
    _gatherDeadline.clear();
    _sessionDeadline.clear();

    if (_dataChannel)
    {
        _dataChannel->removeListener(this);
        _dataChannel->close();
        _dataChannel.reset();
    }
    discardBootstrapChannel();

    if (_sessionCreated)
    {
        _sessionCreated = false;
        _transport->close();
    }

    _localCredentials = IceCredentials();
    if (_state != SessionState::CLOSED)
    {
        setState(SessionState::CLOSED);
    }
}

int64_t ConnectionOrchestrator::nextTimeout(const uint64_t timestamp) const
{
    int64_t timeout = -1;
    for (const auto* deadline : {&_gatherDeadline, &_sessionDeadline})
    {
        if (!deadline->isSet())
        {
            continue;
        }
        const int64_t remaining = std::max(int64_t(0), utils::Time::diff(timestamp, deadline->get()));
        timeout = (timeout < 0 ? remaining : std::min(timeout, remaining));
    }
    return timeout;
}

void ConnectionOrchestrator::processTimeout(const uint64_t timestamp)
{
    if (isExpired(_gatherDeadline, timestamp))
    {
        _gatherDeadline.clear();
        if (_state == SessionState::GATHERING)
        {
            if (_observedCandidateCount > 0)
            {
                logger::info("gathering incomplete after timeout, using %zu candidates",
                    _loggableId.c_str(),
                    _observedCandidateCount);
                finishGathering(timestamp);
            }
            else
            {
                fail(ConnectionError("ICE gathering timeout - no candidates found", _state));
            }
        }
    }

    if (isExpired(_sessionDeadline, timestamp))
    {
        _sessionDeadline.clear();
        if (!isTerminal(_state) && _state != SessionState::CONNECTED)
        {
            fail(TimeoutError(_state));
            close();
        }
    }
}

void ConnectionOrchestrator::onLocalCandidate(PeerTransport* transport, const std::string& candidateLine)
{
    if (_state != SessionState::GATHERING)
    {
        return;
    }

    ++_observedCandidateCount;
    Candidate candidate;
    if (SdpScanner::parseCandidateLine(candidateLine, candidate))
    {
        _observedCandidates.push_back(candidate);
    }
    logger::debug("local %s", _loggableId.c_str(), candidateLine.c_str());
}

void ConnectionOrchestrator::onGatheringComplete(PeerTransport* transport)
{
    if (_state != SessionState::GATHERING || !_localFingerprint.isSet())
    {
        return;
    }
    finishGathering(utils::Time::getAbsoluteTime());
}

void ConnectionOrchestrator::onIncomingDataChannel(PeerTransport* transport, std::shared_ptr<DataChannel> channel)
{
    if (!channel)
    {
        return;
    }

    if (_state != SessionState::CONNECTING || !_role.isSet() || _role.get() != Role::ANSWERER || _dataChannel ||
        channel->getLabel() != channelLabel(_config))
    {
        logger::debug("ignoring data channel %s", _loggableId.c_str(), channel->getLabel().c_str());
        channel->close();
        return;
    }

    attachDataChannel(channel);
}

void ConnectionOrchestrator::onIceStateChanged(PeerTransport* transport, const IceState state)
{
    logger::debug("ice state %s", _loggableId.c_str(), toString(state));
    if (_state != SessionState::CONNECTING && _state != SessionState::CONNECTED)
    {
        return;
    }

    if (state == IceState::FAILED || state == IceState::DISCONNECTED)
    {
        fail(IceError(toString(state), _state));
    }
}

void ConnectionOrchestrator::onConnectionStateChanged(PeerTransport* transport, const PeerConnectionState state)
{
    logger::debug("connection state %s", _loggableId.c_str(), toString(state));
    if (_state != SessionState::CONNECTING && _state != SessionState::CONNECTED)
    {
        return;
    }

    if (state == PeerConnectionState::FAILED)
    {
        fail(ConnectionError("Connection failed", _state));
    }
}

void ConnectionOrchestrator::onDataChannelOpen(DataChannel* channel)
{
    if (!_dataChannel || channel != _dataChannel.get() || _state != SessionState::CONNECTING)
    {
        return;
    }

    _sessionDeadline.clear();
    logger::info("data channel %s open", _loggableId.c_str(), channel->getLabel().c_str());
    setState(SessionState::CONNECTED);
    if (_state == SessionState::CONNECTED)
    {
        notifyReady();
    }
}

void ConnectionOrchestrator::onDataChannelClosed(DataChannel* channel)
{
    if (!_dataChannel || channel != _dataChannel.get())
    {
        return;
    }

    if (_state == SessionState::CONNECTED)
    {
        logger::info("data channel closed", _loggableId.c_str());
        close();
    }
}

void ConnectionOrchestrator::onDataChannelError(DataChannel* channel, const std::string& reason)
{
    if (!_dataChannel || channel != _dataChannel.get() || isTerminal(_state))
    {
        return;
    }

    fail(ConnectionError("DataChannel error: " + reason, _state));
}

void ConnectionOrchestrator::onDataChannelMessage(DataChannel* channel, const uint8_t* data, const size_t length) {}

void ConnectionOrchestrator::setState(const SessionState state)
{
    if (state == _state)
    {
        return;
    }

    logger::info("%s -> %s", _loggableId.c_str(), toString(_state), toString(state));
    _state = state;

    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onStateChanged(this, state);
    }
}

void ConnectionOrchestrator::fail(const ConnectionError& error)
{
    if (isTerminal(_state))
    {
        return;
    }

    logger::error("%s", _loggableId.c_str(), error.what());
    _gatherDeadline.clear();
    setState(SessionState::FAILED);

    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onError(this, error);
    }
}

void ConnectionOrchestrator::finishGathering(const uint64_t timestamp)
{
    _gatherDeadline.clear();

    auto gathered = SdpScanner::extractCandidates(_transport->getLocalDescription());
    for (const auto& candidate : _observedCandidates)
    {
        if (std::find(gathered.begin(), gathered.end(), candidate) == gathered.end())
        {
            gathered.push_back(candidate);
        }
    }

    _localCandidates = PacketCodec::selectCandidates(gathered, maxCandidates(_config));
    logger::info("gathered %zu candidates, %zu in payload",
        _loggableId.c_str(),
        gathered.size(),
        _localCandidates.size());
    for (const auto& candidate : _localCandidates)
    {
        logger::debug("payload candidate %s %s %s:%u",
            _loggableId.c_str(),
            toString(candidate.type),
            toString(candidate.protocol),
            candidate.ip.c_str(),
            candidate.port);
    }

    _sessionDeadline.set(timestamp + sessionTimeoutNs(_config));
    setState(SessionState::DISPLAYING);
}

bool ConnectionOrchestrator::negotiate()
{
    if (_state != SessionState::SCANNED_ONE)
    {
        return false;
    }

    const int order = CredentialDeriver::compareFingerprints(_localFingerprint.get(), _peer.get().fingerprint);
    _role.set(order > 0 ? Role::OFFERER : Role::ANSWERER);
    logger::info("acting as %s", _loggableId.c_str(), toString(_role.get()));

    setState(SessionState::CONNECTING);
    if (_state != SessionState::CONNECTING)
    {
        return false;
    }

    discardBootstrapChannel();
    const bool negotiated = (_role.get() == Role::OFFERER ? negotiateAsOfferer() : negotiateAsAnswerer());
    return negotiated && !isTerminal(_state);
}

bool ConnectionOrchestrator::negotiateAsOfferer()
{
    auto channel = _transport->createDataChannel(channelLabel(_config), true);
    if (!channel)
    {
        fail(ConnectionError("Failed to create data channel", _state));
        return false;
    }
    attachDataChannel(channel);

    const auto& peer = _peer.get();
    const auto remoteAnswer = SdpReconstructor::reconstructSessionDescription(peer.fingerprint, false, peer.credentials);
    if (!_transport->setRemoteDescription(DescriptionType::ANSWER, remoteAnswer))
    {
        fail(ConnectionError("Failed to set remote answer", _state));
        return false;
    }

    injectRemoteCandidates();
    return true;
}

bool ConnectionOrchestrator::negotiateAsAnswerer()
{
    if (!_transport->rollbackLocalDescription())
    {
        fail(ConnectionError("Failed to roll back local offer", _state));
        return false;
    }

    const auto& peer = _peer.get();
    const auto remoteOffer = SdpReconstructor::reconstructSessionDescription(peer.fingerprint, true, peer.credentials);
    if (!_transport->setRemoteDescription(DescriptionType::OFFER, remoteOffer))
    {
        fail(ConnectionError("Failed to set remote offer", _state));
        return false;
    }

    injectRemoteCandidates();

    const auto answer = _transport->createAnswer();
    if (answer.empty())
    {
        fail(ConnectionError("Failed to create answer", _state));
        return false;
    }

    const auto localAnswer = SdpScanner::replaceIceCredentials(answer, _localCredentials);
    if (!_transport->setLocalDescription(DescriptionType::ANSWER, localAnswer))
    {
        fail(ConnectionError("Failed to set local answer", _state));
        return false;
    }
    return true;
}

void ConnectionOrchestrator::injectRemoteCandidates()
{
    for (const auto& candidate : _peer.get().candidates)
    {
        const auto line = SdpReconstructor::buildCandidateLine(candidate);
        if (!_transport->addRemoteCandidate(line, REMOTE_MID))
        {
            logger::warn("failed to add remote candidate %s", _loggableId.c_str(), line.c_str());
        }
    }
}

void ConnectionOrchestrator::attachDataChannel(std::shared_ptr<DataChannel> channel)
{
    _dataChannel = channel;
    _dataChannel->addListener(this);

    // Incoming channels may already be open when handed over.
    if (_dataChannel->isOpen())
    {
        onDataChannelOpen(_dataChannel.get());
    }
}

void ConnectionOrchestrator::discardBootstrapChannel()
{
    if (_bootstrapChannel)
    {
        _bootstrapChannel->close();
        _bootstrapChannel.reset();
    }
}

void ConnectionOrchestrator::notifyReady()
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        listener->onDataChannelReady(this, _dataChannel);
    }
}

} // namespace pairing
