#pragma once

#include "config/Config.h"
#include "logger/Logger.h"
#include "pairing/Candidate.h"
#include "pairing/DataChannel.h"
#include "pairing/PairingErrors.h"
#include "pairing/PairingTypes.h"
#include "pairing/PeerTransport.h"
#include "utils/Optional.h"
#include <memory>
#include <string>
#include <vector>

namespace pairing
{

struct PeerInfo
{
    Fingerprint fingerprint = {};
    std::vector<Candidate> candidates;
    IceCredentials credentials;
};

// Drives one peer transport from certificate generation to an open data channel
// using two scanned pairing payloads.
// You drive the session by calling the public operations and processTimeout.
// Transport events must be delivered on the same thread.
// It is not thread safe.
class ConnectionOrchestrator : public PeerTransport::IEvents, public DataChannel::IEvents
{
public:
    class IEvents
    {
    public:
        virtual void onStateChanged(ConnectionOrchestrator* session, SessionState state) = 0;
        virtual void onDataChannelReady(ConnectionOrchestrator* session, std::shared_ptr<DataChannel> channel) = 0;
        virtual void onError(ConnectionOrchestrator* session, const ConnectionError& error) = 0;
    };

    ConnectionOrchestrator(const config::Config& config, std::unique_ptr<PeerTransport> transport);
    ConnectionOrchestrator(const ConnectionOrchestrator&) = delete;
    ~ConnectionOrchestrator();

    // A listener added after the channel opened is told about it immediately.
    void addEventListener(IEvents* listener);
    void removeEventListener(IEvents* listener);

    /**
     * Idle -> Gathering. Creates the transport session, commits a local offer with
     * credentials derived from the certificate fingerprint and starts the
     * bounded gathering wait. Throws ConnectionError if not Idle. Returns false
     * if the transport failed, in which case the session is Failed.
     */
    bool initialize();

    // Throws ConnectionError unless Displaying or ScannedOne.
    std::vector<uint8_t> getPayload() const;

    /**
     * Records the peer scanned from its payload and starts negotiation. Throws
     * ConnectionError for wrong state, a second scan or a malformed packet,
     * DecodeError for a corrupt candidate list and SelfConnectionError if the
     * payload is our own. Returns false if negotiation failed on the transport.
     */
    bool processScannedPayload(const uint8_t* data, size_t length);
    bool processScannedPayload(const std::vector<uint8_t>& data)
    {
        return processScannedPayload(data.data(), data.size());
    }

    std::shared_ptr<DataChannel> getDataChannel() const { return _dataChannel; }
    utils::Optional<std::string> getShortAuthString() const;

    // Safe from any state and repeatable.
    void close();

    // Nanoseconds until processTimeout should be called, -1 if no timer is armed.
    int64_t nextTimeout(uint64_t timestamp) const;
    void processTimeout(uint64_t timestamp);

    SessionState getState() const { return _state; }
    utils::Optional<Role> getRole() const { return _role; }
    const utils::Optional<Fingerprint>& getLocalFingerprint() const { return _localFingerprint; }
    const std::vector<Candidate>& getLocalCandidates() const { return _localCandidates; }
    const char* getLoggableId() const { return _loggableId.c_str(); }

    // PeerTransport::IEvents
    void onLocalCandidate(PeerTransport* transport, const std::string& candidateLine) override;
    void onGatheringComplete(PeerTransport* transport) override;
    void onIncomingDataChannel(PeerTransport* transport, std::shared_ptr<DataChannel> channel) override;
    void onIceStateChanged(PeerTransport* transport, IceState state) override;
    void onConnectionStateChanged(PeerTransport* transport, PeerConnectionState state) override;

    // DataChannel::IEvents
    void onDataChannelOpen(DataChannel* channel) override;
    void onDataChannelClosed(DataChannel* channel) override;
    void onDataChannelError(DataChannel* channel, const std::string& reason) override;
    void onDataChannelMessage(DataChannel* channel, const uint8_t* data, size_t length) override;

private:
    void setState(SessionState state);
    void fail(const ConnectionError& error);
    void finishGathering(uint64_t timestamp);
    bool negotiate();
    bool negotiateAsOfferer();
    bool negotiateAsAnswerer();
    void injectRemoteCandidates();
    void attachDataChannel(std::shared_ptr<DataChannel> channel);
    void discardBootstrapChannel();
    void notifyReady();

    logger::LoggableId _loggableId;
    const config::Config& _config;
    std::unique_ptr<PeerTransport> _transport;
    bool _sessionCreated;

    SessionState _state;
    utils::Optional<Role> _role;
    utils::Optional<Fingerprint> _localFingerprint;
    IceCredentials _localCredentials;
    std::vector<Candidate> _localCandidates;
    std::vector<Candidate> _observedCandidates;
    size_t _observedCandidateCount;
    utils::Optional<PeerInfo> _peer;

    std::shared_ptr<DataChannel> _bootstrapChannel;
    std::shared_ptr<DataChannel> _dataChannel;

    utils::Optional<uint64_t> _gatherDeadline;
    utils::Optional<uint64_t> _sessionDeadline;

    std::vector<IEvents*> _listeners;
};

} // namespace pairing
