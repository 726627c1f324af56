#pragma once

#include "pairing/DataChannel.h"
#include <memory>
#include <string>
#include <vector>

namespace pairing
{

enum class DescriptionType
{
    OFFER,
    ANSWER
};

enum class IceState
{
    NEW,
    CHECKING,
    CONNECTED,
    COMPLETED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

enum class PeerConnectionState
{
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* toString(DescriptionType type);
const char* toString(IceState state);
const char* toString(PeerConnectionState state);

// Capabilities the pairing session needs from a peer connection stack.
// Failures are reported by return value. Events are delivered on the thread
// that drives the transport and never from inside a call that reports failure.
class PeerTransport
{
public:
    class IEvents
    {
    public:
        // candidateLine is "candidate:..." as the transport emits it
        virtual void onLocalCandidate(PeerTransport* transport, const std::string& candidateLine) = 0;
        virtual void onGatheringComplete(PeerTransport* transport) = 0;
        virtual void onIncomingDataChannel(PeerTransport* transport, std::shared_ptr<DataChannel> channel) = 0;
        virtual void onIceStateChanged(PeerTransport* transport, IceState state) = 0;
        virtual void onConnectionStateChanged(PeerTransport* transport, PeerConnectionState state) = 0;
    };

    virtual ~PeerTransport() = default;

    // Ephemeral ECDSA P-256 certificate used for the DTLS handshake.
    virtual bool generateCertificate() = 0;
    virtual bool createSession(const std::vector<std::string>& iceServers, IEvents* eventSink) = 0;

    virtual std::shared_ptr<DataChannel> createDataChannel(const std::string& label, bool ordered) = 0;

    // Return empty text on failure.
    virtual std::string createOffer() = 0;
    virtual std::string createAnswer() = 0;
    virtual std::string getLocalDescription() const = 0;

    virtual bool setLocalDescription(DescriptionType type, const std::string& sdp) = 0;
    virtual bool setRemoteDescription(DescriptionType type, const std::string& sdp) = 0;
    // Returns signaling to stable while keeping gathered candidates.
    virtual bool rollbackLocalDescription() = 0;

    virtual bool addRemoteCandidate(const std::string& candidateLine, const std::string& mid) = 0;

    virtual void close() = 0;
};

} // namespace pairing
