#pragma once

#include "pairing/CredentialDeriver.h"
#include "pairing/DataChannel.h"
#include "pairing/PeerTransport.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test
{

class FakeDataChannel : public ::pairing::DataChannel
{
public:
    FakeDataChannel(const std::string& label, bool ordered) : DataChannel(label), ordered(ordered), _state(State::CONNECTING)
    {
    }

    State getState() const override { return _state; }

    bool send(const uint8_t* data, size_t length) override
    {
        if (_state != State::OPEN)
        {
            return false;
        }
        sent.emplace_back(data, data + length);
        return true;
    }

    bool send(const std::string& text) override
    {
        return send(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    void close() override
    {
        ++closeCount;
        if (_state == State::CLOSED)
        {
            return;
        }
        _state = State::CLOSED;
        notifyClosed();
    }

    void simulateOpen()
    {
        _state = State::OPEN;
        notifyOpen();
    }

    void simulateRemoteClose()
    {
        _state = State::CLOSED;
        notifyClosed();
    }

    void simulateError(const std::string& reason) { notifyError(reason); }

    const bool ordered;
    int closeCount = 0;
    std::vector<std::vector<uint8_t>> sent;

private:
    State _state;
};

/**
 * Deterministic transport. Descriptions it creates carry the given certificate
 * fingerprint. Events are only raised when a test asks for them, except the
 * optional candidates emitted while a local offer is committed.
 */
class FakePeerTransport : public ::pairing::PeerTransport
{
public:
    explicit FakePeerTransport(const ::pairing::Fingerprint& certificateFingerprint)
        : certificateFingerprint(certificateFingerprint)
    {
    }

    bool generateCertificate() override
    {
        ++certificateCount;
        return !failCertificate;
    }

    bool createSession(const std::vector<std::string>& servers, IEvents* sink) override
    {
        iceServers = servers;
        eventSink = sink;
        return !failSession;
    }

    std::shared_ptr<::pairing::DataChannel> createDataChannel(const std::string& label, bool ordered) override
    {
        if (failDataChannel)
        {
            return nullptr;
        }
        auto channel = std::make_shared<FakeDataChannel>(label, ordered);
        createdChannels.push_back(channel);
        return channel;
    }

    std::string createOffer() override { return failOffer ? std::string() : buildDescription("actpass"); }
    std::string createAnswer() override { return failAnswer ? std::string() : buildDescription("active"); }

    std::string getLocalDescription() const override
    {
        std::string sdp = localDescription;
        for (const auto& line : localCandidateLines)
        {
            sdp += "a=" + line + "\r\n";
        }
        return sdp;
    }

    bool setLocalDescription(::pairing::DescriptionType type, const std::string& sdp) override
    {
        localDescriptions.emplace_back(type, sdp);
        if (failSetLocal)
        {
            return false;
        }

        localDescription = sdp;
        if (type == ::pairing::DescriptionType::OFFER)
        {
            for (const auto& line : candidatesOnOffer)
            {
                emitLocalCandidate(line);
            }
            if (completeGatheringOnOffer)
            {
                emitGatheringComplete();
            }
        }
        return true;
    }

    bool setRemoteDescription(::pairing::DescriptionType type, const std::string& sdp) override
    {
        remoteDescriptions.emplace_back(type, sdp);
        return !failSetRemote;
    }

    bool rollbackLocalDescription() override
    {
        ++rollbackCount;
        if (failRollback)
        {
            return false;
        }
        localDescription.clear();
        return true;
    }

    bool addRemoteCandidate(const std::string& candidateLine, const std::string& mid) override
    {
        remoteCandidates.emplace_back(candidateLine, mid);
        return !failAddCandidate;
    }

    void close() override { ++closeCount; }

    void emitLocalCandidate(const std::string& candidateLine)
    {
        localCandidateLines.push_back(candidateLine);
        eventSink->onLocalCandidate(this, candidateLine);
    }

    void emitGatheringComplete() { eventSink->onGatheringComplete(this); }

    std::shared_ptr<FakeDataChannel> emitIncomingChannel(const std::string& label)
    {
        auto channel = std::make_shared<FakeDataChannel>(label, true);
        eventSink->onIncomingDataChannel(this, channel);
        return channel;
    }

    void emitIceState(::pairing::IceState state) { eventSink->onIceStateChanged(this, state); }
    void emitConnectionState(::pairing::PeerConnectionState state) { eventSink->onConnectionStateChanged(this, state); }

    std::shared_ptr<FakeDataChannel> lastChannel() const
    {
        return createdChannels.empty() ? nullptr : createdChannels.back();
    }

    const ::pairing::Fingerprint certificateFingerprint;

    bool failCertificate = false;
    bool failSession = false;
    bool failDataChannel = false;
    bool failOffer = false;
    bool failAnswer = false;
    bool failSetLocal = false;
    bool failSetRemote = false;
    bool failRollback = false;
    bool failAddCandidate = false;

    std::vector<std::string> candidatesOnOffer;
    bool completeGatheringOnOffer = false;

    IEvents* eventSink = nullptr;
    std::vector<std::string> iceServers;
    std::vector<std::shared_ptr<FakeDataChannel>> createdChannels;
    std::vector<std::pair<::pairing::DescriptionType, std::string>> localDescriptions;
    std::vector<std::pair<::pairing::DescriptionType, std::string>> remoteDescriptions;
    std::vector<std::pair<std::string, std::string>> remoteCandidates;
    std::vector<std::string> localCandidateLines;
    std::string localDescription;
    int certificateCount = 0;
    int rollbackCount = 0;
    int closeCount = 0;

private:
    std::string buildDescription(const char* setup) const
    {
        std::string sdp;
        sdp += "v=0\r\n";
        sdp += "o=- 4611731400430051336 2 IN IP4 127.0.0.1\r\n";
        sdp += "s=-\r\n";
        sdp += "t=0 0\r\n";
        sdp += "a=group:BUNDLE 0\r\n";
        sdp += "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n";
        sdp += "c=IN IP4 0.0.0.0\r\n";
        sdp += "a=ice-ufrag:Xy7q\r\n";
        sdp += "a=ice-pwd:generatedbythetransport00\r\n";
        sdp += "a=ice-options:trickle\r\n";
        sdp += "a=fingerprint:sha-256 " + ::pairing::CredentialDeriver::formatFingerprint(certificateFingerprint) +
            "\r\n";
        sdp += std::string("a=setup:") + setup + "\r\n";
        sdp += "a=mid:0\r\n";
        sdp += "a=sctp-port:5000\r\n";
        sdp += "a=max-message-size:262144\r\n";
        return sdp;
    }
};

} // namespace test
