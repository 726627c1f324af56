#pragma once

#include "pairing/Candidate.h"
#include "pairing/PairingTypes.h"
#include <string>

namespace pairing
{

constexpr uint32_t PRIORITY_HOST_UDP = 2122260223;
constexpr uint32_t PRIORITY_HOST_TCP = 2105524223;
constexpr uint32_t PRIORITY_SRFLX = 1686052607;

// Rebuilds the minimal data-channel-only session description a peer would
// have produced, from nothing but its fingerprint and derived credentials.
class SdpReconstructor
{
public:
    // CRLF terminated lines, no candidates. setup is actpass for an offer and active for an answer.
    static std::string reconstructSessionDescription(const Fingerprint& fingerprint,
        bool isOffer,
        const IceCredentials& credentials);
    static std::string reconstructSessionDescription(const Fingerprint& fingerprint, bool isOffer);

    // "candidate:<foundation> 1 <proto> <priority> <ip> <port> typ <type> [...]" without the "a=" prefix.
    static std::string buildCandidateLine(const Candidate& candidate);
    static std::string buildFoundation(const Candidate& candidate);
    static uint32_t candidatePriority(Candidate::Type type, Candidate::Protocol protocol);

    static bool validate(const std::string& sdp);
};

} // namespace pairing
