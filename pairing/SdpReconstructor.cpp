#include "pairing/SdpReconstructor.h"
#include "crypto/SslHelper.h"
#include "pairing/CredentialDeriver.h"
#include "utils/Format.h"
#include "utils/StringTokenizer.h"

namespace pairing
{

namespace
{
const char* const CRLF = "\r\n";

bool containsLineStart(const std::string& sdp, const char* prefix, bool ignoreCase)
{
    auto token = utils::StringTokenizer::tokenize(sdp.c_str(), sdp.size(), CRLF);
    for (; !token.empty(); token = utils::StringTokenizer::tokenize(token, CRLF))
    {
        if (ignoreCase ? utils::StringTokenizer::startsWithIgnoreCase(token, prefix)
                       : utils::StringTokenizer::startsWith(token, prefix))
        {
            return true;
        }
    }
    return false;
}
} // namespace

std::string SdpReconstructor::reconstructSessionDescription(const Fingerprint& fingerprint,
    bool isOffer,
    const IceCredentials& credentials)
{
    std::string sdp;
    sdp.reserve(400);
    sdp += "v=0\r\n";
    sdp += "o=- " + CredentialDeriver::generateSessionId(fingerprint) + " 2 IN IP4 127.0.0.1\r\n";
    sdp += "s=-\r\n";
    sdp += "t=0 0\r\n";
    sdp += "a=group:BUNDLE 0\r\n";
    sdp += "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n";
    sdp += "c=IN IP4 0.0.0.0\r\n";
    sdp += "a=mid:0\r\n";
    sdp += "a=ice-ufrag:" + credentials.ufrag + CRLF;
    sdp += "a=ice-pwd:" + credentials.pwd + CRLF;
    sdp += "a=ice-options:trickle\r\n";
    sdp += "a=fingerprint:sha-256 " + CredentialDeriver::formatFingerprint(fingerprint) + CRLF;
    sdp += std::string("a=setup:") + (isOffer ? "actpass" : "active") + CRLF;
    sdp += "a=sctp-port:5000\r\n";
    return sdp;
}

std::string SdpReconstructor::reconstructSessionDescription(const Fingerprint& fingerprint, bool isOffer)
{
    return reconstructSessionDescription(fingerprint, isOffer, CredentialDeriver::deriveCredentials(fingerprint));
}

uint32_t SdpReconstructor::candidatePriority(Candidate::Type type, Candidate::Protocol protocol)
{
    if (type == Candidate::Type::SRFLX)
    {
        return PRIORITY_SRFLX;
    }
    return protocol == Candidate::Protocol::UDP ? PRIORITY_HOST_UDP : PRIORITY_HOST_TCP;
}

std::string SdpReconstructor::buildFoundation(const Candidate& candidate)
{
    const auto material = utils::format("%s%s%s%u",
        toString(candidate.type),
        toString(candidate.protocol),
        candidate.ip.c_str(),
        candidate.port);
    const auto digest = crypto::Sha256::hash(material.data(), material.size());
    return crypto::toHexString(digest.data(), 4);
}

std::string SdpReconstructor::buildCandidateLine(const Candidate& candidate)
{
    auto line = utils::format("candidate:%s 1 %s %u %s %u typ %s",
        buildFoundation(candidate).c_str(),
        toString(candidate.protocol),
        candidatePriority(candidate.type, candidate.protocol),
        candidate.ip.c_str(),
        candidate.port,
        toString(candidate.type));

    // Placeholder related address. The real mapping is never sent.
    if (candidate.type == Candidate::Type::SRFLX)
    {
        line += " raddr 0.0.0.0 rport 9";
    }
    if (candidate.protocol == Candidate::Protocol::TCP && candidate.tcpType.isSet())
    {
        line += " tcptype ";
        line += toString(candidate.tcpType.get());
    }
    return line;
}

bool SdpReconstructor::validate(const std::string& sdp)
{
    return containsLineStart(sdp, "a=fingerprint:sha-256", true) && containsLineStart(sdp, "a=ice-ufrag:", false) &&
        containsLineStart(sdp, "a=ice-pwd:", false) && containsLineStart(sdp, "m=application", false);
}

} // namespace pairing
