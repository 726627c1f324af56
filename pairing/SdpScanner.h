#pragma once

#include "pairing/Candidate.h"
#include "pairing/PairingTypes.h"
#include "utils/Optional.h"
#include <string>
#include <vector>

namespace pairing
{

// Reads the pieces the pairing payload needs out of a transport generated
// session description.
class SdpScanner
{
public:
    // First "a=fingerprint:sha-256" line, hash name case insensitive. Throws SdpError.
    static Fingerprint extractFingerprint(const std::string& sdp);

    // All udp/tcp host and srflx candidates in order of appearance. Other types and malformed lines are skipped.
    static std::vector<Candidate> extractCandidates(const std::string& sdp);

    // Accepts the line with or without the "a=" prefix.
    static bool parseCandidateLine(const std::string& line, Candidate& candidate);

    static utils::Optional<IceCredentials> extractIceCredentials(const std::string& sdp);

    // Rewrites the value of every ice-ufrag and ice-pwd attribute, keeping line endings.
    static std::string replaceIceCredentials(const std::string& sdp, const IceCredentials& credentials);
};

} // namespace pairing
