#pragma once

#include "pairing/PairingTypes.h"
#include <string>

namespace pairing
{

class CredentialDeriver
{
public:
    /**
     * HKDF-SHA256 over the fingerprint with an empty salt. The ufrag is 4 bytes
     * under info "QWBP-ICE-UFRAG-v1" and the pwd 18 bytes under "QWBP-ICE-PWD-v1",
     * both base64url without padding, giving 6 and 24 characters.
     * Throws PairingError if the digest provider fails.
     */
    static IceCredentials deriveCredentials(const Fingerprint& fingerprint);

    // -1, 0 or 1 by unsigned byte-wise comparison.
    static int compareFingerprints(const Fingerprint& a, const Fingerprint& b);

    // Decimal string of the first 8 bytes of SHA-256(fingerprint), big-endian.
    static std::string generateSessionId(const Fingerprint& fingerprint);

    // Four digit code both peers can compare out of band. Symmetric in its arguments.
    static std::string generateSas(const Fingerprint& localFingerprint, const Fingerprint& remoteFingerprint);

    // "AB:CD:..." uppercase hex, 95 characters.
    static std::string formatFingerprint(const Fingerprint& fingerprint);
};

} // namespace pairing
