#include "pairing/CredentialDeriver.h"
#include "crypto/SslHelper.h"
#include "pairing/PairingErrors.h"
#include "utils/Base64.h"
#include "utils/Format.h"
#include <cinttypes>

namespace pairing
{

namespace
{
const char* const HKDF_INFO_UFRAG = "QWBP-ICE-UFRAG-v1";
const char* const HKDF_INFO_PWD = "QWBP-ICE-PWD-v1";

template <size_t N>
std::string deriveToken(const Fingerprint& fingerprint, const char* info)
{
    uint8_t keyBytes[N];
    if (!crypto::hkdfSha256(fingerprint.data(), fingerprint.size(), nullptr, 0, info, keyBytes, N))
    {
        throw PairingError(std::string("Credential derivation failed for ") + info);
    }
    return utils::Base64::encode(keyBytes, N, utils::Base64::Alphabet::URL);
}
} // namespace

IceCredentials CredentialDeriver::deriveCredentials(const Fingerprint& fingerprint)
{
    IceCredentials credentials;
    credentials.ufrag = deriveToken<UFRAG_KEY_SIZE>(fingerprint, HKDF_INFO_UFRAG);
    credentials.pwd = deriveToken<PWD_KEY_SIZE>(fingerprint, HKDF_INFO_PWD);
    return credentials;
}

int CredentialDeriver::compareFingerprints(const Fingerprint& a, const Fingerprint& b)
{
    for (size_t i = 0; i < FINGERPRINT_SIZE; ++i)
    {
        if (a[i] > b[i])
        {
            return 1;
        }
        if (a[i] < b[i])
        {
            return -1;
        }
    }
    return 0;
}

std::string CredentialDeriver::generateSessionId(const Fingerprint& fingerprint)
{
    const auto digest = crypto::Sha256::hash(fingerprint.data(), fingerprint.size());
    uint64_t id = 0;
    for (size_t i = 0; i < 8; ++i)
    {
        id = (id << 8) | digest[i];
    }
    return utils::format("%" PRIu64, id);
}

std::string CredentialDeriver::generateSas(const Fingerprint& localFingerprint, const Fingerprint& remoteFingerprint)
{
    const bool localFirst = compareFingerprints(localFingerprint, remoteFingerprint) >= 0;
    const auto& first = localFirst ? localFingerprint : remoteFingerprint;
    const auto& second = localFirst ? remoteFingerprint : localFingerprint;

    crypto::Sha256 sha;
    sha.add(first.data(), first.size());
    sha.add(second.data(), second.size());
    const auto digest = sha.compute();

    const uint32_t value = (static_cast<uint32_t>(digest[0]) << 8) | digest[1];
    return utils::format("%04u", value % 10000);
}

std::string CredentialDeriver::formatFingerprint(const Fingerprint& fingerprint)
{
    static const char hexmap[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(FINGERPRINT_SIZE * 3 - 1);
    for (size_t i = 0; i < FINGERPRINT_SIZE; ++i)
    {
        if (i > 0)
        {
            result += ':';
        }
        result += hexmap[fingerprint[i] >> 4];
        result += hexmap[fingerprint[i] & 0x0F];
    }
    return result;
}

} // namespace pairing
