#pragma once

#include "pairing/Candidate.h"
#include "pairing/PairingTypes.h"
#include <cstdint>
#include <vector>

namespace pairing
{

struct Packet
{
    uint8_t version = PROTOCOL_VERSION;
    Fingerprint fingerprint = {};
    std::vector<Candidate> candidates;
};

/**
 * Binary pairing payload, all fields big-endian:
 *
 *  byte 0      magic 0x51
 *  byte 1      bits 0-2 version, bits 3-7 reserved
 *  bytes 2-33  certificate fingerprint
 *  repeated    flags(1) address(4 | 16) port(2)
 *
 * Candidate flags: bits 0-1 family (00 IPv4, 01 IPv6, 10 mDNS), bit 2 tcp,
 * bit 3 srflx, bits 4-5 tcp subtype (00 passive, 01 active, 10 so).
 */
class PacketCodec
{
public:
    // Throws EncodeError
    static std::vector<uint8_t> encode(const uint8_t* fingerprint,
        size_t fingerprintLength,
        const std::vector<Candidate>& candidates);
    static std::vector<uint8_t> encode(const Fingerprint& fingerprint, const std::vector<Candidate>& candidates);

    // Throws DecodeError
    static Packet decode(const uint8_t* data, size_t length);
    static Packet decode(const std::vector<uint8_t>& data) { return decode(data.data(), data.size()); }

    // Checks length, magic and version only.
    static bool isValidPacket(const uint8_t* data, size_t length);
    static bool isValidPacket(const std::vector<uint8_t>& data) { return isValidPacket(data.data(), data.size()); }

    /**
     * Picks at most maxCandidates to put on the wire. IPv4 is preferred within
     * host and srflx groups. If any srflx candidate exists exactly one slot is
     * reserved for the best of them, the remaining slots go to host candidates.
     */
    static std::vector<Candidate> selectCandidates(const std::vector<Candidate>& candidates, size_t maxCandidates);

    static size_t encodedSize(const Candidate& candidate);
};

} // namespace pairing
