#include "pairing/PacketCodec.h"
#include "pairing/PairingErrors.h"
#include "utils/Format.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace pairing
{

namespace
{
constexpr uint8_t FAMILY_IPV4 = 0x0;
constexpr uint8_t FAMILY_IPV6 = 0x1;
constexpr uint8_t FAMILY_MDNS = 0x2;
constexpr uint8_t FAMILY_MASK = 0x3;
constexpr uint8_t PROTOCOL_TCP_BIT = 0x04;
constexpr uint8_t TYPE_SRFLX_BIT = 0x08;
constexpr uint8_t TCP_TYPE_SHIFT = 4;
constexpr uint8_t VERSION_MASK = 0x07;

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

std::vector<std::string> split(const std::string& text, char delimiter)
{
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;)
    {
        const auto end = text.find(delimiter, start);
        parts.push_back(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos)
        {
            return parts;
        }
        start = end + 1;
    }
}

bool parseIpv4(const std::string& address, uint8_t* out)
{
    const auto octets = split(address, '.');
    if (octets.size() != 4)
    {
        return false;
    }

    for (size_t i = 0; i < 4; ++i)
    {
        const auto& octet = octets[i];
        if (octet.empty() || octet.size() > 3)
        {
            return false;
        }
        int value = 0;
        for (char c : octet)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return false;
            }
            value = value * 10 + (c - '0');
        }
        if (value > 255)
        {
            return false;
        }
        out[i] = static_cast<uint8_t>(value);
    }
    return true;
}

bool parseHexGroup(const std::string& group, uint16_t& value)
{
    if (group.empty() || group.size() > 4)
    {
        return false;
    }
    value = 0;
    for (char c : group)
    {
        const int nibble = hexValue(c);
        if (nibble < 0)
        {
            return false;
        }
        value = static_cast<uint16_t>((value << 4) | nibble);
    }
    return true;
}

// Parses one side of "::". A dotted quad is accepted as the final element and counts as two groups.
bool parseIpv6Groups(const std::string& text, bool allowDottedTail, std::vector<uint16_t>& groups)
{
    if (text.empty())
    {
        return true;
    }

    const auto parts = split(text, ':');
    for (size_t i = 0; i < parts.size(); ++i)
    {
        const auto& part = parts[i];
        if (allowDottedTail && i == parts.size() - 1 && part.find('.') != std::string::npos)
        {
            uint8_t ipv4[4];
            if (!parseIpv4(part, ipv4))
            {
                return false;
            }
            groups.push_back(static_cast<uint16_t>((ipv4[0] << 8) | ipv4[1]));
            groups.push_back(static_cast<uint16_t>((ipv4[2] << 8) | ipv4[3]));
            continue;
        }

        uint16_t value = 0;
        if (!parseHexGroup(part, value))
        {
            return false;
        }
        groups.push_back(value);
    }
    return true;
}

bool parseIpv6(const std::string& address, uint8_t* out)
{
    std::string cleaned = address;
    if (!cleaned.empty() && cleaned.front() == '[')
    {
        cleaned.erase(0, 1);
    }
    if (!cleaned.empty() && cleaned.back() == ']')
    {
        cleaned.pop_back();
    }

    const auto compression = cleaned.find("::");
    if (compression != std::string::npos && cleaned.find("::", compression + 1) != std::string::npos)
    {
        return false;
    }

    std::vector<uint16_t> head;
    std::vector<uint16_t> tail;
    if (compression == std::string::npos)
    {
        if (!parseIpv6Groups(cleaned, true, head) || head.size() != 8)
        {
            return false;
        }
    }
    else
    {
        // A single stray colon next to the compression ("1:::2", ":::") leaves an empty group and fails here.
        if (!parseIpv6Groups(cleaned.substr(0, compression), false, head) ||
            !parseIpv6Groups(cleaned.substr(compression + 2), true, tail) || head.size() + tail.size() > 8)
        {
            return false;
        }
    }

    std::array<uint16_t, 8> groups = {};
    std::copy(head.begin(), head.end(), groups.begin());
    std::copy(tail.begin(), tail.end(), groups.end() - tail.size());
    for (size_t i = 0; i < groups.size(); ++i)
    {
        out[i * 2] = static_cast<uint8_t>(groups[i] >> 8);
        out[i * 2 + 1] = static_cast<uint8_t>(groups[i] & 0xFF);
    }
    return true;
}

bool parseMdns(const std::string& hostName, uint8_t* out)
{
    const std::string uuid = hostName.substr(0, hostName.size() - std::strlen(".local"));
    std::string hex;
    hex.reserve(32);
    for (char c : uuid)
    {
        if (c != '-')
        {
            hex += c;
        }
    }

    if (hex.size() != 32)
    {
        return false;
    }
    for (size_t i = 0; i < 16; ++i)
    {
        const int high = hexValue(hex[i * 2]);
        const int low = hexValue(hex[i * 2 + 1]);
        if (high < 0 || low < 0)
        {
            return false;
        }
        out[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return true;
}

std::string formatIpv4(const uint8_t* bytes)
{
    return utils::format("%u.%u.%u.%u", bytes[0], bytes[1], bytes[2], bytes[3]);
}

// Lowercase groups without leading zeros. The first longest run of two or more
// zero groups is replaced by "::".
std::string formatIpv6(const uint8_t* bytes)
{
    uint16_t groups[8];
    for (size_t i = 0; i < 8; ++i)
    {
        groups[i] = static_cast<uint16_t>((bytes[i * 2] << 8) | bytes[i * 2 + 1]);
    }

    int bestStart = -1;
    int bestLength = 0;
    for (int i = 0; i < 8;)
    {
        if (groups[i] != 0)
        {
            ++i;
            continue;
        }
        int runEnd = i;
        while (runEnd < 8 && groups[runEnd] == 0)
        {
            ++runEnd;
        }
        if (runEnd - i > bestLength)
        {
            bestStart = i;
            bestLength = runEnd - i;
        }
        i = runEnd;
    }
    if (bestLength < 2)
    {
        bestStart = -1;
    }

    std::string result;
    for (int i = 0; i < 8; ++i)
    {
        if (i == bestStart)
        {
            result += "::";
            i += bestLength - 1;
            continue;
        }
        if (!result.empty() && result.back() != ':')
        {
            result += ':';
        }
        result += utils::format("%x", groups[i]);
    }
    return result;
}

std::string formatMdns(const uint8_t* bytes)
{
    static const char hexmap[] = "0123456789abcdef";
    std::string result;
    for (size_t i = 0; i < 16; ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
            result += '-';
        }
        result += hexmap[bytes[i] >> 4];
        result += hexmap[bytes[i] & 0x0F];
    }
    result += ".local";
    return result;
}

uint8_t tcpTypeBits(const Candidate& candidate)
{
    if (candidate.protocol != Candidate::Protocol::TCP || !candidate.tcpType.isSet())
    {
        return 0;
    }
    switch (candidate.tcpType.get())
    {
    case Candidate::TcpType::ACTIVE:
        return 0x1;
    case Candidate::TcpType::SO:
        return 0x2;
    case Candidate::TcpType::PASSIVE:
        return 0x0;
    }
    return 0;
}

void writeCandidate(const Candidate& candidate, std::vector<uint8_t>& out)
{
    if (candidate.port == 0)
    {
        throw EncodeError(utils::format("Invalid port: 0 for %s", candidate.ip.c_str()));
    }

    uint8_t address[16] = {};
    size_t addressLength = 0;
    uint8_t family = FAMILY_IPV4;

    switch (candidate.getAddressFamily())
    {
    case AddressFamily::MDNS:
        family = FAMILY_MDNS;
        addressLength = 16;
        if (!parseMdns(candidate.ip, address))
        {
            throw EncodeError("Invalid mDNS UUID: " + candidate.ip);
        }
        break;
    case AddressFamily::IPV6:
        family = FAMILY_IPV6;
        addressLength = 16;
        if (!parseIpv6(candidate.ip, address))
        {
            throw EncodeError("Invalid IPv6 address: " + candidate.ip);
        }
        break;
    case AddressFamily::IPV4:
        family = FAMILY_IPV4;
        addressLength = 4;
        if (!parseIpv4(candidate.ip, address))
        {
            throw EncodeError("Invalid IPv4 address: " + candidate.ip);
        }
        break;
    }

    uint8_t flags = family;
    if (candidate.protocol == Candidate::Protocol::TCP)
    {
        flags |= PROTOCOL_TCP_BIT;
    }
    if (candidate.type == Candidate::Type::SRFLX)
    {
        flags |= TYPE_SRFLX_BIT;
    }
    flags |= static_cast<uint8_t>(tcpTypeBits(candidate) << TCP_TYPE_SHIFT);

    out.push_back(flags);
    out.insert(out.end(), address, address + addressLength);
    out.push_back(static_cast<uint8_t>(candidate.port >> 8));
    out.push_back(static_cast<uint8_t>(candidate.port & 0xFF));
}

size_t readCandidate(const uint8_t* data, size_t length, size_t offset, Candidate& candidate)
{
    const uint8_t flags = data[offset];
    const uint8_t family = flags & FAMILY_MASK;
    size_t addressLength = 0;

    switch (family)
    {
    case FAMILY_IPV4:
        addressLength = 4;
        if (offset + 1 + addressLength + 2 > length)
        {
            throw DecodeError(DecodeError::Field::CANDIDATE, "Packet truncated: incomplete IPv4 candidate");
        }
        candidate.ip = formatIpv4(data + offset + 1);
        break;
    case FAMILY_IPV6:
        addressLength = 16;
        if (offset + 1 + addressLength + 2 > length)
        {
            throw DecodeError(DecodeError::Field::CANDIDATE, "Packet truncated: incomplete IPv6 candidate");
        }
        candidate.ip = formatIpv6(data + offset + 1);
        break;
    case FAMILY_MDNS:
        addressLength = 16;
        if (offset + 1 + addressLength + 2 > length)
        {
            throw DecodeError(DecodeError::Field::CANDIDATE, "Packet truncated: incomplete mDNS candidate");
        }
        candidate.ip = formatMdns(data + offset + 1);
        break;
    default:
        throw DecodeError(DecodeError::Field::ADDRESS_FAMILY, utils::format("Unknown address family: %u", family));
    }

    const size_t portOffset = offset + 1 + addressLength;
    candidate.port = static_cast<uint16_t>((data[portOffset] << 8) | data[portOffset + 1]);
    candidate.type = (flags & TYPE_SRFLX_BIT) ? Candidate::Type::SRFLX : Candidate::Type::HOST;
    candidate.protocol = (flags & PROTOCOL_TCP_BIT) ? Candidate::Protocol::TCP : Candidate::Protocol::UDP;
    candidate.tcpType.clear();
    if (candidate.protocol == Candidate::Protocol::TCP)
    {
        switch ((flags >> TCP_TYPE_SHIFT) & 0x3)
        {
        case 0x1:
            candidate.tcpType.set(Candidate::TcpType::ACTIVE);
            break;
        case 0x2:
            candidate.tcpType.set(Candidate::TcpType::SO);
            break;
        default:
            candidate.tcpType.set(Candidate::TcpType::PASSIVE);
        }
    }

    return 1 + addressLength + 2;
}

bool isIpv4(const Candidate& candidate)
{
    return candidate.getAddressFamily() == AddressFamily::IPV4;
}

} // namespace

size_t PacketCodec::encodedSize(const Candidate& candidate)
{
    return candidate.getAddressFamily() == AddressFamily::IPV4 ? IPV4_CANDIDATE_SIZE : IPV6_CANDIDATE_SIZE;
}

std::vector<uint8_t> PacketCodec::encode(const uint8_t* fingerprint,
    size_t fingerprintLength,
    const std::vector<Candidate>& candidates)
{
    if (fingerprintLength != FINGERPRINT_SIZE)
    {
        throw EncodeError(
            utils::format("Invalid fingerprint length: expected %zu, got %zu", FINGERPRINT_SIZE, fingerprintLength));
    }

    size_t totalSize = HEADER_SIZE + FINGERPRINT_SIZE;
    for (const auto& candidate : candidates)
    {
        totalSize += encodedSize(candidate);
    }

    std::vector<uint8_t> packet;
    packet.reserve(totalSize);
    packet.push_back(MAGIC_BYTE);
    packet.push_back(PROTOCOL_VERSION & VERSION_MASK);
    packet.insert(packet.end(), fingerprint, fingerprint + FINGERPRINT_SIZE);

    for (const auto& candidate : candidates)
    {
        writeCandidate(candidate, packet);
    }

    return packet;
}

std::vector<uint8_t> PacketCodec::encode(const Fingerprint& fingerprint, const std::vector<Candidate>& candidates)
{
    return encode(fingerprint.data(), fingerprint.size(), candidates);
}

Packet PacketCodec::decode(const uint8_t* data, size_t length)
{
    if (length < MIN_PACKET_SIZE)
    {
        throw DecodeError(DecodeError::Field::LENGTH,
            utils::format("Packet too short: expected at least %zu bytes, got %zu", MIN_PACKET_SIZE, length));
    }
    if (data[0] != MAGIC_BYTE)
    {
        throw DecodeError(DecodeError::Field::MAGIC,
            utils::format("Invalid magic byte: expected 0x%02x, got 0x%02x", MAGIC_BYTE, data[0]));
    }

    const uint8_t version = data[1] & VERSION_MASK;
    if (version != PROTOCOL_VERSION)
    {
        throw DecodeError(DecodeError::Field::VERSION, utils::format("Unsupported protocol version: %u", version));
    }

    Packet packet;
    packet.version = version;
    std::memcpy(packet.fingerprint.data(), data + HEADER_SIZE, FINGERPRINT_SIZE);

    size_t offset = HEADER_SIZE + FINGERPRINT_SIZE;
    while (offset < length)
    {
        Candidate candidate;
        offset += readCandidate(data, length, offset, candidate);
        packet.candidates.push_back(candidate);
    }

    return packet;
}

bool PacketCodec::isValidPacket(const uint8_t* data, size_t length)
{
    return data && length >= MIN_PACKET_SIZE && data[0] == MAGIC_BYTE && (data[1] & VERSION_MASK) == PROTOCOL_VERSION;
}

std::vector<Candidate> PacketCodec::selectCandidates(const std::vector<Candidate>& candidates, size_t maxCandidates)
{
    std::vector<Candidate> hosts;
    std::vector<Candidate> reflexives;
    for (const auto& candidate : candidates)
    {
        (candidate.type == Candidate::Type::HOST ? hosts : reflexives).push_back(candidate);
    }
    std::stable_partition(hosts.begin(), hosts.end(), isIpv4);
    std::stable_partition(reflexives.begin(), reflexives.end(), isIpv4);

    std::vector<Candidate> selected;
    if (maxCandidates == 0)
    {
        return selected;
    }

    const size_t hostSlots = reflexives.empty() ? maxCandidates : maxCandidates - 1;
    selected.insert(selected.end(), hosts.begin(), hosts.begin() + std::min(hostSlots, hosts.size()));
    if (!reflexives.empty())
    {
        selected.push_back(reflexives.front());
    }
    return selected;
}

} // namespace pairing
