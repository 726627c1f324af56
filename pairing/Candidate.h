#pragma once

#include "utils/Optional.h"
#include <cstdint>
#include <string>

namespace pairing
{

enum class AddressFamily
{
    IPV4,
    IPV6,
    MDNS
};

// One network path a peer may be reachable on. The address is a dotted IPv4
// literal, an IPv6 literal or an mDNS host name "<uuid>.local".
class Candidate
{
public:
    enum class Type
    {
        HOST,
        SRFLX
    };

    enum class Protocol
    {
        UDP,
        TCP
    };

    enum class TcpType
    {
        PASSIVE,
        ACTIVE,
        SO
    };

    Candidate();
    Candidate(const std::string& ip, uint16_t port, Type type, Protocol protocol);
    Candidate(const std::string& ip, uint16_t port, Type type, TcpType tcpType);

    AddressFamily getAddressFamily() const;

    bool operator==(const Candidate& o) const;
    bool operator!=(const Candidate& o) const { return !(*this == o); }

    std::string ip;
    uint16_t port;
    Type type;
    Protocol protocol;
    utils::Optional<TcpType> tcpType; // set iff protocol is TCP
};

AddressFamily classifyAddress(const std::string& address);

const char* toString(Candidate::Type type);
const char* toString(Candidate::Protocol protocol);
const char* toString(Candidate::TcpType tcpType);
const char* toString(AddressFamily family);

} // namespace pairing
