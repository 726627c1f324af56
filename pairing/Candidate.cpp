#include "pairing/Candidate.h"

namespace pairing
{

namespace
{
bool endsWith(const std::string& text, const char* suffix, size_t suffixLength)
{
    return text.size() >= suffixLength && text.compare(text.size() - suffixLength, suffixLength, suffix) == 0;
}
} // namespace

Candidate::Candidate() : port(0), type(Type::HOST), protocol(Protocol::UDP) {}

Candidate::Candidate(const std::string& ip_, uint16_t port_, Type type_, Protocol protocol_)
    : ip(ip_),
      port(port_),
      type(type_),
      protocol(protocol_)
{
    if (protocol == Protocol::TCP)
    {
        tcpType.set(TcpType::PASSIVE);
    }
}

Candidate::Candidate(const std::string& ip_, uint16_t port_, Type type_, TcpType tcpType_)
    : ip(ip_),
      port(port_),
      type(type_),
      protocol(Protocol::TCP),
      tcpType(tcpType_)
{
}

AddressFamily Candidate::getAddressFamily() const
{
    return classifyAddress(ip);
}

bool Candidate::operator==(const Candidate& o) const
{
    return ip == o.ip && port == o.port && type == o.type && protocol == o.protocol && tcpType == o.tcpType;
}

AddressFamily classifyAddress(const std::string& address)
{
    if (endsWith(address, ".local", 6))
    {
        return AddressFamily::MDNS;
    }
    if (address.find(':') != std::string::npos)
    {
        return AddressFamily::IPV6;
    }
    return AddressFamily::IPV4;
}

const char* toString(const Candidate::Type type)
{
    switch (type)
    {
    case Candidate::Type::HOST:
        return "host";
    case Candidate::Type::SRFLX:
        return "srflx";
    }
    return "unknown";
}

const char* toString(const Candidate::Protocol protocol)
{
    switch (protocol)
    {
    case Candidate::Protocol::UDP:
        return "udp";
    case Candidate::Protocol::TCP:
        return "tcp";
    }
    return "unknown";
}

const char* toString(const Candidate::TcpType tcpType)
{
    switch (tcpType)
    {
    case Candidate::TcpType::PASSIVE:
        return "passive";
    case Candidate::TcpType::ACTIVE:
        return "active";
    case Candidate::TcpType::SO:
        return "so";
    }
    return "unknown";
}

const char* toString(const AddressFamily family)
{
    switch (family)
    {
    case AddressFamily::IPV4:
        return "IPv4";
    case AddressFamily::IPV6:
        return "IPv6";
    case AddressFamily::MDNS:
        return "mDNS";
    }
    return "unknown";
}

} // namespace pairing
