#include "pairing/SdpScanner.h"
#include "pairing/PairingErrors.h"
#include "utils/Format.h"
#include "utils/StringTokenizer.h"
#include <cctype>
#include <cstring>

namespace pairing
{

namespace
{
const char* const LINE_DELIMITERS = "\r\n";
const char* const FIELD_DELIMITERS = " \t\r\n";
const char* const FINGERPRINT_PREFIX = "a=fingerprint:sha-256";
const char* const CANDIDATE_PREFIX = "candidate:";
const char* const UFRAG_PREFIX = "a=ice-ufrag:";
const char* const PWD_PREFIX = "a=ice-pwd:";

using utils::StringTokenizer::Token;

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    return -1;
}

bool parsePort(const Token& token, uint16_t& port)
{
    if (!utils::StringTokenizer::isNumber(token) || token.length > 5)
    {
        return false;
    }
    const auto value = std::stoul(token.str());
    if (value < 1 || value > 65535)
    {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

// Value following "prefix" up to the first whitespace.
std::string attributeValue(const Token& line, size_t prefixLength)
{
    const auto value =
        utils::StringTokenizer::tokenize(line.start + prefixLength, line.length - prefixLength, FIELD_DELIMITERS);
    return value.str();
}

} // namespace

Fingerprint SdpScanner::extractFingerprint(const std::string& sdp)
{
    const size_t prefixLength = std::strlen(FINGERPRINT_PREFIX);
    auto line = utils::StringTokenizer::tokenize(sdp.c_str(), sdp.size(), LINE_DELIMITERS);
    for (; !line.empty(); line = utils::StringTokenizer::tokenize(line, LINE_DELIMITERS))
    {
        if (!utils::StringTokenizer::startsWithIgnoreCase(line, FINGERPRINT_PREFIX) || line.length == prefixLength ||
            !std::strchr(FIELD_DELIMITERS, line.start[prefixLength]))
        {
            continue;
        }

        const auto value = attributeValue(line, prefixLength);
        std::string hex;
        for (char c : value)
        {
            if (c == ':')
            {
                continue;
            }
            if (hexValue(c) < 0)
            {
                break;
            }
            hex += c;
        }

        if (hex.size() != FINGERPRINT_SIZE * 2)
        {
            throw SdpError(utils::format("Invalid fingerprint length: expected %zu hex chars, got %zu",
                FINGERPRINT_SIZE * 2,
                hex.size()));
        }

        Fingerprint fingerprint = {};
        for (size_t i = 0; i < FINGERPRINT_SIZE; ++i)
        {
            fingerprint[i] = static_cast<uint8_t>((hexValue(hex[i * 2]) << 4) | hexValue(hex[i * 2 + 1]));
        }
        return fingerprint;
    }

    throw SdpError("No SHA-256 fingerprint found in session description");
}

bool SdpScanner::parseCandidateLine(const std::string& text, Candidate& candidate)
{
    const char* data = text.c_str();
    size_t length = text.size();
    if (length >= 2 && std::strncmp(data, "a=", 2) == 0)
    {
        data += 2;
        length -= 2;
    }

    auto foundation = utils::StringTokenizer::tokenize(data, length, FIELD_DELIMITERS);
    if (!utils::StringTokenizer::startsWith(foundation, CANDIDATE_PREFIX) ||
        foundation.length == std::strlen(CANDIDATE_PREFIX))
    {
        return false;
    }

    const auto component = utils::StringTokenizer::tokenize(foundation, FIELD_DELIMITERS);
    const auto protocol = utils::StringTokenizer::tokenize(component, FIELD_DELIMITERS);
    const auto priority = utils::StringTokenizer::tokenize(protocol, FIELD_DELIMITERS);
    const auto address = utils::StringTokenizer::tokenize(priority, FIELD_DELIMITERS);
    const auto port = utils::StringTokenizer::tokenize(address, FIELD_DELIMITERS);
    const auto typ = utils::StringTokenizer::tokenize(port, FIELD_DELIMITERS);
    const auto type = utils::StringTokenizer::tokenize(typ, FIELD_DELIMITERS);

    if (!utils::StringTokenizer::isNumber(component) || !utils::StringTokenizer::isNumber(priority) ||
        address.empty() || !utils::StringTokenizer::isEqual(typ, "typ") || type.empty())
    {
        return false;
    }

    Candidate parsed;
    if (utils::StringTokenizer::isEqualIgnoreCase(protocol, "udp"))
    {
        parsed.protocol = Candidate::Protocol::UDP;
    }
    else if (utils::StringTokenizer::isEqualIgnoreCase(protocol, "tcp"))
    {
        parsed.protocol = Candidate::Protocol::TCP;
    }
    else
    {
        return false;
    }

    if (utils::StringTokenizer::isEqualIgnoreCase(type, "host"))
    {
        parsed.type = Candidate::Type::HOST;
    }
    else if (utils::StringTokenizer::isEqualIgnoreCase(type, "srflx"))
    {
        parsed.type = Candidate::Type::SRFLX;
    }
    else
    {
        return false;
    }

    if (!parsePort(port, parsed.port))
    {
        return false;
    }
    parsed.ip = address.str();

    if (parsed.protocol == Candidate::Protocol::TCP)
    {
        // Missing or unknown tcptype reads as passive, as the packet encodes it.
        parsed.tcpType.set(Candidate::TcpType::PASSIVE);
        for (auto key = utils::StringTokenizer::tokenize(type, FIELD_DELIMITERS); !key.empty();
             key = utils::StringTokenizer::tokenize(key, FIELD_DELIMITERS))
        {
            if (!utils::StringTokenizer::isEqual(key, "tcptype"))
            {
                continue;
            }
            const auto value = utils::StringTokenizer::tokenize(key, FIELD_DELIMITERS);
            if (utils::StringTokenizer::isEqualIgnoreCase(value, "active"))
            {
                parsed.tcpType.set(Candidate::TcpType::ACTIVE);
            }
            else if (utils::StringTokenizer::isEqualIgnoreCase(value, "passive"))
            {
                parsed.tcpType.set(Candidate::TcpType::PASSIVE);
            }
            else if (utils::StringTokenizer::isEqualIgnoreCase(value, "so"))
            {
                parsed.tcpType.set(Candidate::TcpType::SO);
            }
            break;
        }
    }

    candidate = parsed;
    return true;
}

std::vector<Candidate> SdpScanner::extractCandidates(const std::string& sdp)
{
    std::vector<Candidate> candidates;
    auto line = utils::StringTokenizer::tokenize(sdp.c_str(), sdp.size(), LINE_DELIMITERS);
    for (; !line.empty(); line = utils::StringTokenizer::tokenize(line, LINE_DELIMITERS))
    {
        if (!utils::StringTokenizer::startsWith(line, "a=candidate:"))
        {
            continue;
        }
        Candidate candidate;
        if (parseCandidateLine(line.str(), candidate))
        {
            candidates.push_back(candidate);
        }
    }
    return candidates;
}

utils::Optional<IceCredentials> SdpScanner::extractIceCredentials(const std::string& sdp)
{
    IceCredentials credentials;
    auto line = utils::StringTokenizer::tokenize(sdp.c_str(), sdp.size(), LINE_DELIMITERS);
    for (; !line.empty(); line = utils::StringTokenizer::tokenize(line, LINE_DELIMITERS))
    {
        if (credentials.ufrag.empty() && utils::StringTokenizer::startsWith(line, UFRAG_PREFIX))
        {
            credentials.ufrag = attributeValue(line, std::strlen(UFRAG_PREFIX));
        }
        else if (credentials.pwd.empty() && utils::StringTokenizer::startsWith(line, PWD_PREFIX))
        {
            credentials.pwd = attributeValue(line, std::strlen(PWD_PREFIX));
        }
    }

    if (credentials.ufrag.empty() || credentials.pwd.empty())
    {
        return utils::Optional<IceCredentials>();
    }
    return utils::Optional<IceCredentials>(credentials);
}

std::string SdpScanner::replaceIceCredentials(const std::string& sdp, const IceCredentials& credentials)
{
    std::string result;
    result.reserve(sdp.size());

    size_t lineStart = 0;
    while (lineStart < sdp.size())
    {
        auto lineEnd = sdp.find('\n', lineStart);
        lineEnd = (lineEnd == std::string::npos ? sdp.size() : lineEnd + 1);
        std::string line = sdp.substr(lineStart, lineEnd - lineStart);

        const char* replacement = nullptr;
        size_t prefixLength = 0;
        if (line.compare(0, std::strlen(UFRAG_PREFIX), UFRAG_PREFIX) == 0)
        {
            replacement = credentials.ufrag.c_str();
            prefixLength = std::strlen(UFRAG_PREFIX);
        }
        else if (line.compare(0, std::strlen(PWD_PREFIX), PWD_PREFIX) == 0)
        {
            replacement = credentials.pwd.c_str();
            prefixLength = std::strlen(PWD_PREFIX);
        }

        if (replacement)
        {
            const auto valueEnd = line.find_first_of(" \t\r\n", prefixLength);
            line = line.substr(0, prefixLength) + replacement +
                (valueEnd == std::string::npos ? std::string() : line.substr(valueEnd));
        }

        result += line;
        lineStart = lineEnd;
    }
    return result;
}

} // namespace pairing
