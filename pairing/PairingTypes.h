#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pairing
{

constexpr uint8_t MAGIC_BYTE = 0x51;
constexpr uint8_t PROTOCOL_VERSION = 0;
constexpr size_t FINGERPRINT_SIZE = 32;
constexpr size_t HEADER_SIZE = 2;
constexpr size_t IPV4_CANDIDATE_SIZE = 1 + 4 + 2;
constexpr size_t IPV6_CANDIDATE_SIZE = 1 + 16 + 2;
constexpr size_t MIN_PACKET_SIZE = HEADER_SIZE + FINGERPRINT_SIZE + IPV4_CANDIDATE_SIZE;

constexpr size_t DEFAULT_MAX_CANDIDATES = 4;
constexpr uint32_t DEFAULT_TIMEOUT_MS = 30000;
constexpr uint32_t DEFAULT_GATHER_TIMEOUT_MS = 10000;

constexpr size_t UFRAG_KEY_SIZE = 4;
constexpr size_t PWD_KEY_SIZE = 18;

using Fingerprint = std::array<uint8_t, FINGERPRINT_SIZE>;

struct IceCredentials
{
    std::string ufrag;
    std::string pwd;

    bool operator==(const IceCredentials& o) const { return ufrag == o.ufrag && pwd == o.pwd; }
    bool operator!=(const IceCredentials& o) const { return !(*this == o); }
};

enum class Role
{
    OFFERER,
    ANSWERER
};

enum class SessionState
{
    IDLE,
    GATHERING,
    DISPLAYING,
    SCANNED_ONE,
    CONNECTING,
    CONNECTED,
    FAILED,
    CLOSED
};

const char* toString(Role role);
const char* toString(SessionState state);

inline bool isTerminal(SessionState state)
{
    return state == SessionState::FAILED || state == SessionState::CLOSED;
}

} // namespace pairing
