#include "pairing/PairingTypes.h"

namespace pairing
{

const char* toString(const Role role)
{
    switch (role)
    {
    case Role::OFFERER:
        return "offerer";
    case Role::ANSWERER:
        return "answerer";
    }
    return "unknown";
}

const char* toString(const SessionState state)
{
    switch (state)
    {
    case SessionState::IDLE:
        return "idle";
    case SessionState::GATHERING:
        return "gathering";
    case SessionState::DISPLAYING:
        return "displaying";
    case SessionState::SCANNED_ONE:
        return "scanned-one";
    case SessionState::CONNECTING:
        return "connecting";
    case SessionState::CONNECTED:
        return "connected";
    case SessionState::FAILED:
        return "failed";
    case SessionState::CLOSED:
        return "closed";
    }
    return "unknown";
}

} // namespace pairing
