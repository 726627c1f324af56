#include "pairing/PeerTransport.h"

namespace pairing
{

const char* toString(const DescriptionType type)
{
    return type == DescriptionType::OFFER ? "offer" : "answer";
}

const char* toString(const IceState state)
{
    switch (state)
    {
    case IceState::NEW:
        return "new";
    case IceState::CHECKING:
        return "checking";
    case IceState::CONNECTED:
        return "connected";
    case IceState::COMPLETED:
        return "completed";
    case IceState::DISCONNECTED:
        return "disconnected";
    case IceState::FAILED:
        return "failed";
    case IceState::CLOSED:
        return "closed";
    }
    return "unknown";
}

const char* toString(const PeerConnectionState state)
{
    switch (state)
    {
    case PeerConnectionState::NEW:
        return "new";
    case PeerConnectionState::CONNECTING:
        return "connecting";
    case PeerConnectionState::CONNECTED:
        return "connected";
    case PeerConnectionState::DISCONNECTED:
        return "disconnected";
    case PeerConnectionState::FAILED:
        return "failed";
    case PeerConnectionState::CLOSED:
        return "closed";
    }
    return "unknown";
}

} // namespace pairing
