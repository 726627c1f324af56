#pragma once

#include "pairing/PairingTypes.h"
#include <exception>
#include <string>

namespace pairing
{

class PairingError : public std::exception
{
public:
    explicit PairingError(std::string&& message) : _message(std::move(message)) {}

    const char* what() const noexcept override { return _message.c_str(); }
    const std::string& getMessage() const { return _message; }

private:
    std::string _message;
};

// Invalid fingerprint length or an address literal that does not fit its family.
class EncodeError : public PairingError
{
public:
    explicit EncodeError(std::string&& message) : PairingError(std::move(message)) {}
};

class DecodeError : public PairingError
{
public:
    enum class Field
    {
        LENGTH,
        MAGIC,
        VERSION,
        CANDIDATE,
        ADDRESS_FAMILY
    };

    DecodeError(Field field, std::string&& message) : PairingError(std::move(message)), _field(field) {}

    Field getField() const noexcept { return _field; }

private:
    Field _field;
};

// Session description text lacks a usable fingerprint.
class SdpError : public PairingError
{
public:
    explicit SdpError(std::string&& message) : PairingError(std::move(message)) {}
};

class ConnectionError : public PairingError
{
public:
    ConnectionError(std::string&& message, SessionState state) : PairingError(std::move(message)), _state(state) {}

    SessionState getState() const noexcept { return _state; }

private:
    SessionState _state;
};

class TimeoutError : public ConnectionError
{
public:
    explicit TimeoutError(SessionState state) : ConnectionError("Session timeout", state) {}
};

class SelfConnectionError : public ConnectionError
{
public:
    explicit SelfConnectionError(SessionState state) : ConnectionError("Cannot connect to self", state) {}
};

class IceError : public ConnectionError
{
public:
    IceError(const std::string& iceState, SessionState state)
        : ConnectionError("ICE connection " + iceState, state),
          _iceState(iceState)
    {
    }

    const std::string& getIceState() const { return _iceState; }

private:
    std::string _iceState;
};

} // namespace pairing
