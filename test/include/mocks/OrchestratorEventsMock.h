#pragma once

#include "pairing/ConnectionOrchestrator.h"
#include <gmock/gmock.h>
#include <memory>

namespace test
{

struct OrchestratorEventsMock : public ::pairing::ConnectionOrchestrator::IEvents
{
    MOCK_METHOD(void,
        onStateChanged,
        (::pairing::ConnectionOrchestrator * session, ::pairing::SessionState state),
        (override));

    MOCK_METHOD(void,
        onDataChannelReady,
        (::pairing::ConnectionOrchestrator * session, std::shared_ptr<::pairing::DataChannel> channel),
        (override));

    MOCK_METHOD(void,
        onError,
        (::pairing::ConnectionOrchestrator * session, const ::pairing::ConnectionError& error),
        (override));
};

} // namespace test
