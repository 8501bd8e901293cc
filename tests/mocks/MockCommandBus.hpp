#pragma once

#include "CommandBus.h"
#include <gmock/gmock.h>

/**
 * @brief gmock CommandBus for exact call-sequence expectations.
 *
 *   MockCommandBus bus;
 *   EXPECT_CALL(bus, call("sonos", "snapshot", _))
 *       .WillOnce(Return(CommandResult::failure("not a sonos speaker")));
 *
 * Use FakeCommandBus when the test needs devices with state instead.
 */
class MockCommandBus : public CommandBus {
public:
    MOCK_METHOD(CommandResult, call,
                (const std::string& domain, const std::string& action, const CommandParams& params),
                (override));
    MOCK_METHOD(bool, getState, (const std::string& deviceId, DeviceState& state), (override));
};
