// test/test_hardware/hal_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../mocks/mock_bus_transport.hpp"
#include "../mocks/mock_hal.hpp"
#include "radio/command_bus.hpp"
#include "subghz.hpp"

namespace subghz {
namespace hal {
namespace test {

using ::subghz::test::MockBusTransport;
using ::subghz::test::MockHal;
using ::testing::AnyNumber;
using ::testing::Return;

TEST(HalTest, FactoryCreatesPlatformHal) {
    std::unique_ptr<IHal> hal = HalFactory::createHal();
    ASSERT_NE(hal, nullptr);

    uint32_t before = hal->millis();
    hal->delay(5);
    EXPECT_GE(hal->millis() - before, 5u);
}

TEST(HalTest, BusyBoundFollowsHalClock) {
    ::testing::NiceMock<MockBusTransport> transport;
    MockHal hal;
    radio::CommandBus bus(transport, hal, 50);

    ON_CALL(transport, IsBusy()).WillByDefault(Return(true));
    EXPECT_CALL(hal, millis())
        .WillOnce(Return(1000))
        .WillOnce(Return(1020))
        .WillOnce(Return(1050));
    EXPECT_CALL(hal, delay(1)).Times(AnyNumber());
    EXPECT_CALL(transport, Select()).Times(0);

    Result result = bus.Execute(commands::SetFs(), nullptr);
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kBusTimeout);
}

}  // namespace test
}  // namespace hal
}  // namespace subghz
