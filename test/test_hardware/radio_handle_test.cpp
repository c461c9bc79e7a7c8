// test/test_hardware/radio_handle_test.cpp
#include <gtest/gtest.h>

#include "../mocks/simulated_subghz.hpp"
#include "hardware/radio_handle.hpp"

namespace subghz {
namespace hardware {
namespace test {

using ::subghz::test::SimulatedSubGhz;

TEST(RadioHandleTest, OnlyOneHandleAtATime) {
    SimulatedSubGhz chip;
    ASSERT_FALSE(RadioHandle::IsHeld());

    std::unique_ptr<RadioHandle> first = RadioHandle::Acquire(chip);
    ASSERT_NE(first, nullptr);
    EXPECT_TRUE(RadioHandle::IsHeld());
    EXPECT_EQ(&first->getTransport(), &chip);

    SimulatedSubGhz other;
    EXPECT_EQ(RadioHandle::Acquire(chip), nullptr);
    EXPECT_EQ(RadioHandle::Acquire(other), nullptr);
    EXPECT_TRUE(RadioHandle::IsHeld());
}

TEST(RadioHandleTest, ReleasedHandleCanBeAcquiredAgain) {
    SimulatedSubGhz chip;
    {
        std::unique_ptr<RadioHandle> handle = RadioHandle::Acquire(chip);
        ASSERT_NE(handle, nullptr);
    }
    EXPECT_FALSE(RadioHandle::IsHeld());

    std::unique_ptr<RadioHandle> again = RadioHandle::Acquire(chip);
    EXPECT_NE(again, nullptr);
    again.reset();
    EXPECT_FALSE(RadioHandle::IsHeld());
}

}  // namespace test
}  // namespace hardware
}  // namespace subghz
