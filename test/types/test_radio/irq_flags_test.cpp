// test/types/test_radio/irq_flags_test.cpp
#include <gtest/gtest.h>

#include "types/radio/irq_flags.hpp"

namespace subghz {
namespace radio {
namespace test {

TEST(IrqFlagsTest, BitPositions) {
    EXPECT_EQ(IrqFlags::Of(IrqEvent::kTxDone).bits(), 0x0001);
    EXPECT_EQ(IrqFlags::Of(IrqEvent::kCrcErr).bits(), 0x0040);
    EXPECT_EQ(IrqFlags::Of(IrqEvent::kErr).bits(), 0x0040);
    EXPECT_EQ(IrqFlags::Of(IrqEvent::kCadDetected).bits(), 0x0100);
    EXPECT_EQ(IrqFlags::Of(IrqEvent::kTimeout).bits(), 0x0200);
    EXPECT_EQ(IrqFlags::All().bits(), 0x03FF);
}

TEST(IrqFlagsTest, SetOperations) {
    IrqFlags flags = IrqEvent::kRxDone | IrqEvent::kCrcErr;
    EXPECT_TRUE(flags.Has(IrqEvent::kRxDone));
    EXPECT_FALSE(flags.Has(IrqEvent::kTxDone));
    EXPECT_TRUE(flags.HasAny(IrqEvent::kTxDone | IrqEvent::kCrcErr));

    IrqFlags rest = flags.Without(IrqFlags::Of(IrqEvent::kRxDone));
    EXPECT_EQ(rest, IrqFlags::Of(IrqEvent::kCrcErr));
    EXPECT_TRUE(IrqFlags().empty());
}

TEST(IrqFlagsTest, ToStringListsEvents) {
    EXPECT_EQ(IrqFlags().ToString(), "None");
    EXPECT_EQ((IrqEvent::kTxDone | IrqEvent::kTimeout).ToString(),
              "TxDone|Timeout");
    EXPECT_EQ(IrqFlags(0x4001).ToString(), "TxDone|0x4000");

    std::vector<IrqEvent> events = IrqFlags(0x0081).Events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], IrqEvent::kTxDone);
    EXPECT_EQ(events[1], IrqEvent::kCadDone);
}

}  // namespace test
}  // namespace radio
}  // namespace subghz
