// test/types/test_radio/packet_status_test.cpp
#include <gtest/gtest.h>

#include "types/radio/packet_status.hpp"

namespace subghz {
namespace radio {
namespace test {

TEST(PacketStatusTest, DecodesLoRa) {
    PacketStatus status =
        PacketStatus::Decode(PacketType::kLoRa, {0xA4, 0x50, 0xF8, 0x52});
    EXPECT_EQ(status.packet_type, PacketType::kLoRa);
    EXPECT_FLOAT_EQ(status.rssi_dbm, -40.0F);
    EXPECT_FLOAT_EQ(status.snr_db, -2.0F);
    EXPECT_FLOAT_EQ(status.signal_rssi_dbm, -41.0F);
}

TEST(PacketStatusTest, DecodesGfsk) {
    PacketStatus status =
        PacketStatus::Decode(PacketType::kGfsk, {0xA4, 0x01, 0x64, 0x66});
    EXPECT_EQ(status.rx_status, 0x01);
    EXPECT_FLOAT_EQ(status.rssi_dbm, -50.0F);
    EXPECT_FLOAT_EQ(status.signal_rssi_dbm, -51.0F);
    EXPECT_FLOAT_EQ(status.snr_db, 0.0F);
}

TEST(PacketStatusTest, ShortResponseDecodesToZeros) {
    PacketStatus status = PacketStatus::Decode(PacketType::kLoRa, {0xA4});
    EXPECT_FLOAT_EQ(status.rssi_dbm, 0.0F);
}

}  // namespace test
}  // namespace radio
}  // namespace subghz
