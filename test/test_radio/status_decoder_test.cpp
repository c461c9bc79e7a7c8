// test/test_radio/status_decoder_test.cpp
#include <gtest/gtest.h>

#include "radio/status_decoder.hpp"

namespace subghz {
namespace radio {
namespace test {

TEST(StatusDecoderTest, DecodesKnownPatterns) {
    Status status = StatusDecoder::Decode(0x2C);  // StandbyRC, TxDone
    EXPECT_EQ(status.chip_mode, ChipMode::kStandbyRc);
    EXPECT_EQ(status.command_status, CommandStatus::kTxDone);
    EXPECT_EQ(status.raw, 0x2C);
    EXPECT_FALSE(status.IsCommandError());

    status = StatusDecoder::Decode(0x54);  // RX, DataAvailable
    EXPECT_EQ(status.chip_mode, ChipMode::kRx);
    EXPECT_EQ(status.command_status, CommandStatus::kDataAvailable);

    status = StatusDecoder::Decode(0x6A);  // TX, ExecutionFailure
    EXPECT_EQ(status.chip_mode, ChipMode::kTx);
    EXPECT_EQ(status.command_status, CommandStatus::kExecutionFailure);
    EXPECT_TRUE(status.IsCommandError());
}

TEST(StatusDecoderTest, ReservedPatternsDecodeToUnknown) {
    for (uint8_t bits : {0x0, 0x1, 0x7}) {
        EXPECT_EQ(StatusDecoder::DecodeChipMode(bits), ChipMode::kUnknown);
        EXPECT_EQ(StatusDecoder::DecodeCommandStatus(bits),
                  CommandStatus::kUnknown);
    }
}

TEST(StatusDecoderTest, TotalOverEveryByte) {
    for (int byte = 0; byte <= 0xFF; ++byte) {
        Status status = StatusDecoder::Decode(static_cast<uint8_t>(byte));
        EXPECT_EQ(status.raw, byte);

        uint8_t mode_bits = (byte >> 4) & 0x07;
        uint8_t command_bits = (byte >> 1) & 0x07;
        bool mode_defined = mode_bits >= 0x2 && mode_bits <= 0x6;
        bool command_defined = command_bits >= 0x2 && command_bits <= 0x6;
        EXPECT_EQ(status.chip_mode != ChipMode::kUnknown, mode_defined)
            << "byte " << byte;
        EXPECT_EQ(status.command_status != CommandStatus::kUnknown,
                  command_defined)
            << "byte " << byte;

        // Bits 7 and 0 are reserved and never change the decoding
        Status masked =
            StatusDecoder::Decode(static_cast<uint8_t>(byte & 0x7E));
        EXPECT_EQ(status.chip_mode, masked.chip_mode);
        EXPECT_EQ(status.command_status, masked.command_status);
    }
}

TEST(StatusDecoderTest, ChipModeMapsOntoRadioMode) {
    EXPECT_EQ(ToRadioMode(ChipMode::kStandbyXosc), RadioMode::kStandbyXosc);
    EXPECT_EQ(ToRadioMode(ChipMode::kFs), RadioMode::kFs);
    EXPECT_FALSE(ToRadioMode(ChipMode::kUnknown).has_value());
}

}  // namespace test
}  // namespace radio
}  // namespace subghz
