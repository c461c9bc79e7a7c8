// test/test_radio/buffer_manager_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../mocks/mock_command_channel.hpp"
#include "radio/buffer_manager.hpp"

namespace subghz {
namespace radio {
namespace test {

using ::subghz::test::HasOpcode;
using ::subghz::test::IsCommand;
using ::subghz::test::MockCommandChannel;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace {

/**
 * @brief Channel backed by a plain byte array, counting transactions
 */
class ArrayChannel : public ICommandChannel {
   public:
    Result Execute(const Command& command,
                   std::vector<uint8_t>* response) override {
        ++transactions;
        const std::vector<uint8_t>& payload = command.getPayload();
        if (command.getOpcode() == Opcode::kWriteBuffer) {
            for (size_t i = 1; i < payload.size(); ++i) {
                memory[(payload[0] + i - 1) & 0xFF] = payload[i];
            }
        } else if (command.getOpcode() == Opcode::kReadBuffer) {
            response->assign(1, 0xA2);
            for (size_t i = 0; i + 1 < command.getResponseLength(); ++i) {
                response->push_back(memory[(payload[0] + i) & 0xFF]);
            }
        }
        return Result::Success();
    }

    uint8_t memory[256] = {};
    size_t transactions{0};
};

}  // namespace

TEST(BufferManagerTest, WriteThenReadBack) {
    ArrayChannel channel;
    BufferManager buffers(channel, 256);

    ASSERT_TRUE(buffers.WritePayload(0x10, {0xDE, 0xAD, 0xBE, 0xEF}));
    std::vector<uint8_t> data;
    ASSERT_TRUE(buffers.ReadPayload(0x11, 2, &data));
    EXPECT_EQ(data, (std::vector<uint8_t>{0xAD, 0xBE}));
}

TEST(BufferManagerTest, WholeBufferFitsAtOffsetZero) {
    ArrayChannel channel;
    BufferManager buffers(channel, 256);

    std::vector<uint8_t> payload(256);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i);
    }
    ASSERT_TRUE(buffers.WritePayload(0, payload));

    std::vector<uint8_t> data;
    ASSERT_TRUE(buffers.ReadPayload(0, 256, &data));
    EXPECT_EQ(data, payload);
}

TEST(BufferManagerTest, RangeCheckMatchesCapacity) {
    for (size_t capacity : {0u, 1u, 256u}) {
        ArrayChannel channel;
        BufferManager buffers(channel, capacity);

        for (size_t offset = 0; offset <= 257; ++offset) {
            for (size_t length : {size_t(0), size_t(1), size_t(2),
                                  capacity, capacity + 1}) {
                bool fits = offset + length <= capacity;
                size_t before = channel.transactions;

                std::vector<uint8_t> data;
                Result result = buffers.ReadPayload(offset, length, &data);
                EXPECT_EQ(result.IsSuccess(), fits)
                    << "capacity " << capacity << " offset " << offset
                    << " length " << length;
                if (!fits) {
                    EXPECT_EQ(result.getErrorCode(),
                              SubGhzErrorCode::kBufferOverflow);
                    EXPECT_EQ(channel.transactions, before);
                } else {
                    EXPECT_EQ(data.size(), length);
                }

                result = buffers.WritePayload(
                    offset, std::vector<uint8_t>(length, 0x55));
                EXPECT_EQ(result.IsSuccess(), fits);
            }
        }
    }
}

TEST(BufferManagerTest, EmptyTransfersSendNothing) {
    ::testing::StrictMock<MockCommandChannel> channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel, Execute(_, _)).Times(0);

    std::vector<uint8_t> data{0x01};
    EXPECT_TRUE(buffers.WritePayload(256, {}));
    EXPECT_TRUE(buffers.ReadPayload(256, 0, &data));
    EXPECT_TRUE(data.empty());
}

TEST(BufferManagerTest, ShortResponseIsTransportError) {
    MockCommandChannel channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel, Execute(HasOpcode(Opcode::kReadBuffer), _))
        .WillOnce(DoAll(SetArgPointee<1>(std::vector<uint8_t>{0xA2, 0x01}),
                        Return(Result::Success())));

    std::vector<uint8_t> data;
    Result result = buffers.ReadPayload(0, 4, &data);
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kTransportError);
}

TEST(BufferManagerTest, ChannelErrorsPropagate) {
    MockCommandChannel channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel, Execute(HasOpcode(Opcode::kWriteBuffer), _))
        .WillOnce(Return(Result::Error(SubGhzErrorCode::kIllegalTransition)));

    Result result = buffers.WritePayload(0, {0x01});
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kIllegalTransition);
}

TEST(BufferManagerTest, BaseAddressesKeepPayloadRoom) {
    MockCommandChannel channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel,
                Execute(IsCommand(Opcode::kSetBufferBaseAddress,
                                  std::vector<uint8_t>({0x00, 0x80})),
                        _))
        .WillOnce(Return(Result::Success()));

    ASSERT_TRUE(buffers.SetBufferBaseAddress(0x00, 0x80));
    EXPECT_EQ(buffers.getTxBaseAddress(), 0x00);
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x80);

    EXPECT_TRUE(buffers.SetMaxPayloadLength(128));
    EXPECT_EQ(buffers.getMaxPayloadLength(), 128u);
    EXPECT_EQ(buffers.SetMaxPayloadLength(129).getErrorCode(),
              SubGhzErrorCode::kBufferOverflow);

    // With 128-byte payloads, a base of 0xC0 would overrun the buffer
    EXPECT_EQ(buffers.SetBufferBaseAddress(0x00, 0xC0).getErrorCode(),
              SubGhzErrorCode::kBufferOverflow);
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x80);
}

TEST(BufferManagerTest, RebaseChecksNewPayloadLength) {
    MockCommandChannel channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel, Execute(HasOpcode(Opcode::kSetBufferBaseAddress), _))
        .Times(3)
        .WillRepeatedly(Return(Result::Success()));

    ASSERT_TRUE(buffers.SetBufferBaseAddress(0x00, 0x00, 255));
    EXPECT_EQ(buffers.getMaxPayloadLength(), 255u);

    // Upward: only legal because the payload room shrinks with it
    ASSERT_TRUE(buffers.SetBufferBaseAddress(0x00, 0x80, 128));
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x80);
    EXPECT_EQ(buffers.getMaxPayloadLength(), 128u);

    EXPECT_EQ(buffers.SetBufferBaseAddress(0x00, 0x81, 128).getErrorCode(),
              SubGhzErrorCode::kBufferOverflow);
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x80);
    EXPECT_EQ(buffers.getMaxPayloadLength(), 128u);

    // Downward keeps or grows the room
    ASSERT_TRUE(buffers.SetBufferBaseAddress(0x00, 0x40, 192));
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x40);
    EXPECT_EQ(buffers.getMaxPayloadLength(), 192u);
}

TEST(BufferManagerTest, FailedRebaseKeepsState) {
    MockCommandChannel channel;
    BufferManager buffers(channel, 256);
    EXPECT_CALL(channel, Execute(HasOpcode(Opcode::kSetBufferBaseAddress), _))
        .WillOnce(Return(Result::Success()))
        .WillOnce(Return(Result::Error(SubGhzErrorCode::kBusTimeout)));

    ASSERT_TRUE(buffers.SetBufferBaseAddress(0x00, 0x80, 128));
    Result result = buffers.SetBufferBaseAddress(0x00, 0xC0, 64);
    EXPECT_EQ(result.getErrorCode(), SubGhzErrorCode::kBusTimeout);
    EXPECT_EQ(buffers.getRxBaseAddress(), 0x80);
    EXPECT_EQ(buffers.getMaxPayloadLength(), 128u);
}

}  // namespace test
}  // namespace radio
}  // namespace subghz
