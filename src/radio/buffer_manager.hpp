// src/radio/buffer_manager.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "radio/command_channel.hpp"
#include "types/error_codes/result.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Bounds-checked access to the on-chip packet buffer
 *
 * The buffer is a single region of fixed capacity shared by transmit and
 * receive. Its contents move through WriteBuffer and ReadBuffer commands;
 * this class validates every offset and length against the capacity
 * before any command is sent and keeps the base addresses the radio uses.
 *
 * Invariant: tx_base + max_payload_length <= capacity, same for rx_base.
 */
class BufferManager {
   public:
    /**
     * @param channel Channel the buffer commands are sent on
     * @param capacity Buffer size in bytes, at most 256
     */
    BufferManager(ICommandChannel& channel, size_t capacity);

    /**
     * @brief Set the base addresses of the TX and RX regions
     *
     * Keeps the current max payload length.
     *
     * @return Result kBufferOverflow if a region would end past the
     * capacity, otherwise the command result
     */
    Result SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base);

    /**
     * @brief Set the base addresses and the max payload length together
     *
     * The invariant is checked against the new length, so a base can move
     * up as long as the payload room shrinks with it. Nothing changes if
     * the command fails.
     *
     * @return Result kBufferOverflow if a region would end past the
     * capacity, otherwise the command result
     */
    Result SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base,
                                size_t max_payload_length);

    /**
     * @brief Set the largest payload either region must hold
     *
     * @return Result kBufferOverflow if the invariant would not hold
     */
    Result SetMaxPayloadLength(size_t length);

    /**
     * @brief Write bytes into the buffer
     *
     * @param offset Offset of the first byte
     * @param data Bytes to write
     * @return Result kBufferOverflow if offset + size exceeds the capacity
     */
    Result WritePayload(size_t offset, const std::vector<uint8_t>& data);

    /**
     * @brief Read bytes from the buffer
     *
     * @param offset Offset of the first byte
     * @param length Number of bytes to read
     * @param data Receives the bytes
     * @return Result kBufferOverflow if offset + length exceeds the capacity
     */
    Result ReadPayload(size_t offset, size_t length,
                       std::vector<uint8_t>* data);

    /**
     * @brief Check a range against the capacity without sending anything
     */
    bool Fits(size_t offset, size_t length) const {
        return offset <= capacity_ && length <= capacity_ - offset;
    }

    uint8_t getTxBaseAddress() const { return tx_base_; }
    uint8_t getRxBaseAddress() const { return rx_base_; }
    size_t getMaxPayloadLength() const { return max_payload_length_; }
    size_t getCapacity() const { return capacity_; }

   private:
    ICommandChannel& channel_;
    size_t capacity_;
    uint8_t tx_base_{0};
    uint8_t rx_base_{0};
    size_t max_payload_length_{0};
};

}  // namespace radio
}  // namespace subghz
