/**
 * @file byte_operations.h
 * @brief Helper classes for command payload serialization and response parsing
 * @details Multi-byte fields on the command bus are big-endian.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>

#include "types/error_codes/result.hpp"

namespace subghz {
namespace utils {

/**
  * @brief Helper class for serializing data into a byte buffer
  * @details Provides methods to write different types of data into a provided buffer.
  * The buffer must already be sized for everything that is written.
  */
class ByteSerializer {
   public:
    /**
      * @brief Constructs a ByteSerializer with a buffer and optional offset
      * @param buffer Reference to the buffer where data will be written
      * @param offset Starting position in the buffer (default: 0)
      */
    explicit ByteSerializer(std::vector<uint8_t>& buffer, size_t offset = 0)
        : buffer_(buffer), offset_(offset) {}

    /**
      * @brief Writes an 8-bit unsigned integer to the buffer
      * @param value The value to write
      */
    void WriteUint8(uint8_t value) { buffer_[offset_++] = value; }

    /**
      * @brief Writes a 16-bit unsigned integer to the buffer
      * @param value The value to write
      * @note Writes in big-endian format
      */
    void WriteUint16(uint16_t value) {
        buffer_[offset_++] = (value >> 8) & 0xFF;
        buffer_[offset_++] = value & 0xFF;
    }

    /**
      * @brief Writes the low 24 bits of a value to the buffer
      * @param value The value to write
      * @note Writes in big-endian format
      */
    void WriteUint24(uint32_t value) {
        buffer_[offset_++] = (value >> 16) & 0xFF;
        buffer_[offset_++] = (value >> 8) & 0xFF;
        buffer_[offset_++] = value & 0xFF;
    }

    /**
      * @brief Writes a 32-bit unsigned integer to the buffer
      * @param value The value to write
      * @note Writes in big-endian format
      */
    void WriteUint32(uint32_t value) {
        buffer_[offset_++] = (value >> 24) & 0xFF;
        buffer_[offset_++] = (value >> 16) & 0xFF;
        buffer_[offset_++] = (value >> 8) & 0xFF;
        buffer_[offset_++] = value & 0xFF;
    }

    /**
      * @brief Writes an array of bytes to the buffer
      * @param data Pointer to the data to write
      * @param length Number of bytes to write
      */
    void WriteBytes(const uint8_t* data, size_t length) {
        if (length == 0) {
            return;
        }
        std::memcpy(&buffer_[offset_], data, length);
        offset_ += length;
    }

    /**
      * @brief Gets the current offset in the buffer
      * @return Current position in the buffer
      */
    size_t getOffset() const { return offset_; }

   private:
    std::vector<uint8_t>& buffer_;  ///< Reference to the target buffer
    size_t offset_;                 ///< Current position in the buffer
};

/**
  * @brief Helper class for deserializing data from a byte buffer
  * @details Provides methods to read different types of data from a provided buffer
  */
class ByteDeserializer {
   public:
    /**
      * @brief Constructs a ByteDeserializer with a buffer
      * @param buffer Reference to the buffer to read from
      * @param offset Starting position in the buffer (default: 0)
      */
    explicit ByteDeserializer(const std::vector<uint8_t>& buffer,
                              size_t offset = 0)
        : buffer_(buffer), offset_(offset) {}

    /**
      * @brief Reads an 8-bit unsigned integer from the buffer
      * @return The read value if successful, std::nullopt otherwise
      */
    std::optional<uint8_t> ReadUint8() {
        Result result = CheckAvailable(1);
        if (!result.IsSuccess()) {
            return std::nullopt;
        }
        return buffer_[offset_++];
    }

    /**
      * @brief Reads a 16-bit unsigned integer from the buffer
      * @return The read value if successful, std::nullopt otherwise
      * @note Reads in big-endian format
      */
    std::optional<uint16_t> ReadUint16() {
        Result result = CheckAvailable(2);
        if (!result.IsSuccess()) {
            return std::nullopt;
        }
        uint16_t value =
            static_cast<uint16_t>((static_cast<uint16_t>(buffer_[offset_])
                                   << 8) |
                                  buffer_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    /**
      * @brief Reads a sequence of bytes from the buffer
      * @param length Number of bytes to read
      * @return Vector containing the read bytes if successful, std::nullopt otherwise
      */
    std::optional<std::vector<uint8_t>> ReadBytes(size_t length) {
        Result result = CheckAvailable(length);
        if (!result.IsSuccess()) {
            return std::nullopt;
        }
        std::vector<uint8_t> vec_result(buffer_.begin() + offset_,
                                        buffer_.begin() + offset_ + length);
        offset_ += length;
        return vec_result;
    }

    /**
      * @brief Gets the number of unread bytes in the buffer
      * @return Number of remaining bytes
      */
    size_t getBytesLeft() const {
        return offset_ < buffer_.size() ? buffer_.size() - offset_ : 0;
    }

   private:
    /**
      * @brief Checks if the requested number of bytes is available
      * @param bytes Number of bytes to check
      * @return Result indicating if the bytes are available
      */
    Result CheckAvailable(size_t bytes) const {
        if (offset_ + bytes > buffer_.size()) {
            return Result::Error(SubGhzErrorCode::kBufferOverflow);
        }
        return Result::Success();
    }

    const std::vector<uint8_t>& buffer_;  ///< Reference to the source buffer
    size_t offset_;                       ///< Current position in the buffer
};

}  // namespace utils
}  // namespace subghz
