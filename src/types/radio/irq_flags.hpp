// src/types/radio/irq_flags.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace subghz {
namespace radio {

/**
 * @brief Packet-lifecycle events, by bit position in the IRQ register
 *
 * kErr and kCrcErr name the same register bit: the hardware raises it for
 * CRC failures while receiving and for packet errors otherwise.
 */
enum class IrqEvent : uint8_t {
    kTxDone = 0,
    kRxDone = 1,
    kPreambleDetected = 2,
    kSyncDetected = 3,
    kHeaderValid = 4,
    kHeaderErr = 5,
    kCrcErr = 6,
    kErr = kCrcErr,
    kCadDone = 7,
    kCadDetected = 8,
    kTimeout = 9
};

const char* IrqEventToString(IrqEvent event);

/**
 * @brief Bitset over IrqEvent values
 *
 * Mirrors the 16-bit interrupt register. Produced by reading the register,
 * consumed by clearing an explicit mask.
 */
class IrqFlags {
   public:
    constexpr IrqFlags() : bits_(0) {}
    constexpr explicit IrqFlags(uint16_t bits) : bits_(bits) {}

    /**
     * @brief Flags containing a single event
     */
    static constexpr IrqFlags Of(IrqEvent event) {
        return IrqFlags(static_cast<uint16_t>(1U << static_cast<uint8_t>(event)));
    }

    /**
     * @brief Flags with every defined event set
     */
    static constexpr IrqFlags All() { return IrqFlags(0x03FF); }

    constexpr uint16_t bits() const { return bits_; }
    constexpr bool empty() const { return bits_ == 0; }

    constexpr bool Has(IrqEvent event) const {
        return (bits_ & Of(event).bits_) != 0;
    }

    constexpr bool HasAny(IrqFlags other) const {
        return (bits_ & other.bits_) != 0;
    }

    IrqFlags& Set(IrqEvent event) {
        bits_ |= Of(event).bits_;
        return *this;
    }

    constexpr IrqFlags Without(IrqFlags other) const {
        return IrqFlags(static_cast<uint16_t>(bits_ & ~other.bits_));
    }

    /**
     * @brief List the named events present, in bit order
     */
    std::vector<IrqEvent> Events() const;

    /**
     * @brief Human readable list, e.g. "TxDone|Timeout"
     */
    std::string ToString() const;

    constexpr IrqFlags operator|(IrqFlags other) const {
        return IrqFlags(static_cast<uint16_t>(bits_ | other.bits_));
    }
    constexpr IrqFlags operator&(IrqFlags other) const {
        return IrqFlags(static_cast<uint16_t>(bits_ & other.bits_));
    }
    IrqFlags& operator|=(IrqFlags other) {
        bits_ |= other.bits_;
        return *this;
    }
    constexpr bool operator==(IrqFlags other) const {
        return bits_ == other.bits_;
    }
    constexpr bool operator!=(IrqFlags other) const {
        return bits_ != other.bits_;
    }

   private:
    uint16_t bits_;
};

constexpr IrqFlags operator|(IrqEvent lhs, IrqEvent rhs) {
    return IrqFlags::Of(lhs) | IrqFlags::Of(rhs);
}

constexpr IrqFlags operator|(IrqFlags lhs, IrqEvent rhs) {
    return lhs | IrqFlags::Of(rhs);
}

}  // namespace radio
}  // namespace subghz
