// src/types/configurations/timeout.hpp
#pragma once

#include <cstdint>

namespace subghz {

/**
 * @brief Radio timer value, counted in steps of 15.625 µs
 *
 * Encoded on the bus as a 24-bit big-endian field. For SetRx the value 0
 * means single reception without timeout and 0xFFFFFF means continuous
 * reception.
 */
class Timeout {
   public:
    static constexpr uint32_t kMaxBits = 0xFFFFFF;
    static constexpr uint32_t kStepsPerMillisecond = 64;

    constexpr Timeout() : bits_(0) {}

    /**
     * @brief Timeout disabled (single shot, wait indefinitely)
     */
    static constexpr Timeout Disabled() { return Timeout(0); }

    /**
     * @brief Continuous reception, the receiver stays on after each packet
     */
    static constexpr Timeout Continuous() { return Timeout(kMaxBits); }

    /**
     * @brief Timeout from a raw step count, saturated to 24 bits
     */
    static constexpr Timeout FromBits(uint32_t bits) {
        return Timeout(bits > kMaxBits ? kMaxBits : bits);
    }

    /**
     * @brief Timeout from milliseconds, saturated to the largest finite value
     */
    static constexpr Timeout FromMillis(uint32_t ms) {
        return ms > (kMaxBits - 1) / kStepsPerMillisecond
                   ? Timeout(kMaxBits - 1)
                   : Timeout(ms * kStepsPerMillisecond);
    }

    /**
     * @brief Timeout from microseconds, rounded up to the next step
     */
    static constexpr Timeout FromMicros(uint64_t us) {
        return FromStepsSaturated((us * 64 + 999) / 1000);
    }

    constexpr uint32_t bits() const { return bits_; }

    /**
     * @brief Duration in milliseconds, rounded down
     */
    constexpr uint32_t ToMillis() const { return bits_ / kStepsPerMillisecond; }

    constexpr bool IsDisabled() const { return bits_ == 0; }
    constexpr bool IsContinuous() const { return bits_ == kMaxBits; }

    constexpr bool operator==(const Timeout& other) const {
        return bits_ == other.bits_;
    }
    constexpr bool operator!=(const Timeout& other) const {
        return bits_ != other.bits_;
    }

   private:
    constexpr explicit Timeout(uint32_t bits) : bits_(bits) {}

    static constexpr Timeout FromStepsSaturated(uint64_t steps) {
        return steps >= kMaxBits ? Timeout(kMaxBits - 1)
                                 : Timeout(static_cast<uint32_t>(steps));
    }

    uint32_t bits_;
};

}  // namespace subghz
