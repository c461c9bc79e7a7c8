// src/types/configurations/rf_frequency.hpp
#pragma once

#include <cstdint>

namespace subghz {

/**
 * @brief Carrier frequency in the synthesizer's register format
 *
 * bits = hz * 2^25 / 32 MHz
 */
class RfFrequency {
   public:
    static constexpr uint32_t kXtalHz = 32000000;
    static constexpr uint32_t kMinHz = 150000000;
    static constexpr uint32_t kMaxHz = 960000000;

    static constexpr RfFrequency FromHz(uint32_t hz) {
        return RfFrequency(hz, static_cast<uint32_t>(
                                   (static_cast<uint64_t>(hz) << 25) / kXtalHz));
    }

    static constexpr bool IsInRange(uint32_t hz) {
        return hz >= kMinHz && hz <= kMaxHz;
    }

    constexpr uint32_t hz() const { return hz_; }
    constexpr uint32_t bits() const { return bits_; }

   private:
    constexpr RfFrequency(uint32_t hz, uint32_t bits) : hz_(hz), bits_(bits) {}

    uint32_t hz_;
    uint32_t bits_;
};

}  // namespace subghz
