// src/types/radio/radio_mode.hpp
#pragma once

#include <cstdint>

namespace subghz {
namespace radio {

/**
 * @brief Operating modes of the sub-GHz transceiver
 *
 * Values are bit positions so that sets of modes fit in a RadioModeMask.
 */
enum class RadioMode : uint8_t {
    kSleep = 0,        ///< Sleep, configuration retained only on warm start
    kStandbyRc = 1,    ///< Standby on the 13 MHz RC oscillator
    kStandbyXosc = 2,  ///< Standby on the 32 MHz crystal oscillator
    kFs = 3,           ///< Frequency synthesis, PLL locked
    kRx = 4,           ///< Receiving (also used while CAD runs)
    kTx = 5            ///< Transmitting
};

/// Number of RadioMode values.
constexpr uint8_t kRadioModeCount = 6;

/// Bitset over RadioMode values.
using RadioModeMask = uint8_t;

/**
 * @brief Get the mask bit for a single mode
 */
constexpr RadioModeMask ModeBit(RadioMode mode) {
    return static_cast<RadioModeMask>(1U << static_cast<uint8_t>(mode));
}

constexpr RadioModeMask kStandbyModes =
    ModeBit(RadioMode::kStandbyRc) | ModeBit(RadioMode::kStandbyXosc);
constexpr RadioModeMask kAwakeModes = kStandbyModes |
                                      ModeBit(RadioMode::kFs) |
                                      ModeBit(RadioMode::kRx) |
                                      ModeBit(RadioMode::kTx);
constexpr RadioModeMask kAllModes = kAwakeModes | ModeBit(RadioMode::kSleep);

/**
 * @brief Converts a RadioMode to its string representation
 */
inline const char* RadioModeToString(RadioMode mode) {
    switch (mode) {
        case RadioMode::kSleep:
            return "Sleep";
        case RadioMode::kStandbyRc:
            return "StandbyRC";
        case RadioMode::kStandbyXosc:
            return "StandbyXOSC";
        case RadioMode::kFs:
            return "FS";
        case RadioMode::kRx:
            return "RX";
        case RadioMode::kTx:
            return "TX";
        default:
            return "Unknown";
    }
}

}  // namespace radio
}  // namespace subghz
