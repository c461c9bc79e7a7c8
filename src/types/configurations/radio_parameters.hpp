// src/types/configurations/radio_parameters.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "types/configurations/timeout.hpp"
#include "types/radio/radio_mode.hpp"

namespace subghz {

/**
 * @brief Oscillator kept running in standby
 */
enum class StandbyClock : uint8_t {
    kRc = 0x00,   ///< 13 MHz RC oscillator
    kXosc = 0x01  ///< 32 MHz crystal oscillator
};

/**
 * @brief SetSleep configuration
 */
struct SleepConfig {
    bool warm_start{true};    ///< Retain configuration while asleep
    bool rtc_wakeup{false};   ///< Wake up on RTC timeout

    uint8_t bits() const {
        return static_cast<uint8_t>((warm_start ? 0x04 : 0x00) |
                                    (rtc_wakeup ? 0x01 : 0x00));
    }
};

/**
 * @brief Power regulator used by the radio
 */
enum class RegulatorMode : uint8_t {
    kLdo = 0x00,
    kSmps = 0x01
};

/**
 * @brief Power amplifier ramp time
 */
enum class RampTime : uint8_t {
    kMicros10 = 0x00,
    kMicros20 = 0x01,
    kMicros40 = 0x02,
    kMicros80 = 0x03,
    kMicros200 = 0x04,
    kMicros800 = 0x05,
    kMicros1700 = 0x06,
    kMicros3400 = 0x07
};

/**
 * @brief Transmit power and ramp time for SetTxParams
 */
struct TxParams {
    static constexpr int8_t kMinPowerDbm = -17;
    static constexpr int8_t kMaxPowerDbm = 22;

    int8_t power_dbm{14};
    RampTime ramp_time{RampTime::kMicros40};

    bool IsValid() const {
        return power_dbm >= kMinPowerDbm && power_dbm <= kMaxPowerDbm;
    }

    std::vector<uint8_t> Encode() const {
        return {static_cast<uint8_t>(power_dbm),
                static_cast<uint8_t>(ramp_time)};
    }
};

/**
 * @brief Power amplifier selection
 */
enum class PaSelect : uint8_t {
    kHighPower = 0x00,
    kLowPower = 0x01
};

/**
 * @brief Power amplifier configuration for SetPaConfig
 */
struct PaConfig {
    uint8_t duty_cycle{0x04};
    uint8_t hp_max{0x00};
    PaSelect pa_select{PaSelect::kLowPower};

    /// Low power PA tuned for +14 dBm.
    static PaConfig LowPower() { return PaConfig{0x04, 0x00, PaSelect::kLowPower}; }

    /// High power PA tuned for +22 dBm.
    static PaConfig HighPower() {
        return PaConfig{0x04, 0x07, PaSelect::kHighPower};
    }

    std::vector<uint8_t> Encode() const {
        return {duty_cycle, hp_max, static_cast<uint8_t>(pa_select), 0x01};
    }
};

/**
 * @brief Number of symbols used for channel activity detection
 */
enum class CadSymbols : uint8_t {
    kOne = 0x00,
    kTwo = 0x01,
    kFour = 0x02,
    kEight = 0x03,
    kSixteen = 0x04
};

/**
 * @brief Mode entered once channel activity detection finishes
 */
enum class CadExitMode : uint8_t {
    kCadOnly = 0x00,  ///< Back to the fallback mode
    kCadRx = 0x01     ///< Stay in RX when activity was detected
};

/**
 * @brief Channel activity detection parameters
 */
struct CadParams {
    CadSymbols symbols{CadSymbols::kTwo};
    uint8_t detection_peak{0x18};
    uint8_t detection_min{0x10};
    CadExitMode exit_mode{CadExitMode::kCadOnly};
    Timeout timeout{};  ///< Only used with kCadRx

    std::vector<uint8_t> Encode() const;
};

/**
 * @brief Mode the radio falls back to after a packet operation
 */
enum class FallbackMode : uint8_t {
    kStandbyRc = 0x20,
    kStandbyXosc = 0x30,
    kFs = 0x40
};

inline radio::RadioMode FallbackToRadioMode(FallbackMode mode) {
    switch (mode) {
        case FallbackMode::kStandbyXosc:
            return radio::RadioMode::kStandbyXosc;
        case FallbackMode::kFs:
            return radio::RadioMode::kFs;
        case FallbackMode::kStandbyRc:
        default:
            return radio::RadioMode::kStandbyRc;
    }
}

/**
 * @brief Supply voltage for an external TCXO on DIO3
 */
enum class TcxoVoltage : uint8_t {
    kVolts1_6 = 0x00,
    kVolts1_7 = 0x01,
    kVolts1_8 = 0x02,
    kVolts2_2 = 0x03,
    kVolts2_4 = 0x04,
    kVolts2_7 = 0x05,
    kVolts3_0 = 0x06,
    kVolts3_3 = 0x07
};

/**
 * @brief TCXO supply and start-up delay for SetTcxoMode
 */
struct TcxoMode {
    TcxoVoltage voltage{TcxoVoltage::kVolts1_7};
    Timeout startup_timeout{Timeout::FromMillis(5)};

    std::vector<uint8_t> Encode() const;
};

/**
 * @brief Blocks selected in a Calibrate mask
 */
namespace calibration {
constexpr uint8_t kRc64k = 0x01;
constexpr uint8_t kRc13m = 0x02;
constexpr uint8_t kPll = 0x04;
constexpr uint8_t kAdcPulse = 0x08;
constexpr uint8_t kAdcBulkN = 0x10;
constexpr uint8_t kAdcBulkP = 0x20;
constexpr uint8_t kImage = 0x40;
constexpr uint8_t kAll = 0x7F;
}  // namespace calibration

/**
 * @brief Operational error bits reported by GetError
 */
namespace op_error {
constexpr uint16_t kRc64kCalibration = 0x0001;
constexpr uint16_t kRc13mCalibration = 0x0002;
constexpr uint16_t kPllCalibration = 0x0004;
constexpr uint16_t kAdcCalibration = 0x0008;
constexpr uint16_t kImageCalibration = 0x0010;
constexpr uint16_t kXoscStart = 0x0020;
constexpr uint16_t kPllLock = 0x0040;
constexpr uint16_t kPaRamp = 0x0100;
}  // namespace op_error

/**
 * @brief Power amplifier over-current protection limit
 */
enum class Ocp : uint8_t {
    kMax60mA = 0x18,   ///< Low power PA
    kMax140mA = 0x38   ///< High power PA
};

/**
 * @brief Register addresses reached through Read/WriteRegister
 */
namespace reg {
constexpr uint16_t kGenericSyncWord = 0x06C0;  ///< 8 bytes, MSB first
constexpr uint16_t kLoRaSyncWord = 0x0740;     ///< 2 bytes, MSB first
constexpr uint16_t kPaOcp = 0x08E7;
constexpr uint16_t kHseInTrim = 0x0911;  ///< Crystal load capacitance trim
constexpr uint8_t kMaxHseTrim = 0x2F;
}  // namespace reg

}  // namespace subghz
