// src/types/radio/status.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "radio_mode.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Chip mode field of the status byte (bits 6:4)
 */
enum class ChipMode : uint8_t {
    kUnknown,      ///< Reserved or undefined pattern
    kStandbyRc,    ///< 0x2
    kStandbyXosc,  ///< 0x3
    kFs,           ///< 0x4
    kRx,           ///< 0x5
    kTx            ///< 0x6
};

/**
 * @brief Command status field of the status byte (bits 3:1)
 */
enum class CommandStatus : uint8_t {
    kUnknown,                 ///< Reserved or undefined pattern
    kDataAvailable,           ///< 0x2, packet received and available
    kCommandTimeout,          ///< 0x3, command took too long
    kCommandProcessingError,  ///< 0x4, invalid opcode or parameters
    kExecutionFailure,        ///< 0x5, command could not be executed
    kTxDone                   ///< 0x6, transmission complete
};

/**
 * @brief Decoded status byte returned by every response command
 */
struct Status {
    CommandStatus command_status{CommandStatus::kUnknown};
    ChipMode chip_mode{ChipMode::kUnknown};
    uint8_t raw{0};

    /**
     * @brief Check whether the command status reports a failed command
     */
    bool IsCommandError() const {
        return command_status == CommandStatus::kCommandTimeout ||
               command_status == CommandStatus::kCommandProcessingError ||
               command_status == CommandStatus::kExecutionFailure;
    }

    bool operator==(const Status& other) const {
        return command_status == other.command_status &&
               chip_mode == other.chip_mode && raw == other.raw;
    }
    bool operator!=(const Status& other) const { return !(*this == other); }
};

/**
 * @brief Map a reported chip mode onto the driver's mode model
 *
 * @return std::optional<RadioMode> nullopt for kUnknown
 */
inline std::optional<RadioMode> ToRadioMode(ChipMode chip_mode) {
    switch (chip_mode) {
        case ChipMode::kStandbyRc:
            return RadioMode::kStandbyRc;
        case ChipMode::kStandbyXosc:
            return RadioMode::kStandbyXosc;
        case ChipMode::kFs:
            return RadioMode::kFs;
        case ChipMode::kRx:
            return RadioMode::kRx;
        case ChipMode::kTx:
            return RadioMode::kTx;
        default:
            return std::nullopt;
    }
}

inline const char* ChipModeToString(ChipMode mode) {
    switch (mode) {
        case ChipMode::kStandbyRc:
            return "StandbyRC";
        case ChipMode::kStandbyXosc:
            return "StandbyXOSC";
        case ChipMode::kFs:
            return "FS";
        case ChipMode::kRx:
            return "RX";
        case ChipMode::kTx:
            return "TX";
        default:
            return "Unknown";
    }
}

inline const char* CommandStatusToString(CommandStatus status) {
    switch (status) {
        case CommandStatus::kDataAvailable:
            return "DataAvailable";
        case CommandStatus::kCommandTimeout:
            return "CommandTimeout";
        case CommandStatus::kCommandProcessingError:
            return "CommandProcessingError";
        case CommandStatus::kExecutionFailure:
            return "ExecutionFailure";
        case CommandStatus::kTxDone:
            return "TxDone";
        default:
            return "Unknown";
    }
}

}  // namespace radio
}  // namespace subghz
