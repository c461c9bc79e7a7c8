// src/radio/status_decoder.hpp
#pragma once

#include <cstdint>

#include "types/radio/status.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Decoder for the status byte returned by every response command
 *
 * Bits 6:4 carry the chip mode, bits 3:1 the command status. Bit patterns
 * with no defined meaning decode to the kUnknown variants; decoding never
 * fails.
 */
class StatusDecoder {
   public:
    static constexpr uint8_t kChipModeShift = 4;
    static constexpr uint8_t kCommandStatusShift = 1;
    static constexpr uint8_t kFieldMask = 0x07;

    /**
     * @brief Decode one status byte
     *
     * @param byte Raw status byte
     * @return Status Decoded command status and chip mode
     */
    static Status Decode(uint8_t byte);

    static ChipMode DecodeChipMode(uint8_t bits);

    static CommandStatus DecodeCommandStatus(uint8_t bits);
};

}  // namespace radio
}  // namespace subghz
