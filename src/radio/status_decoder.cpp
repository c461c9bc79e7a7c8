#include "status_decoder.hpp"

namespace subghz {
namespace radio {

Status StatusDecoder::Decode(uint8_t byte) {
    Status status;
    status.raw = byte;
    status.chip_mode = DecodeChipMode((byte >> kChipModeShift) & kFieldMask);
    status.command_status =
        DecodeCommandStatus((byte >> kCommandStatusShift) & kFieldMask);
    return status;
}

ChipMode StatusDecoder::DecodeChipMode(uint8_t bits) {
    switch (bits) {
        case 0x2:
            return ChipMode::kStandbyRc;
        case 0x3:
            return ChipMode::kStandbyXosc;
        case 0x4:
            return ChipMode::kFs;
        case 0x5:
            return ChipMode::kRx;
        case 0x6:
            return ChipMode::kTx;
        default:
            return ChipMode::kUnknown;
    }
}

CommandStatus StatusDecoder::DecodeCommandStatus(uint8_t bits) {
    switch (bits) {
        case 0x2:
            return CommandStatus::kDataAvailable;
        case 0x3:
            return CommandStatus::kCommandTimeout;
        case 0x4:
            return CommandStatus::kCommandProcessingError;
        case 0x5:
            return CommandStatus::kExecutionFailure;
        case 0x6:
            return CommandStatus::kTxDone;
        default:
            return CommandStatus::kUnknown;
    }
}

}  // namespace radio
}  // namespace subghz
