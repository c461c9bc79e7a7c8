#include "radio_parameters.hpp"

#include "utils/byte_operations.h"

namespace subghz {

std::vector<uint8_t> CadParams::Encode() const {
    std::vector<uint8_t> payload(7);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint8(static_cast<uint8_t>(symbols));
    serializer.WriteUint8(detection_peak);
    serializer.WriteUint8(detection_min);
    serializer.WriteUint8(static_cast<uint8_t>(exit_mode));
    serializer.WriteUint24(timeout.bits());
    return payload;
}

std::vector<uint8_t> TcxoMode::Encode() const {
    std::vector<uint8_t> payload(4);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint8(static_cast<uint8_t>(voltage));
    serializer.WriteUint24(startup_timeout.bits());
    return payload;
}

}  // namespace subghz
