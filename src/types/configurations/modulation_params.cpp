#include "modulation_params.hpp"

#include "types/configurations/rf_frequency.hpp"
#include "utils/byte_operations.h"

namespace subghz {

std::vector<uint8_t> LoRaModParams::Encode() const {
    return {static_cast<uint8_t>(spreading_factor),
            static_cast<uint8_t>(bandwidth), static_cast<uint8_t>(coding_rate),
            static_cast<uint8_t>(low_data_rate_optimize ? 0x01 : 0x00)};
}

uint32_t GfskModParams::BitrateBits() const {
    if (bitrate_bps == 0) {
        return 0;
    }
    return static_cast<uint32_t>((32ULL * RfFrequency::kXtalHz) / bitrate_bps);
}

uint32_t GfskModParams::FdevBits() const {
    return static_cast<uint32_t>((static_cast<uint64_t>(fdev_hz) << 25) /
                                 RfFrequency::kXtalHz);
}

bool GfskModParams::IsValid() const {
    return bitrate_bps >= kMinBitrate && bitrate_bps <= kMaxBitrate &&
           fdev_hz <= kMaxFdevHz;
}

std::vector<uint8_t> GfskModParams::Encode() const {
    std::vector<uint8_t> payload(8);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint24(BitrateBits());
    serializer.WriteUint8(static_cast<uint8_t>(pulse_shape));
    serializer.WriteUint8(static_cast<uint8_t>(bandwidth));
    serializer.WriteUint24(FdevBits());
    return payload;
}

uint32_t BpskModParams::BitrateBits() const {
    if (bitrate_bps == 0) {
        return 0;
    }
    return static_cast<uint32_t>((32ULL * RfFrequency::kXtalHz) / bitrate_bps);
}

std::vector<uint8_t> BpskModParams::Encode() const {
    std::vector<uint8_t> payload(4);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint24(BitrateBits());
    serializer.WriteUint8(kPulseShape);
    return payload;
}

radio::PacketType PacketTypeOf(const ModulationParams& params) {
    switch (params.index()) {
        case 0:
            return radio::PacketType::kGfsk;
        case 1:
            return radio::PacketType::kLoRa;
        default:
            return radio::PacketType::kBpsk;
    }
}

std::vector<uint8_t> EncodeModulationParams(const ModulationParams& params) {
    return std::visit([](const auto& p) { return p.Encode(); }, params);
}

}  // namespace subghz
