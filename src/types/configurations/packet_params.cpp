#include "packet_params.hpp"

#include "utils/byte_operations.h"

namespace subghz {

std::vector<uint8_t> GenericPacketParams::Encode() const {
    std::vector<uint8_t> payload(9);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(preamble_bits);
    serializer.WriteUint8(static_cast<uint8_t>(preamble_detection));
    serializer.WriteUint8(sync_word_bits);
    serializer.WriteUint8(static_cast<uint8_t>(address_comparison));
    serializer.WriteUint8(variable_length ? 0x01 : 0x00);
    serializer.WriteUint8(payload_length);
    serializer.WriteUint8(static_cast<uint8_t>(crc_type));
    serializer.WriteUint8(whitening ? 0x01 : 0x00);
    return payload;
}

std::vector<uint8_t> LoRaPacketParams::Encode() const {
    std::vector<uint8_t> payload(6);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(preamble_symbols);
    serializer.WriteUint8(implicit_header ? 0x01 : 0x00);
    serializer.WriteUint8(payload_length);
    serializer.WriteUint8(crc_enabled ? 0x01 : 0x00);
    serializer.WriteUint8(invert_iq ? 0x01 : 0x00);
    return payload;
}

radio::PacketType PacketTypeOf(const PacketParams& params) {
    switch (params.index()) {
        case 0:
            return radio::PacketType::kGfsk;
        case 1:
            return radio::PacketType::kLoRa;
        default:
            return radio::PacketType::kBpsk;
    }
}

std::vector<uint8_t> EncodePacketParams(const PacketParams& params) {
    return std::visit([](const auto& p) { return p.Encode(); }, params);
}

uint8_t PayloadLengthOf(const PacketParams& params) {
    return std::visit([](const auto& p) { return p.payload_length; }, params);
}

PacketParams WithPayloadLength(const PacketParams& params, uint8_t length) {
    PacketParams updated = params;
    std::visit([length](auto& p) { p.payload_length = length; }, updated);
    return updated;
}

}  // namespace subghz
