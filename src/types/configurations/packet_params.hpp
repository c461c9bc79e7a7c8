// src/types/configurations/packet_params.hpp
#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "types/radio/packet_type.hpp"

namespace subghz {

/**
 * @brief Preamble detector length for (G)FSK reception
 */
enum class PreambleDetection : uint8_t {
    kDisabled = 0x00,
    kBit8 = 0x04,
    kBit16 = 0x05,
    kBit24 = 0x06,
    kBit32 = 0x07
};

/**
 * @brief Node and broadcast address filtering for (G)FSK reception
 */
enum class AddressComparison : uint8_t {
    kDisabled = 0x00,
    kNode = 0x01,
    kNodeAndBroadcast = 0x02
};

/**
 * @brief CRC computed over (G)FSK packets
 */
enum class CrcType : uint8_t {
    kByte1 = 0x00,
    kNone = 0x01,
    kByte2 = 0x02,
    kByte1Inverted = 0x04,
    kByte2Inverted = 0x06
};

/**
 * @brief Generic (G)FSK packet parameters
 */
struct GenericPacketParams {
    static constexpr uint8_t kMaxSyncWordBits = 64;

    uint16_t preamble_bits{32};
    PreambleDetection preamble_detection{PreambleDetection::kBit16};
    uint8_t sync_word_bits{16};
    AddressComparison address_comparison{AddressComparison::kDisabled};
    bool variable_length{true};  ///< Length byte sent in the packet
    uint8_t payload_length{0xFF};
    CrcType crc_type{CrcType::kByte2};
    bool whitening{true};

    bool IsValid() const { return sync_word_bits <= kMaxSyncWordBits; }

    /// SetPacketParams payload, 9 bytes.
    std::vector<uint8_t> Encode() const;
};

/**
 * @brief LoRa packet parameters
 */
struct LoRaPacketParams {
    uint16_t preamble_symbols{8};
    bool implicit_header{false};
    uint8_t payload_length{0xFF};
    bool crc_enabled{true};
    bool invert_iq{false};

    /// SetPacketParams payload, 6 bytes.
    std::vector<uint8_t> Encode() const;
};

/**
 * @brief BPSK packet parameters
 */
struct BpskPacketParams {
    uint8_t payload_length{0xFF};

    /// SetPacketParams payload, 1 byte.
    std::vector<uint8_t> Encode() const { return {payload_length}; }
};

/**
 * @brief Packet parameters keyed by packet type
 *
 * Alternatives are ordered like PacketType and ModulationParams.
 */
using PacketParams =
    std::variant<GenericPacketParams, LoRaPacketParams, BpskPacketParams>;

radio::PacketType PacketTypeOf(const PacketParams& params);

std::vector<uint8_t> EncodePacketParams(const PacketParams& params);

uint8_t PayloadLengthOf(const PacketParams& params);

/**
 * @brief Copy of the parameters with a different payload length
 */
PacketParams WithPayloadLength(const PacketParams& params, uint8_t length);

}  // namespace subghz
