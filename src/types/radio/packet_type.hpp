// src/types/radio/packet_type.hpp
#pragma once

#include <cstdint>
#include <optional>

namespace subghz {
namespace radio {

/**
 * @brief Packet type (modulation scheme) selected with SetPacketType
 */
enum class PacketType : uint8_t {
    kGfsk = 0x00,  ///< Generic (G)FSK packet
    kLoRa = 0x01,  ///< LoRa packet
    kBpsk = 0x02   ///< BPSK, transmit only
};

/**
 * @brief Parse a packet type byte read back with GetPacketType
 *
 * @param bits Raw value
 * @return std::optional<PacketType> The packet type, nullopt if reserved
 */
inline std::optional<PacketType> PacketTypeFromBits(uint8_t bits) {
    switch (bits) {
        case 0x00:
            return PacketType::kGfsk;
        case 0x01:
            return PacketType::kLoRa;
        case 0x02:
            return PacketType::kBpsk;
        default:
            return std::nullopt;
    }
}

inline const char* PacketTypeToString(PacketType type) {
    switch (type) {
        case PacketType::kGfsk:
            return "GFSK";
        case PacketType::kLoRa:
            return "LoRa";
        case PacketType::kBpsk:
            return "BPSK";
        default:
            return "Unknown";
    }
}

}  // namespace radio
}  // namespace subghz
