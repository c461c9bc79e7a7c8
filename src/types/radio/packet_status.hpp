// src/types/radio/packet_status.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "types/radio/packet_type.hpp"
#include "types/radio/status.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Signal quality of the last received packet
 *
 * The meaning of the fields depends on the packet type. For LoRa, rssi_dbm
 * is the packet RSSI, snr_db the estimated SNR and signal_rssi_dbm the RSSI
 * after despreading. For (G)FSK, rssi_dbm is the RSSI at sync detection,
 * signal_rssi_dbm the average over the packet and rx_status the receiver
 * status bits. SNR is not reported for (G)FSK.
 */
struct PacketStatus {
    PacketType packet_type{PacketType::kLoRa};
    float rssi_dbm{0.0F};
    float snr_db{0.0F};
    float signal_rssi_dbm{0.0F};
    uint8_t rx_status{0};

    /**
     * @brief Decode a GetPacketStatus response (status byte first)
     *
     * @param type Packet type in use when the packet was received
     * @param response Four response bytes
     * @return PacketStatus Decoded values, zeros if the response is short
     */
    static PacketStatus Decode(PacketType type,
                               const std::vector<uint8_t>& response) {
        PacketStatus status;
        status.packet_type = type;
        if (response.size() < 4) {
            return status;
        }
        if (type == PacketType::kLoRa) {
            status.rssi_dbm = -static_cast<float>(response[1]) / 2.0F;
            status.snr_db = static_cast<float>(static_cast<int8_t>(response[2])) / 4.0F;
            status.signal_rssi_dbm = -static_cast<float>(response[3]) / 2.0F;
        } else {
            status.rx_status = response[1];
            status.rssi_dbm = -static_cast<float>(response[2]) / 2.0F;
            status.signal_rssi_dbm = -static_cast<float>(response[3]) / 2.0F;
        }
        return status;
    }
};

/**
 * @brief Packet counters reported by GetStats
 *
 * For LoRa the third counter counts header errors, for (G)FSK it counts
 * length errors.
 */
struct Stats {
    Status status{};
    uint16_t packets_received{0};
    uint16_t crc_errors{0};
    uint16_t header_or_length_errors{0};
};

}  // namespace radio
}  // namespace subghz
