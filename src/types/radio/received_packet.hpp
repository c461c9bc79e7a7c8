// src/types/radio/received_packet.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "types/radio/packet_status.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Outcome of a reception
 *
 * Corrupted packets and receive timeouts are normal radio outcomes and are
 * reported here rather than as errors.
 */
enum class RxStatus : uint8_t {
    kOk,           ///< Packet received with a valid CRC, or without CRC
    kCrcError,     ///< Packet received, CRC check failed
    kHeaderError,  ///< LoRa header corrupted, no payload
    kTimeout       ///< Radio timer expired before a packet arrived
};

inline const char* RxStatusToString(RxStatus status) {
    switch (status) {
        case RxStatus::kOk:
            return "Ok";
        case RxStatus::kCrcError:
            return "CrcError";
        case RxStatus::kHeaderError:
            return "HeaderError";
        case RxStatus::kTimeout:
            return "Timeout";
        default:
            return "Unknown";
    }
}

/**
 * @brief A completed reception
 */
struct ReceivedPacket {
    RxStatus status{RxStatus::kTimeout};
    std::vector<uint8_t> payload;  ///< Empty unless RxDone fired
    PacketStatus signal{};         ///< Valid when payload was read
};

}  // namespace radio
}  // namespace subghz
