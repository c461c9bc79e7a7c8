// src/types/configurations/modulation_params.hpp
#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "types/radio/packet_type.hpp"

namespace subghz {

/**
 * @brief LoRa spreading factor
 */
enum class SpreadingFactor : uint8_t {
    kSf5 = 0x05,
    kSf6 = 0x06,
    kSf7 = 0x07,
    kSf8 = 0x08,
    kSf9 = 0x09,
    kSf10 = 0x0A,
    kSf11 = 0x0B,
    kSf12 = 0x0C
};

/**
 * @brief LoRa signal bandwidth register codes
 */
enum class LoRaBandwidth : uint8_t {
    kBw7 = 0x00,    ///< 7.81 kHz
    kBw10 = 0x08,   ///< 10.42 kHz
    kBw15 = 0x01,   ///< 15.63 kHz
    kBw20 = 0x09,   ///< 20.83 kHz
    kBw31 = 0x02,   ///< 31.25 kHz
    kBw41 = 0x0A,   ///< 41.67 kHz
    kBw62 = 0x03,   ///< 62.50 kHz
    kBw125 = 0x04,  ///< 125 kHz
    kBw250 = 0x05,  ///< 250 kHz
    kBw500 = 0x06   ///< 500 kHz
};

/**
 * @brief LoRa forward error correction coding rate
 */
enum class CodingRate : uint8_t {
    kCr45 = 0x01,
    kCr46 = 0x02,
    kCr47 = 0x03,
    kCr48 = 0x04
};

/**
 * @brief LoRa modulation parameters
 */
struct LoRaModParams {
    SpreadingFactor spreading_factor{SpreadingFactor::kSf7};
    LoRaBandwidth bandwidth{LoRaBandwidth::kBw125};
    CodingRate coding_rate{CodingRate::kCr45};
    bool low_data_rate_optimize{false};

    /// SetModulationParams payload: SF, BW, CR, LDRO.
    std::vector<uint8_t> Encode() const;
};

/**
 * @brief Gaussian filter applied to (G)FSK and BPSK symbols
 */
enum class PulseShape : uint8_t {
    kNone = 0x00,
    kBt03 = 0x08,
    kBt05 = 0x09,
    kBt07 = 0x0A,
    kBt10 = 0x0B
};

/**
 * @brief (G)FSK receiver bandwidth register codes
 */
enum class GfskBandwidth : uint8_t {
    kBw4 = 0x1F,    ///< 4.8 kHz
    kBw5 = 0x17,    ///< 5.8 kHz
    kBw7 = 0x0F,    ///< 7.3 kHz
    kBw9 = 0x1E,    ///< 9.7 kHz
    kBw11 = 0x16,   ///< 11.7 kHz
    kBw14 = 0x0E,   ///< 14.6 kHz
    kBw19 = 0x1D,   ///< 19.5 kHz
    kBw23 = 0x15,   ///< 23.4 kHz
    kBw29 = 0x0D,   ///< 29.3 kHz
    kBw39 = 0x1C,   ///< 39.0 kHz
    kBw46 = 0x14,   ///< 46.9 kHz
    kBw58 = 0x0C,   ///< 58.6 kHz
    kBw78 = 0x1B,   ///< 78.2 kHz
    kBw93 = 0x13,   ///< 93.8 kHz
    kBw117 = 0x0B,  ///< 117.3 kHz
    kBw156 = 0x1A,  ///< 156.2 kHz
    kBw187 = 0x12,  ///< 187.2 kHz
    kBw234 = 0x0A,  ///< 234.3 kHz
    kBw312 = 0x19,  ///< 312.0 kHz
    kBw373 = 0x11,  ///< 373.6 kHz
    kBw467 = 0x09   ///< 467.0 kHz
};

/**
 * @brief (G)FSK modulation parameters
 */
struct GfskModParams {
    static constexpr uint32_t kMinBitrate = 600;
    static constexpr uint32_t kMaxBitrate = 300000;
    static constexpr uint32_t kMaxFdevHz = 200000;

    uint32_t bitrate_bps{50000};
    PulseShape pulse_shape{PulseShape::kBt05};
    GfskBandwidth bandwidth{GfskBandwidth::kBw117};
    uint32_t fdev_hz{25000};

    /// Register value for the bitrate: 32 * f_xtal / bitrate.
    uint32_t BitrateBits() const;

    /// Register value for the deviation: fdev * 2^25 / f_xtal.
    uint32_t FdevBits() const;

    bool IsValid() const;

    /// SetModulationParams payload: BR(3), pulse shape, BW, Fdev(3).
    std::vector<uint8_t> Encode() const;
};

/**
 * @brief BPSK modulation parameters, transmit only
 */
struct BpskModParams {
    static constexpr uint8_t kPulseShape = 0x16;  ///< Gaussian BT 0.5

    uint32_t bitrate_bps{600};

    uint32_t BitrateBits() const;

    bool IsValid() const { return bitrate_bps > 0; }

    /// SetModulationParams payload: BR(3), pulse shape.
    std::vector<uint8_t> Encode() const;
};

/**
 * @brief Modulation parameters keyed by packet type
 */
using ModulationParams =
    std::variant<GfskModParams, LoRaModParams, BpskModParams>;

/**
 * @brief Packet type a modulation parameter set belongs to
 */
radio::PacketType PacketTypeOf(const ModulationParams& params);

/**
 * @brief Serialize a modulation parameter set for SetModulationParams
 */
std::vector<uint8_t> EncodeModulationParams(const ModulationParams& params);

}  // namespace subghz
