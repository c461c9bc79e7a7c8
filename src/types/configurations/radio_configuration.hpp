// src/types/configurations/radio_configuration.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "types/configurations/modulation_params.hpp"
#include "types/configurations/packet_params.hpp"
#include "types/configurations/radio_parameters.hpp"
#include "types/radio/irq_flags.hpp"
#include "types/radio/packet_type.hpp"

namespace subghz {

/**
 * @brief Complete radio session configuration
 *
 * Everything RadioDriver::Begin applies to bring the transceiver from
 * power-up to a configured standby state: oscillator and regulator setup,
 * carrier frequency, packet type with its modulation and packet parameters,
 * transmit power, buffer layout and interrupt routing.
 */
class RadioConfig {
   public:
    /**
     * @brief Construct a new Radio Config object
     *
     * @param frequency_hz Carrier frequency in Hz (default: 868 MHz)
     * @param modulation Modulation parameters (default: LoRa SF7 125 kHz 4/5)
     * @param packet Packet parameters, same packet type as modulation
     * @throw std::invalid_argument if the configuration is not valid
     */
    explicit RadioConfig(uint32_t frequency_hz = 868000000,
                         ModulationParams modulation = LoRaModParams{},
                         PacketParams packet = LoRaPacketParams{});

    /**
     * @brief Create default LoRa configuration
     * @return RadioConfig LoRa at 868 MHz, SF7, 125 kHz, CR 4/5, +14 dBm
     */
    static RadioConfig CreateDefaultLoRa();

    /**
     * @brief Create default (G)FSK configuration
     * @return RadioConfig GFSK at 868 MHz, 50 kbps, 25 kHz deviation
     */
    static RadioConfig CreateDefaultGfsk();

    /**
     * @brief Get the packet type implied by the modulation parameters
     */
    radio::PacketType getPacketType() const {
        return PacketTypeOf(modulation_params_);
    }

    uint32_t getFrequency() const { return frequency_hz_; }
    const ModulationParams& getModulationParams() const {
        return modulation_params_;
    }
    const PacketParams& getPacketParams() const { return packet_params_; }
    StandbyClock getStandbyClock() const { return standby_clock_; }
    RegulatorMode getRegulatorMode() const { return regulator_mode_; }
    const std::optional<TcxoMode>& getTcxoMode() const { return tcxo_mode_; }
    const TxParams& getTxParams() const { return tx_params_; }
    const PaConfig& getPaConfig() const { return pa_config_; }
    uint8_t getTxBaseAddress() const { return tx_base_address_; }
    uint8_t getRxBaseAddress() const { return rx_base_address_; }
    radio::IrqFlags getIrqMask() const { return irq_mask_; }
    FallbackMode getFallbackMode() const { return fallback_mode_; }

    /**
     * @brief Set the carrier frequency
     *
     * @param frequency_hz New frequency in Hz
     * @throw std::invalid_argument if frequency is outside 150 to 960 MHz
     */
    void setFrequency(uint32_t frequency_hz);

    /**
     * @brief Replace modulation and packet parameters together
     *
     * @throw std::invalid_argument if the two describe different packet
     * types or a parameter is out of range
     */
    void setParams(const ModulationParams& modulation,
                   const PacketParams& packet);

    /**
     * @brief Set transmit power and ramp time
     *
     * @throw std::invalid_argument if power is outside the PA range
     */
    void setTxParams(const TxParams& params);

    void setPaConfig(const PaConfig& config) { pa_config_ = config; }

    void setStandbyClock(StandbyClock clock) { standby_clock_ = clock; }

    void setRegulatorMode(RegulatorMode mode) { regulator_mode_ = mode; }

    /**
     * @brief Use an external TCXO powered from DIO3
     *
     * @param mode TCXO supply voltage and start-up delay, nullopt for a
     * plain crystal
     */
    void setTcxoMode(std::optional<TcxoMode> mode) {
        tcxo_mode_ = std::move(mode);
    }

    /**
     * @brief Set TX and RX base addresses in the on-chip buffer
     */
    void setBufferBaseAddresses(uint8_t tx_base, uint8_t rx_base) {
        tx_base_address_ = tx_base;
        rx_base_address_ = rx_base;
    }

    /**
     * @brief Set the interrupts enabled and routed to DIO1
     */
    void setIrqMask(radio::IrqFlags mask) { irq_mask_ = mask; }

    void setFallbackMode(FallbackMode mode) { fallback_mode_ = mode; }

    /**
     * @brief Check if the configuration is valid
     * @return bool True if all parameters are within valid ranges
     */
    bool IsValid() const;

    /**
     * @brief Get detailed validation messages
     * @return std::string Description of any validation errors
     */
    std::string Validate() const;

    static constexpr radio::IrqFlags kDefaultIrqMask = radio::IrqFlags(0x03E3);

   private:
    uint32_t frequency_hz_;
    ModulationParams modulation_params_;
    PacketParams packet_params_;
    StandbyClock standby_clock_{StandbyClock::kRc};
    RegulatorMode regulator_mode_{RegulatorMode::kLdo};
    std::optional<TcxoMode> tcxo_mode_;
    TxParams tx_params_{};
    PaConfig pa_config_{PaConfig::LowPower()};
    uint8_t tx_base_address_{0x00};
    uint8_t rx_base_address_{0x00};
    radio::IrqFlags irq_mask_{kDefaultIrqMask};
    FallbackMode fallback_mode_{FallbackMode::kStandbyRc};
};

}  // namespace subghz
