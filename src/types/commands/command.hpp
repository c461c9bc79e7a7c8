// src/types/commands/command.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "types/commands/opcode.hpp"
#include "types/configurations/modulation_params.hpp"
#include "types/configurations/packet_params.hpp"
#include "types/configurations/radio_parameters.hpp"
#include "types/configurations/rf_frequency.hpp"
#include "types/configurations/timeout.hpp"
#include "types/radio/irq_flags.hpp"
#include "types/radio/packet_type.hpp"

namespace subghz {

/**
 * @brief A single command-bus transaction
 *
 * Opcode, payload bytes and the number of response bytes to read back.
 * The response, when present, always starts with the status byte. A
 * Command is immutable once built; use the factories in
 * subghz::commands to construct well-formed ones.
 */
class Command {
   public:
    Command(Opcode opcode, std::vector<uint8_t> payload = {},
            size_t response_length = 0)
        : opcode_(opcode),
          payload_(std::move(payload)),
          response_length_(response_length) {}

    Opcode getOpcode() const { return opcode_; }

    const std::vector<uint8_t>& getPayload() const { return payload_; }

    /**
     * @brief Number of bytes read back, status byte included
     */
    size_t getResponseLength() const { return response_length_; }

    bool HasResponse() const { return response_length_ > 0; }

    /**
     * @brief Opcode followed by payload, as written on the bus
     */
    std::vector<uint8_t> Serialize() const;

   private:
    Opcode opcode_;
    std::vector<uint8_t> payload_;
    size_t response_length_;
};

namespace commands {

// Operating mode
Command SetSleep(SleepConfig config);
Command SetStandby(StandbyClock clock);
Command SetFs();
Command SetTx(Timeout timeout);
Command SetRx(Timeout timeout);
Command SetRxDutyCycle(Timeout rx_period, Timeout sleep_period);
Command SetCad();
Command SetTxContinuousWave();
Command SetTxContinuousPreamble();
Command SetStopRxTimerOnPreamble(bool enable);
Command SetLoRaSymbTimeout(uint8_t symbols);
Command SetRegulatorMode(RegulatorMode mode);
Command SetTxRxFallbackMode(FallbackMode mode);
Command SetTcxoMode(const TcxoMode& mode);
Command Calibrate(uint8_t block_mask);
Command CalibrateImage(uint8_t freq1, uint8_t freq2);
Command SetPaConfig(const PaConfig& config);

// Radio configuration
Command SetPacketType(radio::PacketType type);
Command GetPacketType();
Command SetRfFrequency(RfFrequency frequency);
Command SetTxParams(const TxParams& params);
Command SetModulationParams(const ModulationParams& params);
Command SetPacketParams(const PacketParams& params);
Command SetCadParams(const CadParams& params);
Command SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base);

// Interrupts
Command CfgDioIrq(radio::IrqFlags irq_mask, radio::IrqFlags dio1_mask,
                  radio::IrqFlags dio2_mask, radio::IrqFlags dio3_mask);
Command GetIrqStatus();
Command ClearIrqStatus(radio::IrqFlags flags);

// Status
Command GetStatus();
Command GetRxBufferStatus();
Command GetPacketStatus();
Command GetRssiInst();
Command GetStats();
Command ResetStats();
Command GetError();
Command ClearError();

// Buffer and register access
Command WriteBuffer(uint8_t offset, const std::vector<uint8_t>& data);
Command ReadBuffer(uint8_t offset, size_t length);
Command WriteRegister(uint16_t address, const std::vector<uint8_t>& data);
Command ReadRegister(uint16_t address, uint8_t length);

}  // namespace commands

}  // namespace subghz
