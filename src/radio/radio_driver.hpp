// src/radio/radio_driver.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "hardware/hal.hpp"
#include "hardware/radio_handle.hpp"
#include "radio/buffer_manager.hpp"
#include "radio/command_bus.hpp"
#include "radio/guarded_command_channel.hpp"
#include "radio/irq_controller.hpp"
#include "radio/mode_state_machine.hpp"
#include "types/configurations/driver_configuration.hpp"
#include "types/configurations/modulation_params.hpp"
#include "types/configurations/packet_params.hpp"
#include "types/configurations/radio_configuration.hpp"
#include "types/configurations/radio_parameters.hpp"
#include "types/configurations/timeout.hpp"
#include "types/error_codes/result.hpp"
#include "types/radio/packet_status.hpp"
#include "types/radio/packet_type.hpp"
#include "types/radio/received_packet.hpp"
#include "types/radio/status.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Sub-GHz transceiver driver
 *
 * Composes the command bus, the mode state machine, the buffer manager
 * and the interrupt controller into configuration sequences and packet
 * workflows. Every command passes the mode guard before it reaches the
 * bus.
 *
 * Failures are reported as kRadioError results that keep the underlying
 * cause, so HasError() and GetRootCause() still identify it. After an
 * illegal transition or a timeout the driver resynchronizes its mode
 * model with a status query. Nothing is retried.
 *
 * Packet workflows come in two flavours over the same state: Start* and
 * Poll* never block, the plain variants block up to a caller-supplied
 * bound. An operation in flight is cancelled by calling Standby().
 */
class RadioDriver {
   public:
    /**
     * @brief Construct a new Radio Driver
     *
     * @param handle Exclusive radio handle, see RadioHandle::Acquire
     * @param hal Platform clock, must outlive the driver
     * @param config Driver timing and buffer settings
     * @throw std::invalid_argument if handle is null
     */
    RadioDriver(std::unique_ptr<hardware::RadioHandle> handle, hal::IHal& hal,
                const DriverConfig& config = DriverConfig{});

    RadioDriver(const RadioDriver&) = delete;
    RadioDriver& operator=(const RadioDriver&) = delete;

    /**
     * @brief Bring the radio from power-up to a configured standby
     *
     * Wakes and resynchronizes the radio, then applies the whole
     * configuration and clears pending interrupts.
     */
    Result Begin(const RadioConfig& config);

    /**
     * @brief Query the chip status and adopt the reported mode
     *
     * Leaves the model untouched if the reported chip mode is undefined.
     */
    Result SyncMode();

    // Operating mode

    /**
     * @brief Put the radio to sleep
     *
     * A cold start (warm_start false) loses the configuration; the packet
     * type and parameters must be applied again after waking.
     */
    Result Sleep(SleepConfig config = SleepConfig{});

    /**
     * @brief Enter standby, waking the radio if needed
     *
     * Also aborts a transmission, reception or CAD in progress.
     */
    Result Standby(StandbyClock clock = StandbyClock::kRc);

    Result SetFs();
    Result SetTxContinuousWave();
    Result SetTxContinuousPreamble();
    Result SetRegulatorMode(RegulatorMode mode);
    Result SetTcxoMode(const TcxoMode& mode);
    Result SetFallbackMode(FallbackMode mode);
    Result Calibrate(uint8_t block_mask);

    // Radio configuration

    /**
     * @brief Select the packet type
     *
     * Previously applied modulation and packet parameters become invalid
     * and must be applied again.
     */
    Result SetPacketType(PacketType type);

    /**
     * @brief Read the packet type back from the radio
     */
    Result GetPacketType(PacketType* type);

    /**
     * @brief Apply modulation parameters
     *
     * @return Result kConfigurationMismatch, without bus traffic, if the
     * parameters belong to another packet type than the selected one
     */
    Result SetModulationParams(const ModulationParams& params);

    /**
     * @brief Apply packet parameters
     *
     * @return Result kConfigurationMismatch, without bus traffic, if the
     * parameters belong to another packet type than the selected one
     */
    Result SetPacketParams(const PacketParams& params);

    /**
     * @brief Calibrate the image rejection for a frequency, then tune to it
     *
     * @param frequency_hz Carrier frequency, 150 to 960 MHz
     */
    Result SetFrequency(uint32_t frequency_hz);

    Result SetTxParams(const TxParams& params);
    Result SetPaConfig(const PaConfig& config);
    Result SetPaOcp(Ocp ocp);

    /**
     * @brief Trim the load capacitance on the crystal input
     *
     * @param trim Trim step, 0 to 0x2F
     */
    Result SetHseInTrim(uint8_t trim);
    Result SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base);
    Result ConfigureIrq(IrqFlags irq_mask, IrqFlags dio1_mask,
                        IrqFlags dio2_mask = IrqFlags(),
                        IrqFlags dio3_mask = IrqFlags());
    Result SetLoRaSyncWord(uint16_t sync_word);
    Result SetSyncWord(const std::array<uint8_t, 8>& sync_word);
    Result SetLoRaSymbTimeout(uint8_t symbols);
    Result SetStopRxTimerOnPreamble(bool enable);

    // Buffer access

    Result WriteBuffer(size_t offset, const std::vector<uint8_t>& data);
    Result ReadBuffer(size_t offset, size_t length,
                      std::vector<uint8_t>* data);

    // Transmit

    /**
     * @brief Write a payload and start transmitting it
     *
     * Updates the payload length in the packet parameters when it differs.
     *
     * @param payload Bytes to send
     * @param timeout Radio timeout, Disabled to wait for TxDone only
     */
    Result StartTransmit(const std::vector<uint8_t>& payload,
                         Timeout timeout = Timeout::Disabled());

    /**
     * @brief Check whether the transmission started by StartTransmit ended
     *
     * @param complete Set to true once TxDone or Timeout was consumed
     * @return Result kTimeout if the radio timer expired before TxDone
     */
    Result PollTransmit(bool* complete);

    /**
     * @brief Transmit and block until done
     *
     * @param wait_ms Longest time to wait for TxDone or Timeout
     */
    Result Transmit(const std::vector<uint8_t>& payload, Timeout timeout,
                    uint32_t wait_ms);

    // Receive

    /**
     * @brief Start receiving
     *
     * @param timeout Disabled for single reception without timeout,
     * Continuous to keep receiving after each packet
     */
    Result StartReceive(Timeout timeout = Timeout::Disabled());

    /**
     * @brief Start listening periodically, sleeping in between
     */
    Result StartReceiveDutyCycle(Timeout rx_period, Timeout sleep_period);

    /**
     * @brief Check whether the reception ended
     *
     * On RxDone the payload length and offset are queried before the
     * payload is read. CRC errors, header errors and radio timeouts are
     * reported through packet->status.
     *
     * @param complete Set to true once a completion flag was consumed
     * @param packet Receives the outcome when complete
     */
    Result PollReceive(bool* complete, ReceivedPacket* packet);

    /**
     * @brief Receive one packet and block until done
     *
     * @param wait_ms Longest time to wait for a completion flag
     * @return Result kTimeout if nothing happened within wait_ms. The radio
     * stays in RX; call Standby() to cancel.
     */
    Result Receive(Timeout timeout, uint32_t wait_ms, ReceivedPacket* packet);

    // Channel activity detection

    Result StartCad(const CadParams& params);

    /**
     * @param complete Set to true once CadDone was consumed
     * @param detected Set to true if activity was detected
     */
    Result PollCad(bool* complete, bool* detected);

    Result Cad(const CadParams& params, uint32_t wait_ms, bool* detected);

    // Diagnostics

    Result GetStatus(Status* status);
    Result GetPacketStatus(PacketStatus* status);
    Result GetRssiInst(float* rssi_dbm);
    Result GetStats(Stats* stats);
    Result ResetStats();

    /**
     * @brief Read the operational error bits, see op_error
     */
    Result GetErrors(uint16_t* errors);
    Result ClearErrors();
    Result ReadRegister(uint16_t address, uint8_t length,
                        std::vector<uint8_t>* data);
    Result WriteRegister(uint16_t address, const std::vector<uint8_t>& data);

    // State

    RadioMode getMode() const { return modes_.getMode(); }

    /**
     * @brief Packet type selected through this driver, if any
     */
    const std::optional<PacketType>& getConfiguredPacketType() const {
        return packet_type_;
    }

    bool HasModulationParams() const { return modulation_params_.has_value(); }
    bool HasPacketParams() const { return packet_params_.has_value(); }

    const BufferManager& getBufferManager() const { return buffers_; }

    IrqController& getIrqController() { return irq_; }

    const DriverConfig& getDriverConfig() const { return config_; }

   private:
    enum class Operation : uint8_t { kIdle, kTransmit, kReceive, kCad };

    static hardware::IBusTransport& TransportOf(
        const std::unique_ptr<hardware::RadioHandle>& handle);

    /**
     * @brief Run a command through the mode guard, resync and wrap errors
     */
    Result Run(const char* operation, const Command& command,
               std::vector<uint8_t>* response = nullptr);

    /**
     * @brief Resynchronize after illegal transitions and timeouts, wrap
     */
    Result Finish(const char* operation, Result result);

    Result WakeIfAsleep();
    Result CompleteTransmit(IrqFlags fired, bool* complete);
    Result CompleteReceive(IrqFlags fired, bool* complete,
                           ReceivedPacket* packet);
    Result CompleteCad(IrqFlags fired, bool* complete, bool* detected);

    std::unique_ptr<hardware::RadioHandle> handle_;
    DriverConfig config_;
    CommandBus bus_;
    ModeStateMachine modes_;
    GuardedCommandChannel channel_;
    BufferManager buffers_;
    IrqController irq_;

    std::optional<PacketType> packet_type_;
    std::optional<ModulationParams> modulation_params_;
    std::optional<PacketParams> packet_params_;
    Operation pending_{Operation::kIdle};
};

}  // namespace radio
}  // namespace subghz
