// test/mocks/simulated_subghz.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>

#include "hardware/bus_transport.hpp"
#include "types/commands/opcode.hpp"
#include "types/radio/irq_flags.hpp"
#include "types/radio/radio_mode.hpp"

namespace subghz {
namespace test {

/**
 * @brief Behavioral model of a sub-GHz transceiver behind the command bus
 *
 * Decodes command frames, keeps a 256-byte data buffer, an interrupt
 * register and the chip mode, and answers response frames with status
 * bytes that carry the chip mode. Busy stays asserted for a number of
 * polls after every frame and for as long as the chip sleeps.
 *
 * Completions are scripted: a transmission, a reception or a CAD ends
 * after a configurable number of interrupt-status reads.
 */
class SimulatedSubGhz : public hardware::IBusTransport {
   public:
    /**
     * @brief Scripted reception outcome
     */
    struct RxEvent {
        radio::IrqFlags flags;
        std::vector<uint8_t> payload;
        size_t after_irq_reads{1};
    };

    /**
     * @param busy_polls IsBusy() calls that report busy after each frame
     * @param start_asleep Start in Sleep (power-up) rather than StandbyRC
     */
    explicit SimulatedSubGhz(size_t busy_polls = 2, bool start_asleep = true);

    // IBusTransport
    bool IsBusy() override;
    void Select() override;
    void Deselect() override;
    bool Transfer(uint8_t tx, uint8_t* rx) override;

    // Inspection

    radio::RadioMode getChipMode() const { return mode_; }
    bool IsAsleep() const { return asleep_; }

    /**
     * @brief Selects issued while busy was asserted by an awake chip
     */
    size_t getSelectWhileBusyCount() const { return select_while_busy_; }

    /**
     * @brief Command frames received, opcode first
     */
    const std::vector<std::vector<uint8_t>>& getCommandFrames() const {
        return command_frames_;
    }

    std::vector<Opcode> getOpcodes() const;

    size_t CountOpcode(Opcode opcode) const;

    /**
     * @brief Masks received with ClearIrqStatus, in order
     */
    const std::vector<uint16_t>& getClearedMasks() const {
        return cleared_masks_;
    }

    void ClearHistory();

    std::array<uint8_t, 256>& Buffer() { return buffer_; }

    uint16_t getIrqRegister() const { return irq_; }
    uint8_t getPacketType() const { return packet_type_; }
    uint8_t getTxBase() const { return tx_base_; }
    uint8_t getRxBase() const { return rx_base_; }
    uint16_t getIrqMask() const { return irq_mask_; }
    uint8_t getFallback() const { return fallback_; }
    uint8_t getRegister(uint16_t address) const;

    // Scripting

    /**
     * @brief Interrupts raised when a transmission ends
     *
     * @param flags Empty to never end on its own
     * @param after_irq_reads GetIrqStatus reads until the flags appear
     */
    void SetTxOutcome(radio::IrqFlags flags, size_t after_irq_reads = 1);

    /**
     * @brief End the current transmission now
     */
    void FinishTransmit(radio::IrqFlags flags = radio::IrqFlags::Of(
                            radio::IrqEvent::kTxDone));

    void QueueRxEvent(RxEvent event);

    void SetCadOutcome(bool detected, size_t after_irq_reads = 1);

    /**
     * @brief Set flags in the interrupt register, ignoring the mask
     */
    void RaiseIrq(radio::IrqFlags flags);

    void SetOperationalErrors(uint16_t errors) { errors_ = errors; }

    // Fault injection

    void SetStuckBusy(bool stuck) { stuck_busy_ = stuck; }

    /**
     * @brief Fail every Transfer after the given number of successful ones
     */
    void FailTransfersAfter(size_t transfers);

    void ClearFaults();

    /**
     * @brief Return this status byte instead of the computed one
     */
    void OverrideStatus(std::optional<uint8_t> status) {
        status_override_ = status;
    }

    /**
     * @brief Report a chip mode without following it in the model
     */
    void ForceChipMode(radio::RadioMode mode) { mode_ = mode; }

   private:
    enum class Activity : uint8_t { kNone, kTx, kRx, kCad };

    void ProcessFrame(const std::vector<uint8_t>& frame);
    void Respond(std::vector<uint8_t> bytes);
    void OnIrqRead();
    void Latch(radio::IrqFlags flags);
    void ArmRx();
    void EndActivity();
    uint8_t StatusByte() const;

    size_t busy_polls_;
    size_t busy_remaining_{0};
    bool asleep_;
    bool selected_{false};
    bool reading_response_{false};
    bool frame_faulted_{false};
    radio::RadioMode mode_;

    std::vector<uint8_t> frame_;
    std::vector<uint8_t> response_;
    size_t response_index_{0};

    std::array<uint8_t, 256> buffer_{};
    std::map<uint16_t, uint8_t> registers_;
    uint16_t irq_{0};
    uint16_t irq_mask_{0x03FF};
    uint16_t errors_{0};
    uint8_t packet_type_{0x00};
    uint8_t tx_base_{0};
    uint8_t rx_base_{0};
    uint8_t rx_length_{0};
    uint8_t rx_pointer_{0};
    uint8_t fallback_{0x20};
    uint8_t cad_exit_{0x00};
    uint8_t command_status_{0x0};
    bool continuous_rx_{false};

    Activity activity_{Activity::kNone};
    size_t countdown_{0};
    radio::IrqFlags tx_flags_{radio::IrqFlags::Of(radio::IrqEvent::kTxDone)};
    size_t tx_reads_{1};
    std::deque<RxEvent> rx_events_;
    bool cad_detected_{false};
    size_t cad_reads_{1};

    bool stuck_busy_{false};
    std::optional<size_t> transfers_before_fault_;
    std::optional<uint8_t> status_override_;

    size_t select_while_busy_{0};
    std::vector<std::vector<uint8_t>> command_frames_;
    std::vector<uint16_t> cleared_masks_;
};

}  // namespace test
}  // namespace subghz
