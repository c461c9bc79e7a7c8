// src/radio/mode_state_machine.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "types/commands/command.hpp"
#include "types/configurations/radio_parameters.hpp"
#include "types/error_codes/result.hpp"
#include "types/radio/irq_flags.hpp"
#include "types/radio/radio_mode.hpp"

namespace subghz {
namespace radio {

/**
 * @brief How a command changes the operating mode once it succeeds
 */
enum class TransitionKind : uint8_t {
    kStay,           ///< Mode unchanged
    kEnter,          ///< Enter ModeRule::target
    kStandbyClock,   ///< Standby on the clock named in the payload
    kWake            ///< Leave Sleep for StandbyRC, otherwise unchanged
};

/**
 * @brief One row of the command legality table
 */
struct ModeRule {
    Opcode opcode;
    RadioModeMask permitted_modes;
    TransitionKind transition;
    RadioMode target;  ///< Only meaningful for kEnter
};

/**
 * @brief Runtime model of the transceiver's operating mode
 *
 * Tracks the single authoritative RadioMode and rejects commands that are
 * not permitted from it. The mode only changes as the documented side
 * effect of a command that executed successfully, or of a completion
 * interrupt. Initial mode is Sleep; callers resynchronize with the
 * hardware through SetMode after querying the chip status.
 */
class ModeStateMachine {
   public:
    ModeStateMachine() = default;

    /**
     * @brief The full legality and transition table
     */
    static const std::vector<ModeRule>& Rules();

    /**
     * @brief Find the rule for an opcode
     *
     * @return const ModeRule* nullptr if the opcode has no rule
     */
    static const ModeRule* FindRule(Opcode opcode);

    /**
     * @brief Check that a command may be issued in the current mode
     *
     * @return Result kIllegalTransition if not permitted
     */
    Result Guard(const Command& command) const;

    /**
     * @brief Record the side effects of a command that executed
     *
     * Updates the mode from the table and tracks the settings that decide
     * where packet operations end: fallback mode, continuous reception and
     * CAD exit mode.
     */
    void Apply(const Command& command);

    /**
     * @brief Update the mode from interrupt flags the driver consumed
     *
     * TX ends on TxDone or Timeout. Single-shot RX ends on RxDone, Timeout
     * or HeaderErr. CAD ends on CadDone, continuing in RX when CadDetected
     * is set and the exit mode is CadRx.
     *
     * @param flags Flags read from the interrupt register
     */
    void OnIrq(IrqFlags flags);

    /**
     * @brief Force the model to a mode reported by the hardware
     */
    void SetMode(RadioMode mode);

    RadioMode getMode() const { return mode_; }

    FallbackMode getFallbackMode() const { return fallback_mode_; }

    bool IsContinuousRx() const { return continuous_rx_; }

    bool IsCadActive() const { return cad_active_; }

    /**
     * @brief Whether the opcode may be issued from the given mode
     */
    static bool IsPermitted(Opcode opcode, RadioMode mode);

   private:
    void EnterFallback();

    RadioMode mode_{RadioMode::kSleep};
    FallbackMode fallback_mode_{FallbackMode::kStandbyRc};
    CadExitMode cad_exit_mode_{CadExitMode::kCadOnly};
    bool continuous_rx_{false};
    bool cad_active_{false};
};

}  // namespace radio
}  // namespace subghz
