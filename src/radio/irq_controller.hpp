// src/radio/irq_controller.hpp
#pragma once

#include <cstdint>

#include "hardware/hal.hpp"
#include "radio/command_channel.hpp"
#include "types/error_codes/result.hpp"
#include "types/radio/irq_flags.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Access to the radio interrupt register
 *
 * Flags are held by the hardware until cleared; reading never clears.
 * Read-then-clear is not atomic, so callers clear exactly the flags they
 * acted on and must tolerate a flag reappearing when a new event races
 * the clear.
 *
 * Completion can be observed by polling (Poll, never blocks) or by
 * waiting (Wait, blocks up to a bound using the HAL clock).
 */
class IrqController {
   public:
    IrqController(ICommandChannel& channel, hal::IHal& hal,
                  uint32_t poll_interval_ms);

    /**
     * @brief Read the interrupt register
     *
     * @param flags Receives every flag currently set
     */
    Result ReadFlags(IrqFlags* flags);

    /**
     * @brief Clear flags, write-1-to-clear
     *
     * @param flags Exactly the flags to clear. Nothing is sent if empty.
     */
    Result Clear(IrqFlags flags);

    /**
     * @brief Enable interrupts and route them to the DIO lines
     */
    Result Configure(IrqFlags irq_mask, IrqFlags dio1_mask,
                     IrqFlags dio2_mask = IrqFlags(),
                     IrqFlags dio3_mask = IrqFlags());

    /**
     * @brief Non-blocking check for any of the given flags
     *
     * @param mask Flags of interest
     * @param fired Receives the flags of interest currently set
     */
    Result Poll(IrqFlags mask, IrqFlags* fired);

    /**
     * @brief Block until one of the given flags is set
     *
     * @param mask Flags of interest
     * @param timeout_ms Longest time to wait
     * @param fired Receives the flags of interest that were set
     * @return Result kTimeout if nothing fired within timeout_ms
     */
    Result Wait(IrqFlags mask, uint32_t timeout_ms, IrqFlags* fired);

   private:
    ICommandChannel& channel_;
    hal::IHal& hal_;
    uint32_t poll_interval_ms_;
};

}  // namespace radio
}  // namespace subghz
