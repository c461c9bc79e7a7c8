// src/radio/command_bus.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "hardware/bus_transport.hpp"
#include "hardware/hal.hpp"
#include "radio/command_channel.hpp"
#include "types/radio/status.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Serializes commands onto the byte transport
 *
 * Each transaction waits for the busy signal to clear, selects the radio,
 * writes the opcode and payload, deselects and waits for busy again. A
 * command with a response then opens a second frame and clocks in the
 * declared number of bytes, the status byte first.
 *
 * There is no queuing: one transaction runs to completion before the next
 * starts. Exclusive use is guaranteed by the RadioHandle that owns the
 * transport.
 */
class CommandBus : public ICommandChannel {
   public:
    /**
     * @param transport Byte transport to the radio
     * @param hal Clock used to bound busy waits
     * @param busy_timeout_ms Longest wait for the busy signal to clear
     */
    CommandBus(hardware::IBusTransport& transport, hal::IHal& hal,
               uint32_t busy_timeout_ms);

    /**
     * @brief Run one command-bus transaction
     *
     * @return Result kBusTimeout if busy never cleared, kTransportError if
     * a byte transfer failed
     */
    Result Execute(const Command& command,
                   std::vector<uint8_t>* response) override;

    /**
     * @brief Wake the radio from sleep
     *
     * Pulses the select line without waiting for busy, which stays
     * asserted while the radio sleeps, then waits for busy to clear.
     */
    Result Wakeup();

    /**
     * @brief Sample the busy signal
     */
    bool IsBusy() { return transport_.IsBusy(); }

    /**
     * @brief Wait until the radio is ready, bounded by the busy timeout
     *
     * @return Result kBusTimeout if busy did not clear in time
     */
    Result WaitWhileBusy();

    /**
     * @brief Status decoded from the most recent response
     *
     * @return std::optional<Status> nullopt until a response was read
     */
    const std::optional<Status>& getLastStatus() const {
        return last_status_;
    }

   private:
    Result WriteFrame(const std::vector<uint8_t>& bytes);
    Result ReadFrame(size_t length, std::vector<uint8_t>* bytes);

    hardware::IBusTransport& transport_;
    hal::IHal& hal_;
    uint32_t busy_timeout_ms_;
    std::optional<Status> last_status_;
};

}  // namespace radio
}  // namespace subghz
