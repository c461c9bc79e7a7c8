// src/hardware/bus_transport.hpp
#pragma once

#include <cstdint>

namespace subghz {
namespace hardware {

/**
 * @brief Byte-level command-bus transport provided by the platform
 *
 * Wraps the serial link to the radio subsystem: a full-duplex byte
 * exchange framed by a select line, plus the busy signal the radio holds
 * while it is processing a command. Implementations do not interpret the
 * bytes they move.
 */
class IBusTransport {
   public:
    virtual ~IBusTransport() = default;

    /**
     * @brief Sample the busy signal
     *
     * @return true while the radio cannot accept a new transaction
     */
    virtual bool IsBusy() = 0;

    /**
     * @brief Assert the bus-select signal, opening a transaction frame
     */
    virtual void Select() = 0;

    /**
     * @brief Release the bus-select signal, closing the frame
     */
    virtual void Deselect() = 0;

    /**
     * @brief Exchange one byte
     *
     * @param tx Byte clocked out to the radio
     * @param rx Receives the byte clocked in, may be nullptr
     * @return bool False if the transport reported a fault
     */
    virtual bool Transfer(uint8_t tx, uint8_t* rx) = 0;
};

}  // namespace hardware
}  // namespace subghz
