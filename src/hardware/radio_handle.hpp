// src/hardware/radio_handle.hpp
#pragma once

#include <memory>

#include "hardware/bus_transport.hpp"

namespace subghz {
namespace hardware {

/**
 * @brief Exclusive ownership token over the radio's command bus
 *
 * The transceiver is a single hardware resource. At most one RadioHandle
 * exists at a time in the process; a second Acquire fails until the live
 * handle is destroyed. Whoever holds the handle is the only component
 * allowed to issue command-bus transactions.
 */
class RadioHandle {
   public:
    /**
     * @brief Take ownership of the radio
     *
     * @param transport Byte transport to the radio, must outlive the handle
     * @return std::unique_ptr<RadioHandle> The handle, nullptr if another
     * handle is live
     */
    static std::unique_ptr<RadioHandle> Acquire(IBusTransport& transport);

    /**
     * @brief Check whether a handle is currently live
     */
    static bool IsHeld();

    ~RadioHandle();

    RadioHandle(const RadioHandle&) = delete;
    RadioHandle& operator=(const RadioHandle&) = delete;
    RadioHandle(RadioHandle&&) = delete;
    RadioHandle& operator=(RadioHandle&&) = delete;

    IBusTransport& getTransport() { return transport_; }

   private:
    explicit RadioHandle(IBusTransport& transport) : transport_(transport) {}

    IBusTransport& transport_;
};

}  // namespace hardware
}  // namespace subghz
