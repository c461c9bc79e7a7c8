// src/hardware/native/native_hal.hpp
#pragma once

#include "../hal.hpp"
#include "config/system_config.hpp"

#ifdef SUBGHZ_BUILD_NATIVE
#include <chrono>
#include <thread>

namespace subghz {
namespace hal {

/**
 * @brief Hardware abstraction layer implementation for native platform.
 */
class NativeHal : public IHal {
   public:
    NativeHal() = default;

    /**
     * @brief Get the current time in milliseconds.
     *
     * @return Current time in milliseconds using std::chrono.
     */
    uint32_t millis() override {
        auto now = std::chrono::steady_clock::now();
        return static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

    /**
     * @brief Delay execution using std::this_thread::sleep_for.
     */
    void delay(uint32_t ms) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
};

}  // namespace hal
}  // namespace subghz

#endif  // SUBGHZ_BUILD_NATIVE
