// src/hardware/arduino/arduino_hal.hpp
#pragma once

#include "config/system_config.hpp"

#ifdef SUBGHZ_BUILD_ARDUINO

#include "../hal.hpp"

namespace subghz {
namespace hal {

/**
 * @brief Hardware abstraction layer implementation for Arduino.
 */
class ArduinoHal : public IHal {
   public:
    ArduinoHal() = default;

    uint32_t millis() override { return ::millis(); }

    void delay(uint32_t ms) override { ::delay(ms); }
};

}  // namespace hal
}  // namespace subghz

#endif  // SUBGHZ_BUILD_ARDUINO
