// test/mocks/fake_hal.hpp
#pragma once

#include <cstdint>

#include "hardware/hal.hpp"

namespace subghz {
namespace test {

/**
 * @brief HAL with a virtual clock that only advances on delay()
 */
class FakeHal : public hal::IHal {
   public:
    uint32_t millis() override { return now_ms_; }

    void delay(uint32_t ms) override {
        now_ms_ += ms;
        ++delay_calls_;
    }

    void Advance(uint32_t ms) { now_ms_ += ms; }

    uint32_t getDelayCalls() const { return delay_calls_; }

   private:
    uint32_t now_ms_{0};
    uint32_t delay_calls_{0};
};

}  // namespace test
}  // namespace subghz
