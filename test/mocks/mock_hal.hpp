// test/mocks/mock_hal.hpp
#pragma once

#include <gmock/gmock.h>

#include "hardware/hal.hpp"

namespace subghz {
namespace test {

class MockHal : public hal::IHal {
   public:
    MOCK_METHOD(uint32_t, millis, (), (override));
    MOCK_METHOD(void, delay, (uint32_t ms), (override));
};

}  // namespace test
}  // namespace subghz
