// test/mocks/mock_bus_transport.hpp
#pragma once

#include <gmock/gmock.h>

#include "hardware/bus_transport.hpp"

namespace subghz {
namespace test {

class MockBusTransport : public hardware::IBusTransport {
   public:
    MOCK_METHOD(bool, IsBusy, (), (override));
    MOCK_METHOD(void, Select, (), (override));
    MOCK_METHOD(void, Deselect, (), (override));
    MOCK_METHOD(bool, Transfer, (uint8_t tx, uint8_t* rx), (override));
};

}  // namespace test
}  // namespace subghz
