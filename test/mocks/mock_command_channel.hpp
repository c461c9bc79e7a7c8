// test/mocks/mock_command_channel.hpp
#pragma once

#include <gmock/gmock.h>

#include <vector>

#include "radio/command_channel.hpp"

namespace subghz {
namespace test {

class MockCommandChannel : public radio::ICommandChannel {
   public:
    MOCK_METHOD(Result, Execute,
                (const Command& command, std::vector<uint8_t>* response),
                (override));
};

/**
 * @brief Matches a Command by opcode
 */
MATCHER_P(HasOpcode, opcode, "") {
    return arg.getOpcode() == opcode;
}

/**
 * @brief Matches a Command by opcode and exact payload
 */
MATCHER_P2(IsCommand, opcode, payload, "") {
    return arg.getOpcode() == opcode &&
           arg.getPayload() == std::vector<uint8_t>(payload);
}

}  // namespace test
}  // namespace subghz
