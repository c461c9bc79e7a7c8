// src/radio/command_channel.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "types/commands/command.hpp"
#include "types/error_codes/result.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Anything that can run a command-bus transaction
 *
 * Implemented by the raw CommandBus and by the mode-guarded channel that
 * RadioDriver hands to its components.
 */
class ICommandChannel {
   public:
    virtual ~ICommandChannel() = default;

    /**
     * @brief Run one command
     *
     * @param command Command to send
     * @param response Receives the response bytes, status byte first. Left
     * empty for commands without a response. May be nullptr.
     * @return Result Success, or the reason the command was not completed
     */
    virtual Result Execute(const Command& command,
                           std::vector<uint8_t>* response) = 0;
};

}  // namespace radio
}  // namespace subghz
