// src/radio/guarded_command_channel.hpp
#pragma once

#include "radio/command_channel.hpp"
#include "radio/mode_state_machine.hpp"

namespace subghz {
namespace radio {

/**
 * @brief Command channel that enforces the operating-mode rules
 *
 * Checks every command against the ModeStateMachine before it reaches the
 * bus and records the mode transition once it succeeded. A rejected
 * command causes no bus traffic.
 */
class GuardedCommandChannel : public ICommandChannel {
   public:
    GuardedCommandChannel(ICommandChannel& inner, ModeStateMachine& modes)
        : inner_(inner), modes_(modes) {}

    Result Execute(const Command& command,
                   std::vector<uint8_t>* response) override {
        Result result = modes_.Guard(command);
        if (!result) {
            return result;
        }
        result = inner_.Execute(command, response);
        if (!result) {
            return result;
        }
        modes_.Apply(command);
        return Result::Success();
    }

   private:
    ICommandChannel& inner_;
    ModeStateMachine& modes_;
};

}  // namespace radio
}  // namespace subghz
