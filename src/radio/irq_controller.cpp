#include "irq_controller.hpp"

#include "utils/byte_operations.h"
#include "utils/logger.hpp"

namespace subghz {
namespace radio {

IrqController::IrqController(ICommandChannel& channel, hal::IHal& hal,
                             uint32_t poll_interval_ms)
    : channel_(channel), hal_(hal), poll_interval_ms_(poll_interval_ms) {}

Result IrqController::ReadFlags(IrqFlags* flags) {
    std::vector<uint8_t> response;
    Result result = channel_.Execute(commands::GetIrqStatus(), &response);
    if (!result) {
        return result;
    }

    utils::ByteDeserializer deserializer(response, 1);
    std::optional<uint16_t> bits = deserializer.ReadUint16();
    if (!bits) {
        return Result::Error(SubGhzErrorCode::kTransportError);
    }
    *flags = IrqFlags(*bits);
    return Result::Success();
}

Result IrqController::Clear(IrqFlags flags) {
    if (flags.empty()) {
        return Result::Success();
    }
    LOG_DEBUG("Clearing IRQ %s", flags.ToString().c_str());
    return channel_.Execute(commands::ClearIrqStatus(flags), nullptr);
}

Result IrqController::Configure(IrqFlags irq_mask, IrqFlags dio1_mask,
                                IrqFlags dio2_mask, IrqFlags dio3_mask) {
    return channel_.Execute(
        commands::CfgDioIrq(irq_mask, dio1_mask, dio2_mask, dio3_mask),
        nullptr);
}

Result IrqController::Poll(IrqFlags mask, IrqFlags* fired) {
    IrqFlags flags;
    Result result = ReadFlags(&flags);
    if (!result) {
        return result;
    }
    *fired = flags & mask;
    return Result::Success();
}

Result IrqController::Wait(IrqFlags mask, uint32_t timeout_ms,
                           IrqFlags* fired) {
    uint32_t start = hal_.millis();
    while (true) {
        Result result = Poll(mask, fired);
        if (!result) {
            return result;
        }
        if (!fired->empty()) {
            return Result::Success();
        }
        if (hal_.millis() - start >= timeout_ms) {
            LOG_WARNING("No %s within %u ms", mask.ToString().c_str(),
                        static_cast<unsigned>(timeout_ms));
            return Result::Error(SubGhzErrorCode::kTimeout);
        }
        hal_.delay(poll_interval_ms_);
    }
}

}  // namespace radio
}  // namespace subghz
