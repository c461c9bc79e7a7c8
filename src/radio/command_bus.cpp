#include "command_bus.hpp"

#include "radio/status_decoder.hpp"
#include "utils/logger.hpp"

namespace subghz {
namespace radio {

CommandBus::CommandBus(hardware::IBusTransport& transport, hal::IHal& hal,
                       uint32_t busy_timeout_ms)
    : transport_(transport), hal_(hal), busy_timeout_ms_(busy_timeout_ms) {}

Result CommandBus::Execute(const Command& command,
                           std::vector<uint8_t>* response) {
    LOG_DEBUG("Bus command %s (%u bytes)",
              OpcodeToString(command.getOpcode()),
              static_cast<unsigned>(command.getPayload().size()));

    if (response) {
        response->clear();
    }

    Result result = WaitWhileBusy();
    if (!result) {
        return result;
    }

    result = WriteFrame(command.Serialize());
    if (!result) {
        return result;
    }

    // Busy stays asserted for as long as the radio sleeps
    if (command.getOpcode() == Opcode::kSetSleep) {
        return Result::Success();
    }

    result = WaitWhileBusy();
    if (!result) {
        return result;
    }

    if (!command.HasResponse()) {
        return Result::Success();
    }

    std::vector<uint8_t> bytes;
    result = ReadFrame(command.getResponseLength(), &bytes);
    if (!result) {
        return result;
    }

    Status status = StatusDecoder::Decode(bytes[0]);
    last_status_ = status;
    if (status.IsCommandError()) {
        LOG_WARNING("%s reported %s",
                    OpcodeToString(command.getOpcode()),
                    CommandStatusToString(status.command_status));
    }

    if (response) {
        *response = std::move(bytes);
    }
    return Result::Success();
}

Result CommandBus::Wakeup() {
    transport_.Select();
    transport_.Deselect();
    return WaitWhileBusy();
}

Result CommandBus::WaitWhileBusy() {
    if (!transport_.IsBusy()) {
        return Result::Success();
    }

    uint32_t start = hal_.millis();
    while (transport_.IsBusy()) {
        if (hal_.millis() - start >= busy_timeout_ms_) {
            LOG_ERROR("Busy signal did not clear within %u ms",
                      static_cast<unsigned>(busy_timeout_ms_));
            return Result::Error(SubGhzErrorCode::kBusTimeout);
        }
        hal_.delay(1);
    }
    return Result::Success();
}

Result CommandBus::WriteFrame(const std::vector<uint8_t>& bytes) {
    transport_.Select();
    for (uint8_t byte : bytes) {
        if (!transport_.Transfer(byte, nullptr)) {
            transport_.Deselect();
            LOG_ERROR("Transport fault while writing opcode 0x%02X",
                      bytes[0]);
            return Result::Error(SubGhzErrorCode::kTransportError);
        }
    }
    transport_.Deselect();
    LOG_BYTES("TX", bytes);
    return Result::Success();
}

Result CommandBus::ReadFrame(size_t length, std::vector<uint8_t>* bytes) {
    bytes->assign(length, 0);
    transport_.Select();
    for (size_t i = 0; i < length; ++i) {
        if (!transport_.Transfer(0x00, &(*bytes)[i])) {
            transport_.Deselect();
            LOG_ERROR("Transport fault while reading response");
            return Result::Error(SubGhzErrorCode::kTransportError);
        }
    }
    transport_.Deselect();
    LOG_BYTES("RX", *bytes);
    return Result::Success();
}

}  // namespace radio
}  // namespace subghz
