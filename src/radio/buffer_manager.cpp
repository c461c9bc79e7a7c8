#include "buffer_manager.hpp"

#include "utils/logger.hpp"

namespace subghz {
namespace radio {

BufferManager::BufferManager(ICommandChannel& channel, size_t capacity)
    : channel_(channel), capacity_(capacity) {}

Result BufferManager::SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base) {
    return SetBufferBaseAddress(tx_base, rx_base, max_payload_length_);
}

Result BufferManager::SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base,
                                           size_t max_payload_length) {
    if (!Fits(tx_base, max_payload_length) ||
        !Fits(rx_base, max_payload_length)) {
        LOG_WARNING("Base addresses tx=%u rx=%u do not fit %u byte payloads",
                    tx_base, rx_base,
                    static_cast<unsigned>(max_payload_length));
        return Result::Error(SubGhzErrorCode::kBufferOverflow);
    }

    Result result =
        channel_.Execute(commands::SetBufferBaseAddress(tx_base, rx_base),
                         nullptr);
    if (!result) {
        return result;
    }
    tx_base_ = tx_base;
    rx_base_ = rx_base;
    max_payload_length_ = max_payload_length;
    return Result::Success();
}

Result BufferManager::SetMaxPayloadLength(size_t length) {
    if (!Fits(tx_base_, length) || !Fits(rx_base_, length)) {
        return Result::Error(SubGhzErrorCode::kBufferOverflow);
    }
    max_payload_length_ = length;
    return Result::Success();
}

Result BufferManager::WritePayload(size_t offset,
                                   const std::vector<uint8_t>& data) {
    if (!Fits(offset, data.size())) {
        LOG_WARNING("Write of %u bytes at %u exceeds buffer capacity",
                    static_cast<unsigned>(data.size()),
                    static_cast<unsigned>(offset));
        return Result::Error(SubGhzErrorCode::kBufferOverflow);
    }
    if (data.empty()) {
        return Result::Success();
    }
    return channel_.Execute(
        commands::WriteBuffer(static_cast<uint8_t>(offset), data), nullptr);
}

Result BufferManager::ReadPayload(size_t offset, size_t length,
                                  std::vector<uint8_t>* data) {
    if (!Fits(offset, length)) {
        LOG_WARNING("Read of %u bytes at %u exceeds buffer capacity",
                    static_cast<unsigned>(length),
                    static_cast<unsigned>(offset));
        return Result::Error(SubGhzErrorCode::kBufferOverflow);
    }
    data->clear();
    if (length == 0) {
        return Result::Success();
    }

    std::vector<uint8_t> response;
    Result result = channel_.Execute(
        commands::ReadBuffer(static_cast<uint8_t>(offset), length), &response);
    if (!result) {
        return result;
    }
    if (response.size() < length + 1) {
        return Result::Error(SubGhzErrorCode::kTransportError);
    }
    data->assign(response.begin() + 1, response.begin() + 1 + length);
    return Result::Success();
}

}  // namespace radio
}  // namespace subghz
