#include "radio_handle.hpp"

#include <atomic>

#include "utils/logger.hpp"

namespace subghz {
namespace hardware {

namespace {
std::atomic<bool> handle_in_use{false};
}  // namespace

std::unique_ptr<RadioHandle> RadioHandle::Acquire(IBusTransport& transport) {
    bool expected = false;
    if (!handle_in_use.compare_exchange_strong(expected, true)) {
        LOG_ERROR("Radio handle already in use");
        return nullptr;
    }
    return std::unique_ptr<RadioHandle>(new RadioHandle(transport));
}

bool RadioHandle::IsHeld() {
    return handle_in_use.load();
}

RadioHandle::~RadioHandle() {
    handle_in_use.store(false);
}

}  // namespace hardware
}  // namespace subghz
