#include "driver_configuration.hpp"

#include <sstream>
#include <stdexcept>

namespace subghz {

DriverConfig::DriverConfig(uint32_t busy_timeout_ms, uint32_t poll_interval_ms,
                           size_t buffer_capacity)
    : busy_timeout_ms_(busy_timeout_ms),
      poll_interval_ms_(poll_interval_ms),
      buffer_capacity_(buffer_capacity) {
    if (!IsValid()) {
        throw std::invalid_argument("Invalid driver configuration: " +
                                    Validate());
    }
}

void DriverConfig::setBusyTimeoutMs(uint32_t timeout_ms) {
    if (timeout_ms == 0) {
        throw std::invalid_argument("Busy timeout must be positive");
    }
    busy_timeout_ms_ = timeout_ms;
}

void DriverConfig::setBufferCapacity(size_t capacity) {
    if (capacity > kMaxBufferCapacity) {
        throw std::invalid_argument("Buffer capacity exceeds 256 bytes");
    }
    buffer_capacity_ = capacity;
}

bool DriverConfig::IsValid() const {
    return busy_timeout_ms_ > 0 && buffer_capacity_ <= kMaxBufferCapacity;
}

std::string DriverConfig::Validate() const {
    std::stringstream errors;
    if (busy_timeout_ms_ == 0) {
        errors << "Busy timeout must be positive. ";
    }
    if (buffer_capacity_ > kMaxBufferCapacity) {
        errors << "Buffer capacity too large. ";
    }
    return errors.str();
}

}  // namespace subghz
