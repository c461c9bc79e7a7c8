// src/types/configurations/driver_configuration.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace subghz {

/**
 * @brief Driver-side timing and buffer settings
 *
 * Independent from the radio session configuration: these values bound how
 * long the driver waits on the hardware and how large the on-chip buffer
 * is assumed to be.
 */
class DriverConfig {
   public:
    static constexpr uint32_t kDefaultBusyTimeoutMs = 100;
    static constexpr uint32_t kDefaultPollIntervalMs = 1;
    static constexpr size_t kDefaultBufferCapacity = 256;
    static constexpr size_t kMaxBufferCapacity = 256;  ///< One-byte offsets

    /**
     * @brief Construct a new Driver Config object
     *
     * @param busy_timeout_ms Bound on each wait for the busy signal
     * @param poll_interval_ms Sleep between polls in blocking waits
     * @param buffer_capacity Size of the on-chip packet buffer in bytes
     * @throw std::invalid_argument if a value is out of range
     */
    explicit DriverConfig(uint32_t busy_timeout_ms = kDefaultBusyTimeoutMs,
                          uint32_t poll_interval_ms = kDefaultPollIntervalMs,
                          size_t buffer_capacity = kDefaultBufferCapacity);

    static DriverConfig CreateDefault() { return DriverConfig{}; }

    uint32_t getBusyTimeoutMs() const { return busy_timeout_ms_; }
    uint32_t getPollIntervalMs() const { return poll_interval_ms_; }
    size_t getBufferCapacity() const { return buffer_capacity_; }

    /**
     * @throw std::invalid_argument if timeout is zero
     */
    void setBusyTimeoutMs(uint32_t timeout_ms);

    void setPollIntervalMs(uint32_t interval_ms) {
        poll_interval_ms_ = interval_ms;
    }

    /**
     * @throw std::invalid_argument if capacity exceeds 256 bytes
     */
    void setBufferCapacity(size_t capacity);

    bool IsValid() const;

    std::string Validate() const;

   private:
    uint32_t busy_timeout_ms_;
    uint32_t poll_interval_ms_;
    size_t buffer_capacity_;
};

}  // namespace subghz
