// src/radio/calibration_table.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace subghz {
namespace radio {

/**
 * @brief Image calibration bytes for one frequency band
 */
struct CalibrationEntry {
    uint32_t min_hz;
    uint32_t max_hz;
    uint8_t freq1;
    uint8_t freq2;
};

/**
 * @brief Frequency band to CalibrateImage argument lookup
 *
 * Known ISM bands use the datasheet values. Other frequencies calibrate a
 * 4 MHz-aligned window around the carrier.
 */
class CalibrationTable {
   public:
    /**
     * @brief The static band table, bounds inclusive
     */
    static const std::vector<CalibrationEntry>& Entries();

    /**
     * @brief Find the band containing a frequency
     *
     * @return std::optional<CalibrationEntry> nullopt outside every band
     */
    static std::optional<CalibrationEntry> Find(uint32_t frequency_hz);

    /**
     * @brief Calibration bytes for a frequency, table entry or derived
     *
     * @return CalibrationEntry with min_hz and max_hz set to the window
     */
    static CalibrationEntry For(uint32_t frequency_hz);
};

}  // namespace radio
}  // namespace subghz
