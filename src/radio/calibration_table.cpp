#include "calibration_table.hpp"

namespace subghz {
namespace radio {

namespace {

constexpr uint32_t kStepHz = 4000000;

const std::vector<CalibrationEntry> kEntries = {
    {430000000, 440000000, 0x6B, 0x6F},
    {470000000, 510000000, 0x75, 0x81},
    {779000000, 787000000, 0xC1, 0xC5},
    {863000000, 870000000, 0xD7, 0xDB},
    {902000000, 928000000, 0xE1, 0xE9},
};

}  // namespace

const std::vector<CalibrationEntry>& CalibrationTable::Entries() {
    return kEntries;
}

std::optional<CalibrationEntry> CalibrationTable::Find(uint32_t frequency_hz) {
    for (const auto& entry : kEntries) {
        if (frequency_hz >= entry.min_hz && frequency_hz <= entry.max_hz) {
            return entry;
        }
    }
    return std::nullopt;
}

CalibrationEntry CalibrationTable::For(uint32_t frequency_hz) {
    std::optional<CalibrationEntry> entry = Find(frequency_hz);
    if (entry) {
        return *entry;
    }
    uint32_t low = frequency_hz / kStepHz;
    uint32_t high = (frequency_hz + kStepHz - 1) / kStepHz;
    return CalibrationEntry{low * kStepHz, high * kStepHz,
                            static_cast<uint8_t>(low),
                            static_cast<uint8_t>(high)};
}

}  // namespace radio
}  // namespace subghz
