#include "irq_flags.hpp"

#include <cstdio>

namespace subghz {
namespace radio {

const char* IrqEventToString(IrqEvent event) {
    switch (event) {
        case IrqEvent::kTxDone:
            return "TxDone";
        case IrqEvent::kRxDone:
            return "RxDone";
        case IrqEvent::kPreambleDetected:
            return "PreambleDetected";
        case IrqEvent::kSyncDetected:
            return "SyncDetected";
        case IrqEvent::kHeaderValid:
            return "HeaderValid";
        case IrqEvent::kHeaderErr:
            return "HeaderErr";
        case IrqEvent::kCrcErr:
            return "CrcErr";
        case IrqEvent::kCadDone:
            return "CadDone";
        case IrqEvent::kCadDetected:
            return "CadDetected";
        case IrqEvent::kTimeout:
            return "Timeout";
        default:
            return "Unknown";
    }
}

std::vector<IrqEvent> IrqFlags::Events() const {
    std::vector<IrqEvent> events;
    for (uint8_t bit = 0; bit <= static_cast<uint8_t>(IrqEvent::kTimeout);
         ++bit) {
        if (bits_ & (1U << bit)) {
            events.push_back(static_cast<IrqEvent>(bit));
        }
    }
    return events;
}

std::string IrqFlags::ToString() const {
    if (bits_ == 0) {
        return "None";
    }

    std::string out;
    for (IrqEvent event : Events()) {
        if (!out.empty()) {
            out += "|";
        }
        out += IrqEventToString(event);
    }

    // Bits outside the named events
    uint16_t unnamed = static_cast<uint16_t>(bits_ & ~All().bits());
    if (unnamed != 0) {
        char buffer[16];
        snprintf(buffer, sizeof(buffer), "0x%04X", unnamed);
        if (!out.empty()) {
            out += "|";
        }
        out += buffer;
    }
    return out;
}

}  // namespace radio
}  // namespace subghz
