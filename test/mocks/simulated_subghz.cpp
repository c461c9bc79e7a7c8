#include "simulated_subghz.hpp"

#include <algorithm>

namespace subghz {
namespace test {

using radio::IrqEvent;
using radio::IrqFlags;
using radio::RadioMode;

namespace {

constexpr uint8_t kCadExitToRx = 0x01;
constexpr uint32_t kContinuousRx = 0xFFFFFF;

uint8_t ChipModeBits(RadioMode mode) {
    switch (mode) {
        case RadioMode::kStandbyRc:
            return 0x2;
        case RadioMode::kStandbyXosc:
            return 0x3;
        case RadioMode::kFs:
            return 0x4;
        case RadioMode::kRx:
            return 0x5;
        case RadioMode::kTx:
            return 0x6;
        default:
            return 0x0;
    }
}

RadioMode FallbackMode(uint8_t fallback) {
    switch (fallback) {
        case 0x30:
            return RadioMode::kStandbyXosc;
        case 0x40:
            return RadioMode::kFs;
        default:
            return RadioMode::kStandbyRc;
    }
}

}  // namespace

SimulatedSubGhz::SimulatedSubGhz(size_t busy_polls, bool start_asleep)
    : busy_polls_(busy_polls),
      asleep_(start_asleep),
      mode_(start_asleep ? RadioMode::kSleep : RadioMode::kStandbyRc) {}

bool SimulatedSubGhz::IsBusy() {
    if (stuck_busy_ || asleep_) {
        return true;
    }
    if (busy_remaining_ > 0) {
        --busy_remaining_;
        return true;
    }
    return false;
}

void SimulatedSubGhz::Select() {
    selected_ = true;
    frame_.clear();
    frame_faulted_ = false;
    response_index_ = 0;

    if (asleep_) {
        // A falling select edge wakes the chip; the frame itself is lost
        asleep_ = false;
        mode_ = RadioMode::kStandbyRc;
        frame_faulted_ = true;
        response_.clear();
        reading_response_ = false;
        return;
    }

    if (stuck_busy_ || busy_remaining_ > 0) {
        ++select_while_busy_;
    }
    reading_response_ = !response_.empty();
}

void SimulatedSubGhz::Deselect() {
    selected_ = false;
    if (reading_response_) {
        response_.clear();
        reading_response_ = false;
    } else if (!frame_.empty() && !frame_faulted_) {
        ProcessFrame(frame_);
    }
    frame_.clear();
    busy_remaining_ = busy_polls_;
}

bool SimulatedSubGhz::Transfer(uint8_t tx, uint8_t* rx) {
    if (transfers_before_fault_) {
        if (*transfers_before_fault_ == 0) {
            frame_faulted_ = true;
            return false;
        }
        --*transfers_before_fault_;
    }

    if (reading_response_) {
        uint8_t byte = response_index_ < response_.size()
                           ? response_[response_index_]
                           : 0x00;
        ++response_index_;
        if (rx) {
            *rx = byte;
        }
        return true;
    }

    frame_.push_back(tx);
    if (rx) {
        *rx = StatusByte();
    }
    return true;
}

std::vector<Opcode> SimulatedSubGhz::getOpcodes() const {
    std::vector<Opcode> opcodes;
    for (const auto& frame : command_frames_) {
        opcodes.push_back(static_cast<Opcode>(frame[0]));
    }
    return opcodes;
}

size_t SimulatedSubGhz::CountOpcode(Opcode opcode) const {
    return std::count_if(command_frames_.begin(), command_frames_.end(),
                         [opcode](const std::vector<uint8_t>& frame) {
                             return frame[0] == static_cast<uint8_t>(opcode);
                         });
}

void SimulatedSubGhz::ClearHistory() {
    command_frames_.clear();
    cleared_masks_.clear();
    select_while_busy_ = 0;
}

uint8_t SimulatedSubGhz::getRegister(uint16_t address) const {
    auto it = registers_.find(address);
    return it == registers_.end() ? 0x00 : it->second;
}

void SimulatedSubGhz::SetTxOutcome(IrqFlags flags, size_t after_irq_reads) {
    tx_flags_ = flags;
    tx_reads_ = std::max<size_t>(after_irq_reads, 1);
}

void SimulatedSubGhz::FinishTransmit(IrqFlags flags) {
    Latch(flags);
    if (flags.Has(IrqEvent::kTxDone)) {
        command_status_ = 0x6;
    }
    EndActivity();
}

void SimulatedSubGhz::QueueRxEvent(RxEvent event) {
    event.after_irq_reads = std::max<size_t>(event.after_irq_reads, 1);
    rx_events_.push_back(std::move(event));
    if (activity_ == Activity::kRx && countdown_ == 0) {
        ArmRx();
    }
}

void SimulatedSubGhz::SetCadOutcome(bool detected, size_t after_irq_reads) {
    cad_detected_ = detected;
    cad_reads_ = std::max<size_t>(after_irq_reads, 1);
}

void SimulatedSubGhz::RaiseIrq(IrqFlags flags) {
    irq_ |= flags.bits();
}

void SimulatedSubGhz::FailTransfersAfter(size_t transfers) {
    transfers_before_fault_ = transfers;
}

void SimulatedSubGhz::ClearFaults() {
    stuck_busy_ = false;
    transfers_before_fault_.reset();
    status_override_.reset();
}

void SimulatedSubGhz::ProcessFrame(const std::vector<uint8_t>& frame) {
    command_frames_.push_back(frame);

    auto arg = [&frame](size_t index) -> uint8_t {
        return index + 1 < frame.size() ? frame[index + 1] : 0x00;
    };
    auto arg16 = [&arg](size_t index) -> uint16_t {
        return static_cast<uint16_t>((arg(index) << 8) | arg(index + 1));
    };
    auto arg24 = [&arg](size_t index) -> uint32_t {
        return (static_cast<uint32_t>(arg(index)) << 16) |
               (static_cast<uint32_t>(arg(index + 1)) << 8) | arg(index + 2);
    };

    uint8_t raw = frame[0];
    if (raw >= 0x80 && raw != static_cast<uint8_t>(Opcode::kGetStatus)) {
        command_status_ = 0x0;
    }

    switch (static_cast<Opcode>(raw)) {
        case Opcode::kSetSleep:
            asleep_ = true;
            mode_ = RadioMode::kSleep;
            activity_ = Activity::kNone;
            countdown_ = 0;
            break;
        case Opcode::kSetStandby:
            mode_ = arg(0) == 0x01 ? RadioMode::kStandbyXosc
                                   : RadioMode::kStandbyRc;
            activity_ = Activity::kNone;
            countdown_ = 0;
            continuous_rx_ = false;
            break;
        case Opcode::kSetFs:
            mode_ = RadioMode::kFs;
            break;
        case Opcode::kSetTx:
            mode_ = RadioMode::kTx;
            activity_ = Activity::kTx;
            countdown_ = tx_flags_.empty() ? 0 : tx_reads_;
            break;
        case Opcode::kSetTxContinuousWave:
        case Opcode::kSetTxContinuousPreamble:
            mode_ = RadioMode::kTx;
            activity_ = Activity::kNone;
            break;
        case Opcode::kSetRx:
            mode_ = RadioMode::kRx;
            continuous_rx_ = arg24(0) == kContinuousRx;
            ArmRx();
            break;
        case Opcode::kSetRxDutyCycle:
            mode_ = RadioMode::kRx;
            continuous_rx_ = false;
            ArmRx();
            break;
        case Opcode::kSetCad:
            mode_ = RadioMode::kRx;
            activity_ = Activity::kCad;
            countdown_ = cad_reads_;
            break;
        case Opcode::kSetTxRxFallbackMode:
            fallback_ = arg(0);
            break;
        case Opcode::kSetCadParams:
            cad_exit_ = arg(3);
            break;
        case Opcode::kSetBufferBaseAddress:
            tx_base_ = arg(0);
            rx_base_ = arg(1);
            break;
        case Opcode::kSetPacketType:
            packet_type_ = arg(0);
            break;
        case Opcode::kCfgDioIrq:
            irq_mask_ = arg16(0);
            break;
        case Opcode::kClearIrqStatus:
            irq_ &= static_cast<uint16_t>(~arg16(0));
            cleared_masks_.push_back(arg16(0));
            break;
        case Opcode::kWriteBuffer:
            for (size_t i = 2; i < frame.size(); ++i) {
                buffer_[(arg(0) + i - 2) & 0xFF] = frame[i];
            }
            break;
        case Opcode::kWriteRegister:
            for (size_t i = 3; i < frame.size(); ++i) {
                registers_[static_cast<uint16_t>(arg16(0) + i - 3)] = frame[i];
            }
            break;
        case Opcode::kReadBuffer: {
            std::vector<uint8_t> bytes{StatusByte()};
            for (size_t i = 0; i < buffer_.size(); ++i) {
                bytes.push_back(buffer_[(arg(0) + i) & 0xFF]);
            }
            Respond(std::move(bytes));
            break;
        }
        case Opcode::kReadRegister: {
            std::vector<uint8_t> bytes{StatusByte()};
            for (uint16_t i = 0; i < 255; ++i) {
                bytes.push_back(
                    getRegister(static_cast<uint16_t>(arg16(0) + i)));
            }
            Respond(std::move(bytes));
            break;
        }
        case Opcode::kGetStatus:
            Respond({StatusByte()});
            break;
        case Opcode::kGetIrqStatus:
            OnIrqRead();
            Respond({StatusByte(), static_cast<uint8_t>(irq_ >> 8),
                     static_cast<uint8_t>(irq_ & 0xFF)});
            break;
        case Opcode::kGetRxBufferStatus:
            Respond({StatusByte(), rx_length_, rx_pointer_});
            break;
        case Opcode::kGetPacketStatus:
            Respond({StatusByte(), 0x50, 0x1C, 0x52});
            break;
        case Opcode::kGetRssiInst:
            Respond({StatusByte(), 0xA0});
            break;
        case Opcode::kGetStats:
            Respond({StatusByte(), 0x00, 0x05, 0x00, 0x01, 0x00, 0x02});
            break;
        case Opcode::kGetError:
            Respond({StatusByte(), static_cast<uint8_t>(errors_ >> 8),
                     static_cast<uint8_t>(errors_ & 0xFF)});
            break;
        case Opcode::kClearError:
            errors_ = 0;
            break;
        case Opcode::kGetPacketType:
            Respond({StatusByte(), packet_type_});
            break;
        default:
            break;
    }
}

void SimulatedSubGhz::Respond(std::vector<uint8_t> bytes) {
    response_ = std::move(bytes);
}

void SimulatedSubGhz::OnIrqRead() {
    if (activity_ == Activity::kNone || countdown_ == 0) {
        return;
    }
    if (--countdown_ > 0) {
        return;
    }

    switch (activity_) {
        case Activity::kTx:
            FinishTransmit(tx_flags_);
            break;
        case Activity::kRx: {
            RxEvent event = std::move(rx_events_.front());
            rx_events_.pop_front();
            if (event.flags.Has(IrqEvent::kRxDone)) {
                for (size_t i = 0; i < event.payload.size(); ++i) {
                    buffer_[(rx_base_ + i) & 0xFF] = event.payload[i];
                }
                rx_length_ = static_cast<uint8_t>(event.payload.size());
                rx_pointer_ = rx_base_;
                command_status_ = 0x2;
            }
            Latch(event.flags);
            if (continuous_rx_) {
                ArmRx();
            } else {
                EndActivity();
            }
            break;
        }
        case Activity::kCad: {
            IrqFlags flags = IrqFlags::Of(IrqEvent::kCadDone);
            if (cad_detected_) {
                flags.Set(IrqEvent::kCadDetected);
            }
            Latch(flags);
            if (cad_detected_ && cad_exit_ == kCadExitToRx) {
                mode_ = RadioMode::kRx;
                continuous_rx_ = false;
                ArmRx();
            } else {
                EndActivity();
            }
            break;
        }
        default:
            break;
    }
}

void SimulatedSubGhz::Latch(IrqFlags flags) {
    irq_ |= flags.bits() & irq_mask_;
}

void SimulatedSubGhz::ArmRx() {
    activity_ = Activity::kRx;
    countdown_ = rx_events_.empty() ? 0 : rx_events_.front().after_irq_reads;
}

void SimulatedSubGhz::EndActivity() {
    activity_ = Activity::kNone;
    countdown_ = 0;
    continuous_rx_ = false;
    mode_ = FallbackMode(fallback_);
}

uint8_t SimulatedSubGhz::StatusByte() const {
    if (status_override_) {
        return *status_override_;
    }
    return static_cast<uint8_t>((ChipModeBits(mode_) << 4) |
                                (command_status_ << 1));
}

}  // namespace test
}  // namespace subghz
