#include "mode_state_machine.hpp"

#include "utils/logger.hpp"

namespace subghz {
namespace radio {

namespace {

constexpr RadioModeMask kStandby = kStandbyModes;
constexpr RadioModeMask kStandbyFs = kStandbyModes | ModeBit(RadioMode::kFs);
constexpr RadioModeMask kStandbyFsRx = kStandbyFs | ModeBit(RadioMode::kRx);
constexpr RadioModeMask kAwake = kAwakeModes;
constexpr RadioModeMask kAny = kAllModes;

// Placeholder target for rules that do not enter a fixed mode
constexpr RadioMode kNoTarget = RadioMode::kSleep;

const std::vector<ModeRule> kRules = {
    // Status and interrupt queries, any awake mode
    {Opcode::kGetStatus, kAny, TransitionKind::kWake, kNoTarget},
    {Opcode::kGetIrqStatus, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kClearIrqStatus, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetRxBufferStatus, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetPacketStatus, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetRssiInst, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetStats, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetError, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kClearError, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kGetPacketType, kAwake, TransitionKind::kStay, kNoTarget},
    {Opcode::kReadRegister, kAwake, TransitionKind::kStay, kNoTarget},

    // Buffer and register writes while no packet operation runs
    {Opcode::kReadBuffer, kStandbyFsRx, TransitionKind::kStay, kNoTarget},
    {Opcode::kWriteBuffer, kStandbyFs, TransitionKind::kStay, kNoTarget},
    {Opcode::kWriteRegister, kStandbyFs, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetRfFrequency, kStandbyFs, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetTxParams, kStandbyFs, TransitionKind::kStay, kNoTarget},

    // Configuration, standby only
    {Opcode::kResetStats, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kCfgDioIrq, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetCadParams, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kCalibrate, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kCalibrateImage, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetPacketType, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetModulationParams, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetPacketParams, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetBufferBaseAddress, kStandby, TransitionKind::kStay,
     kNoTarget},
    {Opcode::kSetTxRxFallbackMode, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetPaConfig, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetRegulatorMode, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetTcxoMode, kStandby, TransitionKind::kStay, kNoTarget},
    {Opcode::kSetStopRxTimerOnPreamble, kStandby, TransitionKind::kStay,
     kNoTarget},
    {Opcode::kSetLoRaSymbTimeout, kStandby, TransitionKind::kStay, kNoTarget},

    // Mode changes
    {Opcode::kSetStandby, kAny, TransitionKind::kStandbyClock, kNoTarget},
    {Opcode::kSetSleep, kStandby, TransitionKind::kEnter, RadioMode::kSleep},
    {Opcode::kSetFs, kStandbyFs, TransitionKind::kEnter, RadioMode::kFs},
    {Opcode::kSetTx, kStandbyFs, TransitionKind::kEnter, RadioMode::kTx},
    {Opcode::kSetTxContinuousWave, kStandbyFs, TransitionKind::kEnter,
     RadioMode::kTx},
    {Opcode::kSetTxContinuousPreamble, kStandbyFs, TransitionKind::kEnter,
     RadioMode::kTx},
    {Opcode::kSetRx, kStandbyFs, TransitionKind::kEnter, RadioMode::kRx},
    {Opcode::kSetRxDutyCycle, kStandbyFs, TransitionKind::kEnter,
     RadioMode::kRx},
    {Opcode::kSetCad, kStandbyFs, TransitionKind::kEnter, RadioMode::kRx},
};

FallbackMode FallbackFromByte(uint8_t byte) {
    switch (byte) {
        case static_cast<uint8_t>(FallbackMode::kStandbyXosc):
            return FallbackMode::kStandbyXosc;
        case static_cast<uint8_t>(FallbackMode::kFs):
            return FallbackMode::kFs;
        default:
            return FallbackMode::kStandbyRc;
    }
}

uint32_t Timeout24At(const std::vector<uint8_t>& payload, size_t offset) {
    if (payload.size() < offset + 3) {
        return 0;
    }
    return (static_cast<uint32_t>(payload[offset]) << 16) |
           (static_cast<uint32_t>(payload[offset + 1]) << 8) |
           payload[offset + 2];
}

}  // namespace

const std::vector<ModeRule>& ModeStateMachine::Rules() {
    return kRules;
}

const ModeRule* ModeStateMachine::FindRule(Opcode opcode) {
    for (const auto& rule : kRules) {
        if (rule.opcode == opcode) {
            return &rule;
        }
    }
    return nullptr;
}

bool ModeStateMachine::IsPermitted(Opcode opcode, RadioMode mode) {
    const ModeRule* rule = FindRule(opcode);
    return rule != nullptr && (rule->permitted_modes & ModeBit(mode)) != 0;
}

Result ModeStateMachine::Guard(const Command& command) const {
    if (IsPermitted(command.getOpcode(), mode_)) {
        return Result::Success();
    }
    LOG_WARNING("%s not permitted in mode %s",
                OpcodeToString(command.getOpcode()), RadioModeToString(mode_));
    return Result(SubGhzErrorCode::kIllegalTransition,
                  std::string(OpcodeToString(command.getOpcode())) +
                      " not permitted in " + RadioModeToString(mode_));
}

void ModeStateMachine::Apply(const Command& command) {
    const ModeRule* rule = FindRule(command.getOpcode());
    if (rule == nullptr) {
        return;
    }
    const std::vector<uint8_t>& payload = command.getPayload();

    switch (command.getOpcode()) {
        case Opcode::kSetTxRxFallbackMode:
            if (!payload.empty()) {
                fallback_mode_ = FallbackFromByte(payload[0]);
            }
            break;
        case Opcode::kSetCadParams:
            if (payload.size() > 3) {
                cad_exit_mode_ = payload[3] == 0x01 ? CadExitMode::kCadRx
                                                    : CadExitMode::kCadOnly;
            }
            break;
        default:
            break;
    }

    RadioMode previous = mode_;
    switch (rule->transition) {
        case TransitionKind::kStay:
            return;
        case TransitionKind::kWake:
            if (mode_ == RadioMode::kSleep) {
                mode_ = RadioMode::kStandbyRc;
            }
            break;
        case TransitionKind::kStandbyClock:
            mode_ = (!payload.empty() &&
                     payload[0] == static_cast<uint8_t>(StandbyClock::kXosc))
                        ? RadioMode::kStandbyXosc
                        : RadioMode::kStandbyRc;
            continuous_rx_ = false;
            cad_active_ = false;
            break;
        case TransitionKind::kEnter:
            mode_ = rule->target;
            continuous_rx_ = command.getOpcode() == Opcode::kSetRx &&
                             Timeout24At(payload, 0) == Timeout::kMaxBits;
            cad_active_ = command.getOpcode() == Opcode::kSetCad;
            break;
    }

    if (mode_ != previous) {
        LOG_DEBUG("Mode %s -> %s", RadioModeToString(previous),
                  RadioModeToString(mode_));
    }
}

void ModeStateMachine::OnIrq(IrqFlags flags) {
    if (mode_ == RadioMode::kTx) {
        if (flags.HasAny(IrqEvent::kTxDone | IrqEvent::kTimeout)) {
            EnterFallback();
        }
        return;
    }

    if (mode_ != RadioMode::kRx) {
        return;
    }

    if (cad_active_) {
        if (!flags.Has(IrqEvent::kCadDone)) {
            return;
        }
        cad_active_ = false;
        if (flags.Has(IrqEvent::kCadDetected) &&
            cad_exit_mode_ == CadExitMode::kCadRx) {
            LOG_DEBUG("Activity detected, staying in RX");
            return;
        }
        EnterFallback();
        return;
    }

    if (continuous_rx_) {
        return;
    }

    if (flags.HasAny(IrqEvent::kRxDone | IrqEvent::kTimeout |
                     IrqEvent::kHeaderErr)) {
        EnterFallback();
    }
}

void ModeStateMachine::SetMode(RadioMode mode) {
    if (mode != mode_) {
        LOG_INFO("Mode resynchronized %s -> %s", RadioModeToString(mode_),
                 RadioModeToString(mode));
    }
    mode_ = mode;
    if (mode_ != RadioMode::kRx) {
        continuous_rx_ = false;
        cad_active_ = false;
    }
}

void ModeStateMachine::EnterFallback() {
    RadioMode previous = mode_;
    mode_ = FallbackToRadioMode(fallback_mode_);
    continuous_rx_ = false;
    cad_active_ = false;
    LOG_DEBUG("Operation complete, mode %s -> %s",
              RadioModeToString(previous), RadioModeToString(mode_));
}

}  // namespace radio
}  // namespace subghz
