// src/types/commands/opcode.hpp
#pragma once

#include <cstdint>

namespace subghz {

/**
 * @brief One-byte command opcodes of the radio command bus
 */
enum class Opcode : uint8_t {
    kResetStats = 0x00,
    kClearIrqStatus = 0x02,
    kClearError = 0x07,
    kCfgDioIrq = 0x08,
    kWriteRegister = 0x0D,
    kWriteBuffer = 0x0E,
    kGetStats = 0x10,
    kGetPacketType = 0x11,
    kGetIrqStatus = 0x12,
    kGetRxBufferStatus = 0x13,
    kGetPacketStatus = 0x14,
    kGetRssiInst = 0x15,
    kGetError = 0x17,
    kReadRegister = 0x1D,
    kReadBuffer = 0x1E,
    kSetStandby = 0x80,
    kSetRx = 0x82,
    kSetTx = 0x83,
    kSetSleep = 0x84,
    kSetRfFrequency = 0x86,
    kSetCadParams = 0x88,
    kCalibrate = 0x89,
    kSetPacketType = 0x8A,
    kSetModulationParams = 0x8B,
    kSetPacketParams = 0x8C,
    kSetTxParams = 0x8E,
    kSetBufferBaseAddress = 0x8F,
    kSetTxRxFallbackMode = 0x93,
    kSetRxDutyCycle = 0x94,
    kSetPaConfig = 0x95,
    kSetRegulatorMode = 0x96,
    kSetTcxoMode = 0x97,
    kCalibrateImage = 0x98,
    kSetStopRxTimerOnPreamble = 0x9F,
    kSetLoRaSymbTimeout = 0xA0,
    kGetStatus = 0xC0,
    kSetFs = 0xC1,
    kSetCad = 0xC5,
    kSetTxContinuousWave = 0xD1,
    kSetTxContinuousPreamble = 0xD2
};

/// Every opcode, in numeric order.
constexpr Opcode kAllOpcodes[] = {
    Opcode::kResetStats,
    Opcode::kClearIrqStatus,
    Opcode::kClearError,
    Opcode::kCfgDioIrq,
    Opcode::kWriteRegister,
    Opcode::kWriteBuffer,
    Opcode::kGetStats,
    Opcode::kGetPacketType,
    Opcode::kGetIrqStatus,
    Opcode::kGetRxBufferStatus,
    Opcode::kGetPacketStatus,
    Opcode::kGetRssiInst,
    Opcode::kGetError,
    Opcode::kReadRegister,
    Opcode::kReadBuffer,
    Opcode::kSetStandby,
    Opcode::kSetRx,
    Opcode::kSetTx,
    Opcode::kSetSleep,
    Opcode::kSetRfFrequency,
    Opcode::kSetCadParams,
    Opcode::kCalibrate,
    Opcode::kSetPacketType,
    Opcode::kSetModulationParams,
    Opcode::kSetPacketParams,
    Opcode::kSetTxParams,
    Opcode::kSetBufferBaseAddress,
    Opcode::kSetTxRxFallbackMode,
    Opcode::kSetRxDutyCycle,
    Opcode::kSetPaConfig,
    Opcode::kSetRegulatorMode,
    Opcode::kSetTcxoMode,
    Opcode::kCalibrateImage,
    Opcode::kSetStopRxTimerOnPreamble,
    Opcode::kSetLoRaSymbTimeout,
    Opcode::kGetStatus,
    Opcode::kSetFs,
    Opcode::kSetCad,
    Opcode::kSetTxContinuousWave,
    Opcode::kSetTxContinuousPreamble};

/**
 * @brief Converts an Opcode to its command name
 */
inline const char* OpcodeToString(Opcode opcode) {
    switch (opcode) {
        case Opcode::kResetStats:
            return "ResetStats";
        case Opcode::kClearIrqStatus:
            return "ClearIrqStatus";
        case Opcode::kClearError:
            return "ClearError";
        case Opcode::kCfgDioIrq:
            return "CfgDioIrq";
        case Opcode::kWriteRegister:
            return "WriteRegister";
        case Opcode::kWriteBuffer:
            return "WriteBuffer";
        case Opcode::kGetStats:
            return "GetStats";
        case Opcode::kGetPacketType:
            return "GetPacketType";
        case Opcode::kGetIrqStatus:
            return "GetIrqStatus";
        case Opcode::kGetRxBufferStatus:
            return "GetRxBufferStatus";
        case Opcode::kGetPacketStatus:
            return "GetPacketStatus";
        case Opcode::kGetRssiInst:
            return "GetRssiInst";
        case Opcode::kGetError:
            return "GetError";
        case Opcode::kReadRegister:
            return "ReadRegister";
        case Opcode::kReadBuffer:
            return "ReadBuffer";
        case Opcode::kSetStandby:
            return "SetStandby";
        case Opcode::kSetRx:
            return "SetRx";
        case Opcode::kSetTx:
            return "SetTx";
        case Opcode::kSetSleep:
            return "SetSleep";
        case Opcode::kSetRfFrequency:
            return "SetRfFrequency";
        case Opcode::kSetCadParams:
            return "SetCadParams";
        case Opcode::kCalibrate:
            return "Calibrate";
        case Opcode::kSetPacketType:
            return "SetPacketType";
        case Opcode::kSetModulationParams:
            return "SetModulationParams";
        case Opcode::kSetPacketParams:
            return "SetPacketParams";
        case Opcode::kSetTxParams:
            return "SetTxParams";
        case Opcode::kSetBufferBaseAddress:
            return "SetBufferBaseAddress";
        case Opcode::kSetTxRxFallbackMode:
            return "SetTxRxFallbackMode";
        case Opcode::kSetRxDutyCycle:
            return "SetRxDutyCycle";
        case Opcode::kSetPaConfig:
            return "SetPaConfig";
        case Opcode::kSetRegulatorMode:
            return "SetRegulatorMode";
        case Opcode::kSetTcxoMode:
            return "SetTcxoMode";
        case Opcode::kCalibrateImage:
            return "CalibrateImage";
        case Opcode::kSetStopRxTimerOnPreamble:
            return "SetStopRxTimerOnPreamble";
        case Opcode::kSetLoRaSymbTimeout:
            return "SetLoRaSymbTimeout";
        case Opcode::kGetStatus:
            return "GetStatus";
        case Opcode::kSetFs:
            return "SetFs";
        case Opcode::kSetCad:
            return "SetCad";
        case Opcode::kSetTxContinuousWave:
            return "SetTxContinuousWave";
        case Opcode::kSetTxContinuousPreamble:
            return "SetTxContinuousPreamble";
        default:
            return "Unknown";
    }
}

}  // namespace subghz
