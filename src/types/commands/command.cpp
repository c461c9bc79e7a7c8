#include "command.hpp"

#include "utils/byte_operations.h"

namespace subghz {

std::vector<uint8_t> Command::Serialize() const {
    std::vector<uint8_t> frame(1 + payload_.size());
    utils::ByteSerializer serializer(frame);
    serializer.WriteUint8(static_cast<uint8_t>(opcode_));
    serializer.WriteBytes(payload_.data(), payload_.size());
    return frame;
}

namespace commands {

namespace {

std::vector<uint8_t> Timeout24(Timeout timeout) {
    std::vector<uint8_t> payload(3);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint24(timeout.bits());
    return payload;
}

}  // namespace

Command SetSleep(SleepConfig config) {
    return Command(Opcode::kSetSleep, {config.bits()});
}

Command SetStandby(StandbyClock clock) {
    return Command(Opcode::kSetStandby, {static_cast<uint8_t>(clock)});
}

Command SetFs() {
    return Command(Opcode::kSetFs);
}

Command SetTx(Timeout timeout) {
    return Command(Opcode::kSetTx, Timeout24(timeout));
}

Command SetRx(Timeout timeout) {
    return Command(Opcode::kSetRx, Timeout24(timeout));
}

Command SetRxDutyCycle(Timeout rx_period, Timeout sleep_period) {
    std::vector<uint8_t> payload(6);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint24(rx_period.bits());
    serializer.WriteUint24(sleep_period.bits());
    return Command(Opcode::kSetRxDutyCycle, std::move(payload));
}

Command SetCad() {
    return Command(Opcode::kSetCad);
}

Command SetTxContinuousWave() {
    return Command(Opcode::kSetTxContinuousWave);
}

Command SetTxContinuousPreamble() {
    return Command(Opcode::kSetTxContinuousPreamble);
}

Command SetStopRxTimerOnPreamble(bool enable) {
    return Command(Opcode::kSetStopRxTimerOnPreamble,
                   {static_cast<uint8_t>(enable ? 0x01 : 0x00)});
}

Command SetLoRaSymbTimeout(uint8_t symbols) {
    return Command(Opcode::kSetLoRaSymbTimeout, {symbols});
}

Command SetRegulatorMode(RegulatorMode mode) {
    return Command(Opcode::kSetRegulatorMode, {static_cast<uint8_t>(mode)});
}

Command SetTxRxFallbackMode(FallbackMode mode) {
    return Command(Opcode::kSetTxRxFallbackMode, {static_cast<uint8_t>(mode)});
}

Command SetTcxoMode(const TcxoMode& mode) {
    return Command(Opcode::kSetTcxoMode, mode.Encode());
}

Command Calibrate(uint8_t block_mask) {
    return Command(Opcode::kCalibrate,
                   {static_cast<uint8_t>(block_mask & calibration::kAll)});
}

Command CalibrateImage(uint8_t freq1, uint8_t freq2) {
    return Command(Opcode::kCalibrateImage, {freq1, freq2});
}

Command SetPaConfig(const PaConfig& config) {
    return Command(Opcode::kSetPaConfig, config.Encode());
}

Command SetPacketType(radio::PacketType type) {
    return Command(Opcode::kSetPacketType, {static_cast<uint8_t>(type)});
}

Command GetPacketType() {
    return Command(Opcode::kGetPacketType, {}, 2);
}

Command SetRfFrequency(RfFrequency frequency) {
    std::vector<uint8_t> payload(4);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint32(frequency.bits());
    return Command(Opcode::kSetRfFrequency, std::move(payload));
}

Command SetTxParams(const TxParams& params) {
    return Command(Opcode::kSetTxParams, params.Encode());
}

Command SetModulationParams(const ModulationParams& params) {
    return Command(Opcode::kSetModulationParams,
                   EncodeModulationParams(params));
}

Command SetPacketParams(const PacketParams& params) {
    return Command(Opcode::kSetPacketParams, EncodePacketParams(params));
}

Command SetCadParams(const CadParams& params) {
    return Command(Opcode::kSetCadParams, params.Encode());
}

Command SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base) {
    return Command(Opcode::kSetBufferBaseAddress, {tx_base, rx_base});
}

Command CfgDioIrq(radio::IrqFlags irq_mask, radio::IrqFlags dio1_mask,
                  radio::IrqFlags dio2_mask, radio::IrqFlags dio3_mask) {
    std::vector<uint8_t> payload(8);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(irq_mask.bits());
    serializer.WriteUint16(dio1_mask.bits());
    serializer.WriteUint16(dio2_mask.bits());
    serializer.WriteUint16(dio3_mask.bits());
    return Command(Opcode::kCfgDioIrq, std::move(payload));
}

Command GetIrqStatus() {
    return Command(Opcode::kGetIrqStatus, {}, 3);
}

Command ClearIrqStatus(radio::IrqFlags flags) {
    std::vector<uint8_t> payload(2);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(flags.bits());
    return Command(Opcode::kClearIrqStatus, std::move(payload));
}

Command GetStatus() {
    return Command(Opcode::kGetStatus, {}, 1);
}

Command GetRxBufferStatus() {
    return Command(Opcode::kGetRxBufferStatus, {}, 3);
}

Command GetPacketStatus() {
    return Command(Opcode::kGetPacketStatus, {}, 4);
}

Command GetRssiInst() {
    return Command(Opcode::kGetRssiInst, {}, 2);
}

Command GetStats() {
    return Command(Opcode::kGetStats, {}, 7);
}

Command ResetStats() {
    return Command(Opcode::kResetStats, std::vector<uint8_t>(6, 0x00));
}

Command GetError() {
    return Command(Opcode::kGetError, {}, 3);
}

Command ClearError() {
    return Command(Opcode::kClearError, {0x00});
}

Command WriteBuffer(uint8_t offset, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> payload(1 + data.size());
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint8(offset);
    serializer.WriteBytes(data.data(), data.size());
    return Command(Opcode::kWriteBuffer, std::move(payload));
}

Command ReadBuffer(uint8_t offset, size_t length) {
    return Command(Opcode::kReadBuffer, {offset}, length + 1);
}

Command WriteRegister(uint16_t address, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> payload(2 + data.size());
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(address);
    serializer.WriteBytes(data.data(), data.size());
    return Command(Opcode::kWriteRegister, std::move(payload));
}

Command ReadRegister(uint16_t address, uint8_t length) {
    std::vector<uint8_t> payload(2);
    utils::ByteSerializer serializer(payload);
    serializer.WriteUint16(address);
    return Command(Opcode::kReadRegister, std::move(payload),
                   static_cast<size_t>(length) + 1);
}

}  // namespace commands

}  // namespace subghz
