#include "radio_driver.hpp"

#include <algorithm>
#include <stdexcept>

#include "radio/calibration_table.hpp"
#include "radio/status_decoder.hpp"
#include "types/configurations/rf_frequency.hpp"
#include "utils/byte_operations.h"
#include "utils/logger.hpp"

namespace subghz {
namespace radio {

namespace {

// Err shares its bit with CrcErr, which a transmission never raises
constexpr IrqFlags kTxMask = IrqEvent::kTxDone | IrqEvent::kTimeout;
constexpr IrqFlags kRxMask = IrqEvent::kRxDone | IrqEvent::kTimeout |
                             IrqEvent::kHeaderErr | IrqEvent::kCrcErr;
constexpr IrqFlags kCadMask = IrqEvent::kCadDone | IrqEvent::kCadDetected;
constexpr size_t kMaxPayloadLength = 255;

}  // namespace

RadioDriver::RadioDriver(std::unique_ptr<hardware::RadioHandle> handle,
                         hal::IHal& hal, const DriverConfig& config)
    : handle_(std::move(handle)),
      config_(config),
      bus_(TransportOf(handle_), hal, config.getBusyTimeoutMs()),
      modes_(),
      channel_(bus_, modes_),
      buffers_(channel_, config.getBufferCapacity()),
      irq_(channel_, hal, config.getPollIntervalMs()) {}

hardware::IBusTransport& RadioDriver::TransportOf(
    const std::unique_ptr<hardware::RadioHandle>& handle) {
    if (!handle) {
        throw std::invalid_argument("Radio driver requires a radio handle");
    }
    return handle->getTransport();
}

Result RadioDriver::Begin(const RadioConfig& config) {
    if (!config.IsValid()) {
        return Result::Wrap("Begin",
                            Result::InvalidArgument(config.Validate()));
    }

    LOG_INFO("Starting radio: %s at %u Hz",
             PacketTypeToString(config.getPacketType()),
             static_cast<unsigned>(config.getFrequency()));

    Result result = SyncMode();
    if (!result) {
        return result;
    }

    result = Standby(config.getStandbyClock());
    if (!result) {
        return result;
    }

    if (config.getTcxoMode()) {
        result = SetTcxoMode(*config.getTcxoMode());
        if (!result) {
            return result;
        }
        // Calibration ran on the RC clock before the TCXO was enabled
        result = Calibrate(calibration::kAll);
        if (!result) {
            return result;
        }
    }

    result = SetRegulatorMode(config.getRegulatorMode());
    if (!result) {
        return result;
    }

    result = SetBufferBaseAddress(config.getTxBaseAddress(),
                                  config.getRxBaseAddress());
    if (!result) {
        return result;
    }

    result = SetPacketType(config.getPacketType());
    if (!result) {
        return result;
    }

    result = SetModulationParams(config.getModulationParams());
    if (!result) {
        return result;
    }

    result = SetPacketParams(config.getPacketParams());
    if (!result) {
        return result;
    }

    result = SetFrequency(config.getFrequency());
    if (!result) {
        return result;
    }

    result = SetPaConfig(config.getPaConfig());
    if (!result) {
        return result;
    }

    result = SetTxParams(config.getTxParams());
    if (!result) {
        return result;
    }

    result = SetFallbackMode(config.getFallbackMode());
    if (!result) {
        return result;
    }

    result = ConfigureIrq(config.getIrqMask(), config.getIrqMask());
    if (!result) {
        return result;
    }

    result = irq_.Clear(IrqFlags::All());
    if (!result) {
        return Finish("Begin", result);
    }

    Status status;
    result = GetStatus(&status);
    if (!result) {
        return result;
    }
    if (status.IsCommandError()) {
        LOG_ERROR("Radio reported %s after configuration",
                  CommandStatusToString(status.command_status));
        return Result::Wrap("Begin",
                            Result::Error(SubGhzErrorCode::kCommandFailed));
    }

    LOG_INFO("Radio ready in %s", RadioModeToString(modes_.getMode()));
    return Result::Success();
}

Result RadioDriver::SyncMode() {
    Result result = WakeIfAsleep();
    if (!result) {
        return Result::Wrap("SyncMode", result);
    }

    // Unguarded: this is the recovery path after the model went wrong
    std::vector<uint8_t> response;
    result = bus_.Execute(commands::GetStatus(), &response);
    if (!result) {
        return Result::Wrap("SyncMode", result);
    }

    Status status = StatusDecoder::Decode(response[0]);
    std::optional<RadioMode> mode = ToRadioMode(status.chip_mode);
    if (!mode) {
        LOG_WARNING("Undefined chip mode in status 0x%02X, keeping %s",
                    status.raw, RadioModeToString(modes_.getMode()));
        return Result::Success();
    }
    modes_.SetMode(*mode);
    if (*mode != RadioMode::kRx && *mode != RadioMode::kTx) {
        pending_ = Operation::kIdle;
    }
    return Result::Success();
}

Result RadioDriver::Sleep(SleepConfig config) {
    Result result = Run("Sleep", commands::SetSleep(config));
    if (!result) {
        return result;
    }
    pending_ = Operation::kIdle;
    if (!config.warm_start) {
        packet_type_.reset();
        modulation_params_.reset();
        packet_params_.reset();
    }
    return Result::Success();
}

Result RadioDriver::Standby(StandbyClock clock) {
    Result result = WakeIfAsleep();
    if (!result) {
        return Finish("Standby", result);
    }
    result = Run("Standby", commands::SetStandby(clock));
    if (!result) {
        return result;
    }
    if (pending_ != Operation::kIdle) {
        LOG_INFO("Operation in progress cancelled");
    }
    pending_ = Operation::kIdle;
    return Result::Success();
}

Result RadioDriver::SetFs() {
    return Run("SetFs", commands::SetFs());
}

Result RadioDriver::SetTxContinuousWave() {
    return Run("SetTxContinuousWave", commands::SetTxContinuousWave());
}

Result RadioDriver::SetTxContinuousPreamble() {
    return Run("SetTxContinuousPreamble", commands::SetTxContinuousPreamble());
}

Result RadioDriver::SetRegulatorMode(RegulatorMode mode) {
    return Run("SetRegulatorMode", commands::SetRegulatorMode(mode));
}

Result RadioDriver::SetTcxoMode(const TcxoMode& mode) {
    return Run("SetTcxoMode", commands::SetTcxoMode(mode));
}

Result RadioDriver::SetFallbackMode(FallbackMode mode) {
    return Run("SetFallbackMode", commands::SetTxRxFallbackMode(mode));
}

Result RadioDriver::Calibrate(uint8_t block_mask) {
    return Run("Calibrate", commands::Calibrate(block_mask));
}

Result RadioDriver::SetPacketType(PacketType type) {
    Result result = Run("SetPacketType", commands::SetPacketType(type));
    if (!result) {
        return result;
    }
    packet_type_ = type;
    modulation_params_.reset();
    packet_params_.reset();
    LOG_DEBUG("Packet type %s, parameters must be applied again",
              PacketTypeToString(type));
    return Result::Success();
}

Result RadioDriver::GetPacketType(PacketType* type) {
    std::vector<uint8_t> response;
    Result result = Run("GetPacketType", commands::GetPacketType(), &response);
    if (!result) {
        return result;
    }
    std::optional<PacketType> parsed = PacketTypeFromBits(response[1]);
    if (!parsed) {
        return Result::Wrap(
            "GetPacketType",
            Result(SubGhzErrorCode::kCommandFailed, "Reserved packet type"));
    }
    *type = *parsed;
    return Result::Success();
}

Result RadioDriver::SetModulationParams(const ModulationParams& params) {
    if (!packet_type_) {
        return Result::Wrap("SetModulationParams",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet type not set"));
    }
    if (PacketTypeOf(params) != *packet_type_) {
        LOG_WARNING("%s modulation parameters while packet type is %s",
                    PacketTypeToString(PacketTypeOf(params)),
                    PacketTypeToString(*packet_type_));
        return Result::Wrap(
            "SetModulationParams",
            Result::Error(SubGhzErrorCode::kConfigurationMismatch));
    }
    if (const auto* gfsk = std::get_if<GfskModParams>(&params)) {
        if (!gfsk->IsValid()) {
            return Result::Wrap(
                "SetModulationParams",
                Result::InvalidArgument("GFSK bitrate or deviation"));
        }
    }
    if (const auto* bpsk = std::get_if<BpskModParams>(&params)) {
        if (!bpsk->IsValid()) {
            return Result::Wrap("SetModulationParams",
                                Result::InvalidArgument("BPSK bitrate"));
        }
    }

    Result result =
        Run("SetModulationParams", commands::SetModulationParams(params));
    if (!result) {
        return result;
    }
    modulation_params_ = params;
    return Result::Success();
}

Result RadioDriver::SetPacketParams(const PacketParams& params) {
    if (!packet_type_) {
        return Result::Wrap("SetPacketParams",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet type not set"));
    }
    if (PacketTypeOf(params) != *packet_type_) {
        LOG_WARNING("%s packet parameters while packet type is %s",
                    PacketTypeToString(PacketTypeOf(params)),
                    PacketTypeToString(*packet_type_));
        return Result::Wrap(
            "SetPacketParams",
            Result::Error(SubGhzErrorCode::kConfigurationMismatch));
    }
    if (const auto* generic = std::get_if<GenericPacketParams>(&params)) {
        if (!generic->IsValid()) {
            return Result::Wrap("SetPacketParams",
                                Result::InvalidArgument("Sync word length"));
        }
    }

    Result result = Run("SetPacketParams", commands::SetPacketParams(params));
    if (!result) {
        return result;
    }
    packet_params_ = params;
    return Result::Success();
}

Result RadioDriver::SetFrequency(uint32_t frequency_hz) {
    if (!RfFrequency::IsInRange(frequency_hz)) {
        return Result::Wrap("SetFrequency",
                            Result::InvalidArgument("Frequency out of range"));
    }

    CalibrationEntry calibration = CalibrationTable::For(frequency_hz);
    Result result =
        Run("SetFrequency",
            commands::CalibrateImage(calibration.freq1, calibration.freq2));
    if (!result) {
        return result;
    }

    result = Run("SetFrequency",
                 commands::SetRfFrequency(RfFrequency::FromHz(frequency_hz)));
    if (!result) {
        return result;
    }
    LOG_DEBUG("Tuned to %u Hz", static_cast<unsigned>(frequency_hz));
    return Result::Success();
}

Result RadioDriver::SetTxParams(const TxParams& params) {
    if (!params.IsValid()) {
        return Result::Wrap("SetTxParams",
                            Result::InvalidArgument("Power out of range"));
    }
    return Run("SetTxParams", commands::SetTxParams(params));
}

Result RadioDriver::SetPaConfig(const PaConfig& config) {
    return Run("SetPaConfig", commands::SetPaConfig(config));
}

Result RadioDriver::SetPaOcp(Ocp ocp) {
    return WriteRegister(reg::kPaOcp, {static_cast<uint8_t>(ocp)});
}

Result RadioDriver::SetHseInTrim(uint8_t trim) {
    if (trim > reg::kMaxHseTrim) {
        return Result::Wrap("SetHseInTrim",
                            Result::InvalidArgument("Trim out of range"));
    }
    return WriteRegister(reg::kHseInTrim, {trim});
}

Result RadioDriver::SetBufferBaseAddress(uint8_t tx_base, uint8_t rx_base) {
    size_t highest = std::max(tx_base, rx_base);
    size_t room = buffers_.getCapacity() > highest
                      ? buffers_.getCapacity() - highest
                      : 0;
    return Finish("SetBufferBaseAddress",
                  buffers_.SetBufferBaseAddress(
                      tx_base, rx_base, std::min(room, kMaxPayloadLength)));
}

Result RadioDriver::ConfigureIrq(IrqFlags irq_mask, IrqFlags dio1_mask,
                                 IrqFlags dio2_mask, IrqFlags dio3_mask) {
    return Finish("ConfigureIrq", irq_.Configure(irq_mask, dio1_mask,
                                                 dio2_mask, dio3_mask));
}

Result RadioDriver::SetLoRaSyncWord(uint16_t sync_word) {
    return WriteRegister(reg::kLoRaSyncWord,
                         {static_cast<uint8_t>(sync_word >> 8),
                          static_cast<uint8_t>(sync_word & 0xFF)});
}

Result RadioDriver::SetSyncWord(const std::array<uint8_t, 8>& sync_word) {
    return WriteRegister(
        reg::kGenericSyncWord,
        std::vector<uint8_t>(sync_word.begin(), sync_word.end()));
}

Result RadioDriver::SetLoRaSymbTimeout(uint8_t symbols) {
    return Run("SetLoRaSymbTimeout", commands::SetLoRaSymbTimeout(symbols));
}

Result RadioDriver::SetStopRxTimerOnPreamble(bool enable) {
    return Run("SetStopRxTimerOnPreamble",
               commands::SetStopRxTimerOnPreamble(enable));
}

Result RadioDriver::WriteBuffer(size_t offset,
                                const std::vector<uint8_t>& data) {
    return Finish("WriteBuffer", buffers_.WritePayload(offset, data));
}

Result RadioDriver::ReadBuffer(size_t offset, size_t length,
                               std::vector<uint8_t>* data) {
    return Finish("ReadBuffer", buffers_.ReadPayload(offset, length, data));
}

Result RadioDriver::StartTransmit(const std::vector<uint8_t>& payload,
                                  Timeout timeout) {
    if (!packet_params_) {
        return Result::Wrap("StartTransmit",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet parameters not set"));
    }
    if (payload.size() > buffers_.getMaxPayloadLength()) {
        LOG_WARNING("Payload of %u bytes exceeds %u",
                    static_cast<unsigned>(payload.size()),
                    static_cast<unsigned>(buffers_.getMaxPayloadLength()));
        return Result::Wrap("StartTransmit",
                            Result::Error(SubGhzErrorCode::kBufferOverflow));
    }

    Result result =
        Finish("StartTransmit",
               buffers_.WritePayload(buffers_.getTxBaseAddress(), payload));
    if (!result) {
        return result;
    }

    uint8_t length = static_cast<uint8_t>(payload.size());
    if (PayloadLengthOf(*packet_params_) != length) {
        result = SetPacketParams(WithPayloadLength(*packet_params_, length));
        if (!result) {
            return result;
        }
    }

    result = Run("StartTransmit", commands::SetTx(timeout));
    if (!result) {
        return result;
    }
    pending_ = Operation::kTransmit;
    LOG_DEBUG("Transmitting %u bytes", static_cast<unsigned>(length));
    return Result::Success();
}

Result RadioDriver::PollTransmit(bool* complete) {
    *complete = false;
    if (pending_ != Operation::kTransmit) {
        return Result::Wrap("PollTransmit",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "No transmission in progress"));
    }

    IrqFlags fired;
    Result result = irq_.Poll(kTxMask, &fired);
    if (!result) {
        return Finish("PollTransmit", result);
    }
    if (fired.empty()) {
        return Result::Success();
    }
    return CompleteTransmit(fired, complete);
}

Result RadioDriver::Transmit(const std::vector<uint8_t>& payload,
                             Timeout timeout, uint32_t wait_ms) {
    Result result = StartTransmit(payload, timeout);
    if (!result) {
        return result;
    }

    IrqFlags fired;
    result = irq_.Wait(kTxMask, wait_ms, &fired);
    if (!result) {
        return Finish("Transmit", result);
    }
    bool complete = false;
    return CompleteTransmit(fired, &complete);
}

Result RadioDriver::CompleteTransmit(IrqFlags fired, bool* complete) {
    Result result = irq_.Clear(fired);
    if (!result) {
        return Finish("Transmit", result);
    }
    modes_.OnIrq(fired);
    pending_ = Operation::kIdle;
    *complete = true;

    result = SyncMode();
    if (!result) {
        return result;
    }

    if (!fired.Has(IrqEvent::kTxDone)) {
        LOG_WARNING("Transmission timed out");
        return Result::Wrap("Transmit",
                            Result::Error(SubGhzErrorCode::kTimeout));
    }
    LOG_DEBUG("Transmission done");
    return Result::Success();
}

Result RadioDriver::StartReceive(Timeout timeout) {
    if (!packet_type_) {
        return Result::Wrap("StartReceive",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet type not set"));
    }
    if (*packet_type_ == PacketType::kBpsk) {
        return Result::Wrap(
            "StartReceive",
            Result(SubGhzErrorCode::kConfigurationMismatch,
                   "BPSK is transmit only"));
    }

    Result result = Run("StartReceive", commands::SetRx(timeout));
    if (!result) {
        return result;
    }
    pending_ = Operation::kReceive;
    return Result::Success();
}

Result RadioDriver::StartReceiveDutyCycle(Timeout rx_period,
                                          Timeout sleep_period) {
    if (!packet_type_) {
        return Result::Wrap("StartReceiveDutyCycle",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet type not set"));
    }

    Result result = Run("StartReceiveDutyCycle",
                        commands::SetRxDutyCycle(rx_period, sleep_period));
    if (!result) {
        return result;
    }
    pending_ = Operation::kReceive;
    return Result::Success();
}

Result RadioDriver::PollReceive(bool* complete, ReceivedPacket* packet) {
    *complete = false;
    if (pending_ != Operation::kReceive) {
        return Result::Wrap("PollReceive",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "No reception in progress"));
    }

    IrqFlags fired;
    Result result = irq_.Poll(kRxMask, &fired);
    if (!result) {
        return Finish("PollReceive", result);
    }
    if (fired.empty()) {
        return Result::Success();
    }
    return CompleteReceive(fired, complete, packet);
}

Result RadioDriver::Receive(Timeout timeout, uint32_t wait_ms,
                            ReceivedPacket* packet) {
    Result result = StartReceive(timeout);
    if (!result) {
        return result;
    }

    IrqFlags fired;
    result = irq_.Wait(kRxMask, wait_ms, &fired);
    if (!result) {
        return Finish("Receive", result);
    }
    bool complete = false;
    return CompleteReceive(fired, &complete, packet);
}

Result RadioDriver::CompleteReceive(IrqFlags fired, bool* complete,
                                    ReceivedPacket* packet) {
    ReceivedPacket received;

    if (fired.Has(IrqEvent::kRxDone)) {
        received.status = fired.Has(IrqEvent::kCrcErr) ? RxStatus::kCrcError
                                                       : RxStatus::kOk;

        // Length and start offset are only known once the packet is in
        std::vector<uint8_t> response;
        Result result = Run("Receive", commands::GetRxBufferStatus(), &response);
        if (!result) {
            return result;
        }
        uint8_t length = response[1];
        uint8_t offset = response[2];

        result = Finish("Receive",
                        buffers_.ReadPayload(offset, length, &received.payload));
        if (!result) {
            return result;
        }

        result = GetPacketStatus(&received.signal);
        if (!result) {
            return result;
        }
    } else if (fired.Has(IrqEvent::kHeaderErr)) {
        received.status = RxStatus::kHeaderError;
    } else if (fired.Has(IrqEvent::kCrcErr)) {
        received.status = RxStatus::kCrcError;
    } else {
        received.status = RxStatus::kTimeout;
    }

    Result result = irq_.Clear(fired);
    if (!result) {
        return Finish("Receive", result);
    }
    modes_.OnIrq(fired);
    if (modes_.getMode() != RadioMode::kRx) {
        pending_ = Operation::kIdle;
    }

    result = SyncMode();
    if (!result) {
        return result;
    }

    LOG_DEBUG("Reception %s, %u bytes", RxStatusToString(received.status),
              static_cast<unsigned>(received.payload.size()));
    *packet = std::move(received);
    *complete = true;
    return Result::Success();
}

Result RadioDriver::StartCad(const CadParams& params) {
    if (packet_type_ != PacketType::kLoRa) {
        return Result::Wrap(
            "StartCad", Result(SubGhzErrorCode::kConfigurationMismatch,
                               "Channel activity detection requires LoRa"));
    }

    Result result = Run("StartCad", commands::SetCadParams(params));
    if (!result) {
        return result;
    }
    result = Run("StartCad", commands::SetCad());
    if (!result) {
        return result;
    }
    pending_ = Operation::kCad;
    return Result::Success();
}

Result RadioDriver::PollCad(bool* complete, bool* detected) {
    *complete = false;
    *detected = false;
    if (pending_ != Operation::kCad) {
        return Result::Wrap("PollCad", Result(SubGhzErrorCode::kNotInitialized,
                                              "No CAD in progress"));
    }

    IrqFlags fired;
    Result result = irq_.Poll(kCadMask, &fired);
    if (!result) {
        return Finish("PollCad", result);
    }
    if (!fired.Has(IrqEvent::kCadDone)) {
        return Result::Success();
    }
    return CompleteCad(fired, complete, detected);
}

Result RadioDriver::Cad(const CadParams& params, uint32_t wait_ms,
                        bool* detected) {
    Result result = StartCad(params);
    if (!result) {
        return result;
    }

    IrqFlags fired;
    result = irq_.Wait(IrqFlags::Of(IrqEvent::kCadDone), wait_ms, &fired);
    if (!result) {
        return Finish("Cad", result);
    }
    // CadDetected is raised together with CadDone
    result = irq_.Poll(kCadMask, &fired);
    if (!result) {
        return Finish("Cad", result);
    }
    bool complete = false;
    return CompleteCad(fired, &complete, detected);
}

Result RadioDriver::CompleteCad(IrqFlags fired, bool* complete,
                                bool* detected) {
    Result result = irq_.Clear(fired);
    if (!result) {
        return Finish("Cad", result);
    }
    modes_.OnIrq(fired);
    *detected = fired.Has(IrqEvent::kCadDetected);
    *complete = true;
    pending_ = modes_.getMode() == RadioMode::kRx ? Operation::kReceive
                                                  : Operation::kIdle;

    result = SyncMode();
    if (!result) {
        return result;
    }
    LOG_DEBUG("CAD done, activity %s", *detected ? "detected" : "clear");
    return Result::Success();
}

Result RadioDriver::GetStatus(Status* status) {
    Result result = WakeIfAsleep();
    if (!result) {
        return Finish("GetStatus", result);
    }
    std::vector<uint8_t> response;
    result = Run("GetStatus", commands::GetStatus(), &response);
    if (!result) {
        return result;
    }
    *status = StatusDecoder::Decode(response[0]);
    return Result::Success();
}

Result RadioDriver::GetPacketStatus(PacketStatus* status) {
    if (!packet_type_) {
        return Result::Wrap("GetPacketStatus",
                            Result(SubGhzErrorCode::kNotInitialized,
                                   "Packet type not set"));
    }
    std::vector<uint8_t> response;
    Result result =
        Run("GetPacketStatus", commands::GetPacketStatus(), &response);
    if (!result) {
        return result;
    }
    *status = PacketStatus::Decode(*packet_type_, response);
    return Result::Success();
}

Result RadioDriver::GetRssiInst(float* rssi_dbm) {
    std::vector<uint8_t> response;
    Result result = Run("GetRssiInst", commands::GetRssiInst(), &response);
    if (!result) {
        return result;
    }
    *rssi_dbm = -static_cast<float>(response[1]) / 2.0F;
    return Result::Success();
}

Result RadioDriver::GetStats(Stats* stats) {
    std::vector<uint8_t> response;
    Result result = Run("GetStats", commands::GetStats(), &response);
    if (!result) {
        return result;
    }

    utils::ByteDeserializer deserializer(response);
    std::optional<uint8_t> status = deserializer.ReadUint8();
    std::optional<uint16_t> received = deserializer.ReadUint16();
    std::optional<uint16_t> crc_errors = deserializer.ReadUint16();
    std::optional<uint16_t> other_errors = deserializer.ReadUint16();
    if (!status || !received || !crc_errors || !other_errors) {
        return Result::Wrap("GetStats",
                            Result::Error(SubGhzErrorCode::kTransportError));
    }
    stats->status = StatusDecoder::Decode(*status);
    stats->packets_received = *received;
    stats->crc_errors = *crc_errors;
    stats->header_or_length_errors = *other_errors;
    return Result::Success();
}

Result RadioDriver::ResetStats() {
    return Run("ResetStats", commands::ResetStats());
}

Result RadioDriver::GetErrors(uint16_t* errors) {
    std::vector<uint8_t> response;
    Result result = Run("GetErrors", commands::GetError(), &response);
    if (!result) {
        return result;
    }
    utils::ByteDeserializer deserializer(response, 1);
    std::optional<uint16_t> bits = deserializer.ReadUint16();
    if (!bits) {
        return Result::Wrap("GetErrors",
                            Result::Error(SubGhzErrorCode::kTransportError));
    }
    *errors = *bits;
    return Result::Success();
}

Result RadioDriver::ClearErrors() {
    return Run("ClearErrors", commands::ClearError());
}

Result RadioDriver::ReadRegister(uint16_t address, uint8_t length,
                                 std::vector<uint8_t>* data) {
    std::vector<uint8_t> response;
    Result result = Run("ReadRegister",
                        commands::ReadRegister(address, length), &response);
    if (!result) {
        return result;
    }
    data->assign(response.begin() + 1, response.end());
    return Result::Success();
}

Result RadioDriver::WriteRegister(uint16_t address,
                                  const std::vector<uint8_t>& data) {
    return Run("WriteRegister", commands::WriteRegister(address, data));
}

Result RadioDriver::Run(const char* operation, const Command& command,
                        std::vector<uint8_t>* response) {
    return Finish(operation, channel_.Execute(command, response));
}

Result RadioDriver::Finish(const char* operation, Result result) {
    if (result) {
        return result;
    }
    if (result.HasError(SubGhzErrorCode::kIllegalTransition) ||
        result.HasError(SubGhzErrorCode::kTimeout)) {
        Result sync = SyncMode();
        if (!sync) {
            // Original failure stays last so it remains the root cause
            sync.MergeErrors(result);
            result = sync;
        }
    }
    return Result::Wrap(operation, result);
}

Result RadioDriver::WakeIfAsleep() {
    if (modes_.getMode() != RadioMode::kSleep) {
        return Result::Success();
    }
    LOG_DEBUG("Waking radio");
    return bus_.Wakeup();
}

}  // namespace radio
}  // namespace subghz
