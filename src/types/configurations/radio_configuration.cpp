#include "radio_configuration.hpp"

#include <sstream>
#include <stdexcept>

#include "types/configurations/rf_frequency.hpp"

namespace subghz {

namespace {

bool ModulationIsValid(const ModulationParams& params) {
    if (const auto* gfsk = std::get_if<GfskModParams>(&params)) {
        return gfsk->IsValid();
    }
    if (const auto* bpsk = std::get_if<BpskModParams>(&params)) {
        return bpsk->IsValid();
    }
    return true;
}

bool PacketIsValid(const PacketParams& params) {
    if (const auto* generic = std::get_if<GenericPacketParams>(&params)) {
        return generic->IsValid();
    }
    return true;
}

}  // namespace

RadioConfig::RadioConfig(uint32_t frequency_hz, ModulationParams modulation,
                         PacketParams packet)
    : frequency_hz_(frequency_hz),
      modulation_params_(std::move(modulation)),
      packet_params_(std::move(packet)) {
    if (!IsValid()) {
        throw std::invalid_argument("Invalid radio configuration: " +
                                    Validate());
    }
}

RadioConfig RadioConfig::CreateDefaultLoRa() {
    return RadioConfig{};
}

RadioConfig RadioConfig::CreateDefaultGfsk() {
    return RadioConfig{868000000, GfskModParams{}, GenericPacketParams{}};
}

void RadioConfig::setFrequency(uint32_t frequency_hz) {
    if (!RfFrequency::IsInRange(frequency_hz)) {
        throw std::invalid_argument("Frequency out of valid range");
    }
    frequency_hz_ = frequency_hz;
}

void RadioConfig::setParams(const ModulationParams& modulation,
                            const PacketParams& packet) {
    if (PacketTypeOf(modulation) != PacketTypeOf(packet)) {
        throw std::invalid_argument(
            "Modulation and packet parameters use different packet types");
    }
    if (!ModulationIsValid(modulation)) {
        throw std::invalid_argument("Invalid modulation parameters");
    }
    if (!PacketIsValid(packet)) {
        throw std::invalid_argument("Invalid packet parameters");
    }
    modulation_params_ = modulation;
    packet_params_ = packet;
}

void RadioConfig::setTxParams(const TxParams& params) {
    if (!params.IsValid()) {
        throw std::invalid_argument("Power outside of the PA range");
    }
    tx_params_ = params;
}

bool RadioConfig::IsValid() const {
    return RfFrequency::IsInRange(frequency_hz_) &&
           PacketTypeOf(modulation_params_) == PacketTypeOf(packet_params_) &&
           ModulationIsValid(modulation_params_) &&
           PacketIsValid(packet_params_) && tx_params_.IsValid();
}

std::string RadioConfig::Validate() const {
    std::stringstream errors;
    if (!RfFrequency::IsInRange(frequency_hz_)) {
        errors << "Frequency out of range. ";
    }
    if (PacketTypeOf(modulation_params_) != PacketTypeOf(packet_params_)) {
        errors << "Packet type mismatch between modulation and packet "
                  "parameters. ";
    }
    if (!ModulationIsValid(modulation_params_)) {
        errors << "Invalid modulation parameters. ";
    }
    if (!PacketIsValid(packet_params_)) {
        errors << "Invalid packet parameters. ";
    }
    if (!tx_params_.IsValid()) {
        errors << "Power out of range. ";
    }
    return errors.str();
}

}  // namespace subghz
