/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/agent/hardware.hpp"

#include "relaykit/core/assert.hpp"
#include "relaykit/core/log.hpp"

#include <algorithm>
#include <cmath>

std::string rly::agent::SensorReading::status_text() const {
    if (detail.empty()) {
        return wire::to_string(status);
    }
    return fmt::format("{} ({})", wire::to_string(status), detail);
}

rly::agent::SensorReading rly::agent::classify_sensor_voltage(const double voltage) {
    SensorReading reading;
    reading.voltage = voltage;
    if (voltage > k_proper_voltage_threshold) {
        reading.status = wire::DataStatus::proper;
    } else {
        reading.status = wire::DataStatus::junk;
        reading.detail = "Disconnected";
    }
    return reading;
}

rly::agent::SimulatedSensor::SimulatedSensor(const double voltage) : voltage_(voltage) {}

void rly::agent::SimulatedSensor::set_voltage(const double voltage) {
    voltage_ = voltage;
}

rly::agent::SensorReading rly::agent::SimulatedSensor::read() {
    return classify_sensor_voltage(voltage_);
}

rly::agent::SimulatedDac::SimulatedDac(const double reference_voltage) : reference_voltage_(reference_voltage) {
    RLY_ASSERT(reference_voltage_ > 0.0, "Reference voltage must be positive");
}

double rly::agent::SimulatedDac::apply(const double voltage, const wire::DataStatus status) {
    if (status != wire::DataStatus::proper) {
        code_ = 0;
        return 0.0;
    }
    code_ = voltage_to_code(voltage, reference_voltage_);
    RLY_TRACE("DAC code set to {} for {:.4f}V", code_.load(), voltage);
    return voltage;
}

void rly::agent::SimulatedDac::set_safe_state() {
    code_ = 0;
}

uint16_t rly::agent::SimulatedDac::code() const {
    return code_;
}

double rly::agent::SimulatedDac::output_voltage() const {
    return static_cast<double>(code_.load()) / k_max_code * reference_voltage_;
}

uint16_t rly::agent::SimulatedDac::voltage_to_code(const double voltage, const double reference_voltage) {
    if (reference_voltage <= 0.0 || !std::isfinite(voltage)) {
        return 0;
    }
    const auto code = std::trunc(voltage / reference_voltage * k_max_code);
    return static_cast<uint16_t>(std::clamp(code, 0.0, static_cast<double>(k_max_code)));
}

rly::agent::StaticPositionProvider::StaticPositionProvider(std::optional<wire::Position> position) :
    position_(position) {}

void rly::agent::StaticPositionProvider::set_position(std::optional<wire::Position> position) {
    std::lock_guard lock(mutex_);
    position_ = position;
}

std::optional<rly::wire::Position> rly::agent::StaticPositionProvider::latest() const {
    std::lock_guard lock(mutex_);
    return position_;
}
