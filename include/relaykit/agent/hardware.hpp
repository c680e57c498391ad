/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "relaykit/wire/wire_messages.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace rly::agent {

/**
 * Samples at or below this voltage mean the sensor is disconnected.
 */
inline constexpr double k_proper_voltage_threshold = 0.1;

struct SensorReading {
    double voltage {};
    wire::DataStatus status {wire::DataStatus::junk};
    std::string detail;  // Reason for junk data, empty for proper data

    /**
     * @return The status as displayed to the user, like "Junk (Disconnected)".
     */
    [[nodiscard]] std::string status_text() const;
};

/**
 * Classifies a raw voltage sample.
 * @param voltage The sampled voltage.
 * @return The reading, proper when the voltage lies above the threshold.
 */
SensorReading classify_sensor_voltage(double voltage);

class SensorProvider {
  public:
    virtual ~SensorProvider() = default;

    /**
     * Takes a sample. Failures are reported as junk readings.
     * @return The reading.
     */
    virtual SensorReading read() = 0;
};

class ActuatorProvider {
  public:
    virtual ~ActuatorProvider() = default;

    /**
     * Drives the output according to a command.
     * @param voltage The requested voltage.
     * @param status The status of the sample the voltage was derived from. Junk data drives the output to 0 V.
     * @return The voltage actually applied.
     */
    virtual double apply(double voltage, wire::DataStatus status) = 0;

    /**
     * Drives the output to 0 V.
     */
    virtual void set_safe_state() = 0;
};

class PositionProvider {
  public:
    virtual ~PositionProvider() = default;

    /**
     * @return The most recent position fix, or nullopt if there is no fix.
     */
    [[nodiscard]] virtual std::optional<wire::Position> latest() const = 0;
};

/**
 * Sensor returning a configurable voltage.
 */
class SimulatedSensor final: public SensorProvider {
  public:
    explicit SimulatedSensor(double voltage);

    void set_voltage(double voltage);
    SensorReading read() override;

  private:
    std::atomic<double> voltage_;
};

/**
 * Model of a 12 bit DAC addressed with a 16 bit code, as found on the MCP4725 breakout boards.
 */
class SimulatedDac final: public ActuatorProvider {
  public:
    static constexpr uint16_t k_max_code = 65535;
    static constexpr double k_default_reference_voltage = 3.3;

    explicit SimulatedDac(double reference_voltage = k_default_reference_voltage);

    double apply(double voltage, wire::DataStatus status) override;
    void set_safe_state() override;

    /**
     * @return The code currently written to the DAC.
     */
    [[nodiscard]] uint16_t code() const;

    /**
     * @return The voltage corresponding to the current code.
     */
    [[nodiscard]] double output_voltage() const;

    /**
     * Converts a voltage to a DAC code, clamped to the valid range.
     * @param voltage The voltage.
     * @param reference_voltage The full scale voltage.
     * @return The code.
     */
    static uint16_t voltage_to_code(double voltage, double reference_voltage);

  private:
    double reference_voltage_;
    std::atomic<uint16_t> code_ {0};
};

/**
 * Reports a fixed position, or no fix at all.
 */
class StaticPositionProvider final: public PositionProvider {
  public:
    explicit StaticPositionProvider(std::optional<wire::Position> position = std::nullopt);

    void set_position(std::optional<wire::Position> position);
    [[nodiscard]] std::optional<wire::Position> latest() const override;

  private:
    mutable std::mutex mutex_;
    std::optional<wire::Position> position_;
};

}  // namespace rly::agent
