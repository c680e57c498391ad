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

#include <catch2/catch_all.hpp>

TEST_CASE("rly::agent::classify_sensor_voltage") {
    SECTION("Threshold is exclusive") {
        REQUIRE(rly::agent::classify_sensor_voltage(0.1).status == rly::wire::DataStatus::junk);
        REQUIRE(rly::agent::classify_sensor_voltage(0.1001).status == rly::wire::DataStatus::proper);
        REQUIRE(rly::agent::classify_sensor_voltage(-2.0).status == rly::wire::DataStatus::junk);
    }

    SECTION("Status text") {
        REQUIRE(rly::agent::classify_sensor_voltage(3.0).status_text() == "Proper");
        REQUIRE(rly::agent::classify_sensor_voltage(0.0).status_text() == "Junk (Disconnected)");
    }

    SECTION("Simulated sensor") {
        rly::agent::SimulatedSensor sensor(1.0);
        REQUIRE(sensor.read().status == rly::wire::DataStatus::proper);
        sensor.set_voltage(0.02);
        const auto reading = sensor.read();
        REQUIRE(reading.voltage == 0.02);
        REQUIRE(reading.status == rly::wire::DataStatus::junk);
    }
}

TEST_CASE("rly::agent::SimulatedDac") {
    SECTION("Voltage to code") {
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(0.0, 3.3) == 0);
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(3.3, 3.3) == 65535);
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(1.65, 3.3) == 32767);
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(5.0, 3.3) == 65535);
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(-1.0, 3.3) == 0);
        REQUIRE(rly::agent::SimulatedDac::voltage_to_code(1.0, 0.0) == 0);
    }

    SECTION("Proper data drives the output") {
        rly::agent::SimulatedDac dac(3.3);
        REQUIRE(dac.apply(1.65, rly::wire::DataStatus::proper) == 1.65);
        REQUIRE(dac.code() == 32767);
        REQUIRE_THAT(dac.output_voltage(), Catch::Matchers::WithinAbs(1.65, 0.001));
    }

    SECTION("Junk data drives the output to zero") {
        rly::agent::SimulatedDac dac(3.3);
        dac.apply(2.0, rly::wire::DataStatus::proper);
        REQUIRE(dac.code() != 0);
        REQUIRE(dac.apply(2.0, rly::wire::DataStatus::junk) == 0.0);
        REQUIRE(dac.code() == 0);
    }

    SECTION("Safe state") {
        rly::agent::SimulatedDac dac(5.0);
        dac.apply(2.5, rly::wire::DataStatus::proper);
        dac.set_safe_state();
        REQUIRE(dac.code() == 0);
        REQUIRE(dac.output_voltage() == 0.0);
    }
}

TEST_CASE("rly::agent::StaticPositionProvider") {
    rly::agent::StaticPositionProvider provider;
    REQUIRE_FALSE(provider.latest());
    provider.set_position(rly::wire::Position {10.0, 20.0});
    REQUIRE(provider.latest() == rly::wire::Position {10.0, 20.0});
}
