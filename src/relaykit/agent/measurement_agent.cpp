/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/agent/measurement_agent.hpp"

#include "relaykit/core/clock.hpp"
#include "relaykit/core/log.hpp"

rly::agent::MeasurementAgent::MeasurementAgent(
    AgentConfig config, SensorProvider& sensor, PositionProvider& positions
) :
    Agent(Role::measurement, std::move(config)), sensor_(sensor), positions_(positions) {}

rly::agent::MeasurementAgent::~MeasurementAgent() {
    stop();
}

rly::wire::TelemetryPacket rly::agent::MeasurementAgent::make_packet() {
    const auto reading = sensor_.read();

    wire::TelemetryPacket packet;
    packet.voltage = reading.voltage;
    packet.status = reading.status;
    packet.position = positions_.latest();
    packet.send_time = clock::now_wall_seconds();

    RLY_DEBUG(
        "Sample: voltage={:.2f}V, status={}, position={}", reading.voltage, reading.status_text(),
        packet.position ? packet.position->to_string() : "none"
    );

    return packet;
}

uint64_t rly::agent::MeasurementAgent::num_packets_sent() const {
    return num_packets_sent_;
}

tl::expected<void, rly::Error> rly::agent::MeasurementAgent::serve(PeerConnection& connection) {
    while (!stop_requested()) {
        if (auto result = connection.send_message(make_packet()); !result) {
            return result;
        }
        num_packets_sent_++;

        if (!sleep_for(config().send_interval)) {
            break;
        }
    }
    return {};
}
