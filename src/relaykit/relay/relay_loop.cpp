/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/relay_loop.hpp"

#include "relaykit/core/assert.hpp"
#include "relaykit/core/log.hpp"

rly::RelayLoop::RelayLoop(
    PeerRegistry& registry, ResponseCorrelator& correlator, SessionLog& session,
    const std::chrono::milliseconds correlation_timeout, const double max_plausible_delay_ms, WallClock wall_clock
) :
    registry_(registry),
    correlator_(correlator),
    session_(session),
    correlation_timeout_(correlation_timeout),
    max_plausible_delay_ms_(max_plausible_delay_ms),
    wall_clock_(std::move(wall_clock)) {
    RLY_ASSERT(wall_clock_ != nullptr, "A wall clock is required");
}

rly::RelayLoop::Outcome rly::RelayLoop::process(const wire::TelemetryPacket& packet) {
    // A replaced measurement connection may still be finishing its cycle, the next one waits for it.
    std::lock_guard lock(cycle_mutex_);

    if (!session_.is_active()) {
        return Outcome::ignored;
    }

    const auto actuation = registry_.current(Role::actuation);
    if (actuation == nullptr) {
        RLY_TRACE("No actuation peer, packet not forwarded");
        return Outcome::ignored;
    }

    wire::Command command;
    command.request_id = ++last_request_id_;
    command.voltage = packet.voltage;
    command.status = packet.status;

    const auto t1 = packet.send_time;

    if (auto result = actuation->send_message(command); !result) {
        RLY_ERROR("Failed to send command {} to actuation peer: {}", command.request_id, to_string(result.error()));
        actuation->close();
        return Outcome::send_failed;
    }

    const auto ack = correlator_.await_response(command.request_id, correlation_timeout_);
    if (!ack) {
        RLY_WARNING(
            "No acknowledgement of command {} within {} ms", command.request_id, correlation_timeout_.count()
        );
        return Outcome::timed_out;
    }

    const auto t4 = wall_clock_();
    const auto estimate = estimate_latency(t1, ack->receipt_time, ack->reply_send_time, t4);
    if (!estimate.is_plausible(max_plausible_delay_ms_ / 1000.0)) {
        RLY_WARNING("Implausible delay for command {}: {}", command.request_id, estimate.to_string());
    }

    LatencyRecord record;
    record.send_time = t1;
    record.corrected_receipt_time = estimate.corrected_t2;
    record.delay_ms = estimate.delay_ms();
    record.sensor_voltage = packet.voltage;
    record.status = packet.status;
    record.applied_voltage = ack->applied_voltage;
    record.sensor_position = packet.position;

    const auto sequence_number = session_.append(std::move(record));
    if (!sequence_number) {
        RLY_DEBUG("Session stopped while command {} was in flight", command.request_id);
        return Outcome::ignored;
    }

    RLY_DEBUG("Record #{}: delay {:.2f} ms", *sequence_number, estimate.delay_ms());
    return Outcome::correlated;
}

uint64_t rly::RelayLoop::last_request_id() const {
    std::lock_guard lock(cycle_mutex_);
    return last_request_id_;
}

const char* rly::to_string(const RelayLoop::Outcome outcome) {
    switch (outcome) {
        case RelayLoop::Outcome::ignored:
            return "ignored";
        case RelayLoop::Outcome::correlated:
            return "correlated";
        case RelayLoop::Outcome::timed_out:
            return "timed out";
        case RelayLoop::Outcome::send_failed:
            return "send failed";
    }
    return "unknown";
}
