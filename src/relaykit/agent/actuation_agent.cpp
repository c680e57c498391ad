/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/agent/actuation_agent.hpp"

#include "relaykit/core/clock.hpp"
#include "relaykit/core/log.hpp"

rly::agent::ActuationAgent::ActuationAgent(
    AgentConfig config, ActuatorProvider& actuator, PositionProvider& positions
) :
    Agent(Role::actuation, std::move(config)), actuator_(actuator), positions_(positions) {}

rly::agent::ActuationAgent::~ActuationAgent() {
    stop();
}

rly::wire::Acknowledgement rly::agent::ActuationAgent::handle_command(const wire::Command& command) {
    wire::Acknowledgement ack;
    ack.request_id = command.request_id;
    ack.receipt_time = clock::now_wall_seconds();

    RLY_DEBUG("Command {}: status={}, voltage={:.2f}V", command.request_id, wire::to_string(command.status), command.voltage);
    ack.applied_voltage = actuator_.apply(command.voltage, command.status);
    ack.position = positions_.latest();
    num_commands_handled_++;

    ack.reply_send_time = clock::now_wall_seconds();
    return ack;
}

uint64_t rly::agent::ActuationAgent::num_commands_handled() const {
    return num_commands_handled_;
}

tl::expected<void, rly::Error> rly::agent::ActuationAgent::serve(PeerConnection& connection) {
    while (!stop_requested()) {
        auto command = connection.receive_message<wire::Command>();
        if (!command) {
            if (stop_requested()) {
                break;
            }
            return tl::unexpected(command.error());
        }

        if (auto result = connection.send_message(handle_command(*command)); !result) {
            return result;
        }
    }
    return {};
}

void rly::agent::ActuationAgent::on_disconnected() {
    actuator_.set_safe_state();
    RLY_INFO("Actuator set to safe state");
}
