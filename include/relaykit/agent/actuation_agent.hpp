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

#include "agent.hpp"
#include "hardware.hpp"

namespace rly::agent {

/**
 * Applies the commands received from the relay to the actuator and acknowledges each of them with the receipt and
 * reply timestamps. The actuator is put in its safe state whenever the connection to the relay is lost.
 */
class ActuationAgent final: public Agent {
  public:
    /**
     * @param config The configuration.
     * @param actuator The actuator to drive. Must outlive the agent.
     * @param positions The position source. Must outlive the agent.
     */
    ActuationAgent(AgentConfig config, ActuatorProvider& actuator, PositionProvider& positions);
    ~ActuationAgent() override;

    /**
     * Applies a command and builds its acknowledgement.
     * @param command The command.
     * @return The acknowledgement, with t2 taken before and t3 taken after driving the actuator.
     */
    wire::Acknowledgement handle_command(const wire::Command& command);

    /**
     * @return The number of commands handled since construction.
     */
    [[nodiscard]] uint64_t num_commands_handled() const;

  protected:
    tl::expected<void, Error> serve(PeerConnection& connection) override;
    void on_disconnected() override;

  private:
    ActuatorProvider& actuator_;
    PositionProvider& positions_;
    std::atomic<uint64_t> num_commands_handled_ {0};
};

}  // namespace rly::agent
