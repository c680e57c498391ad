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

#include "relaykit/core/expected.hpp"
#include "relaykit/core/json.hpp"
#include "relaykit/wire/role.hpp"
#include "relaykit/wire/wire_messages.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rly::agent {

/**
 * Configuration shared by the measurement and the actuation agent. Keys missing from a configuration file keep their
 * defaults.
 */
struct AgentConfig {
    std::string relay_host {"127.0.0.1"};
    uint16_t relay_port {};  // 0 selects the default port of the agent's role
    std::string agent_id;
    std::chrono::milliseconds send_interval {500};
    std::chrono::milliseconds reconnect_delay {5000};
    double sensor_voltage {1.0};
    double dac_reference_voltage {3.3};
    std::optional<wire::Position> position;

    /**
     * @param role The role of the agent.
     * @return The port to connect to.
     */
    [[nodiscard]] uint16_t port_for(const Role role) const {
        return relay_port != 0 ? relay_port : default_port(role);
    }

    /**
     * Checks the values for consistency.
     * @return Nothing if valid, or a description of the first problem found.
     */
    [[nodiscard]] tl::expected<void, std::string> validate() const;

    [[nodiscard]] std::string to_string() const;
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const AgentConfig& config);
AgentConfig tag_invoke(const boost::json::value_to_tag<AgentConfig>&, const boost::json::value& jv);

/**
 * Loads and validates an agent configuration from a JSON file.
 * @param path The file.
 * @return The configuration, or a description of what went wrong.
 */
tl::expected<AgentConfig, std::string> load_agent_config(const std::filesystem::path& path);

}  // namespace rly::agent
