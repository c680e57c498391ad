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

#include "response_correlator.hpp"
#include "relaykit/core/expected.hpp"
#include "relaykit/core/json.hpp"
#include "relaykit/wire/role.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rly {

/**
 * Configuration of the relay. Keys missing from a configuration file keep their defaults.
 */
struct RelayConfig {
    std::string bind_address {"0.0.0.0"};
    uint16_t measurement_port {k_default_measurement_port};
    uint16_t actuation_port {k_default_actuation_port};
    std::chrono::milliseconds correlation_timeout {ResponseCorrelator::k_default_timeout};
    double max_plausible_delay_ms {1000.0};
    std::string report_directory;  // Empty disables the CSV report

    /**
     * @param role The role.
     * @return The listening port of given role.
     */
    [[nodiscard]] uint16_t port(const Role role) const {
        return role == Role::measurement ? measurement_port : actuation_port;
    }

    /**
     * Checks the values for consistency.
     * @return Nothing if valid, or a description of the first problem found.
     */
    [[nodiscard]] tl::expected<void, std::string> validate() const;

    [[nodiscard]] std::string to_string() const;
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const RelayConfig& config);
RelayConfig tag_invoke(const boost::json::value_to_tag<RelayConfig>&, const boost::json::value& jv);

/**
 * Loads and validates a relay configuration from a JSON file.
 * @param path The file.
 * @return The configuration, or a description of what went wrong.
 */
tl::expected<RelayConfig, std::string> load_relay_config(const std::filesystem::path& path);

}  // namespace rly
