/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/agent/agent_config.hpp"

#include "relaykit/core/file.hpp"

tl::expected<void, std::string> rly::agent::AgentConfig::validate() const {
    if (relay_host.empty()) {
        return tl::unexpected(std::string("relay host must not be empty"));
    }
    if (send_interval <= std::chrono::milliseconds::zero()) {
        return tl::unexpected(std::string("send interval must be positive"));
    }
    if (reconnect_delay < std::chrono::milliseconds::zero()) {
        return tl::unexpected(std::string("reconnect delay must not be negative"));
    }
    if (dac_reference_voltage <= 0.0) {
        return tl::unexpected(std::string("dac reference voltage must be positive"));
    }
    return {};
}

std::string rly::agent::AgentConfig::to_string() const {
    return fmt::format(
        "relay={}:{}, agent_id={}, send_interval={}ms, reconnect_delay={}ms, sensor_voltage={:.3f}V, "
        "dac_reference_voltage={:.3f}V, position={}",
        relay_host, relay_port, agent_id, send_interval.count(), reconnect_delay.count(), sensor_voltage,
        dac_reference_voltage, position ? position->to_string() : "none"
    );
}

void rly::agent::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const AgentConfig& config) {
    jv = {
        {"relay_host", config.relay_host},
        {"relay_port", config.relay_port},
        {"agent_id", config.agent_id},
        {"send_interval_ms", config.send_interval.count()},
        {"reconnect_delay_ms", config.reconnect_delay.count()},
        {"sensor_voltage", config.sensor_voltage},
        {"dac_reference_voltage", config.dac_reference_voltage},
        {"position", wire::detail::position_to_value(config.position)},
    };
}

rly::agent::AgentConfig
rly::agent::tag_invoke(const boost::json::value_to_tag<AgentConfig>&, const boost::json::value& jv) {
    const auto* obj = jv.if_object();
    if (obj == nullptr) {
        throw std::invalid_argument("agent config must be a json object");
    }

    AgentConfig config;
    if (const auto* v = obj->if_contains("relay_host")) {
        config.relay_host = boost::json::value_to<std::string>(*v);
    }
    if (const auto* v = obj->if_contains("relay_port")) {
        const auto port = boost::json::value_to<int64_t>(*v);
        if (port < 0 || port > 65535) {
            throw std::invalid_argument("relay_port out of range");
        }
        config.relay_port = static_cast<uint16_t>(port);
    }
    if (const auto* v = obj->if_contains("agent_id")) {
        config.agent_id = boost::json::value_to<std::string>(*v);
    }
    if (const auto* v = obj->if_contains("send_interval_ms")) {
        config.send_interval = std::chrono::milliseconds(boost::json::value_to<int64_t>(*v));
    }
    if (const auto* v = obj->if_contains("reconnect_delay_ms")) {
        config.reconnect_delay = std::chrono::milliseconds(boost::json::value_to<int64_t>(*v));
    }
    if (const auto* v = obj->if_contains("sensor_voltage")) {
        config.sensor_voltage = json_to_number(*v, "sensor_voltage");
    }
    if (const auto* v = obj->if_contains("dac_reference_voltage")) {
        config.dac_reference_voltage = json_to_number(*v, "dac_reference_voltage");
    }
    config.position = wire::detail::position_from_member(*obj, "position");
    return config;
}

tl::expected<rly::agent::AgentConfig, std::string> rly::agent::load_agent_config(const std::filesystem::path& path) {
    const auto text = file::read_file_as_string(path);
    if (!text) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), file::to_string(text.error())));
    }

    auto config = parse_json<AgentConfig>(*text);
    if (!config) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), config.error()));
    }

    if (auto valid = config->validate(); !valid) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), valid.error()));
    }

    return config;
}
