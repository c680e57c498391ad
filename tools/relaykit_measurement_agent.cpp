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
#include "relaykit/core/log.hpp"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <boost/asio.hpp>

/**
 * Measurement agent with a simulated sensor. Sends a telemetry packet to the relay every interval.
 */

int main(int const argc, char* argv[]) {
    rly::set_log_level_from_env();

    CLI::App app {"relaykit measurement agent"};
    argv = app.ensure_utf8(argv);

    std::string config_file;
    app.add_option("--config", config_file, "JSON configuration file");

    std::string host;
    app.add_option("--host", host, "The host the relay runs on");

    uint16_t port = 0;
    app.add_option("--port", port, "The measurement port of the relay");

    std::string agent_id;
    app.add_option("--id", agent_id, "The id the agent introduces itself with");

    int64_t interval_ms = 0;
    app.add_option("--interval-ms", interval_ms, "Time between two packets");

    std::optional<double> voltage;
    app.add_option("--voltage", voltage, "The voltage the simulated sensor reports");

    std::vector<double> position;
    app.add_option("--position", position, "Fixed position as latitude longitude")->expected(2);

    std::string log_level_name;
    app.add_option("--log-level", log_level_name, "TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL or OFF");

    CLI11_PARSE(app, argc, argv);

    if (!log_level_name.empty()) {
        rly::set_log_level(log_level_name.c_str());
    }

    rly::agent::AgentConfig config;
    config.agent_id = "sensor_agent";
    if (!config_file.empty()) {
        auto loaded = rly::agent::load_agent_config(config_file);
        if (!loaded) {
            RLY_ERROR("Failed to load configuration: {}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    if (!host.empty()) {
        config.relay_host = host;
    }
    if (port != 0) {
        config.relay_port = port;
    }
    if (!agent_id.empty()) {
        config.agent_id = agent_id;
    }
    if (interval_ms > 0) {
        config.send_interval = std::chrono::milliseconds(interval_ms);
    }
    if (voltage) {
        config.sensor_voltage = *voltage;
    }
    if (position.size() == 2) {
        config.position = rly::wire::Position {position[0], position[1]};
    }

    if (auto valid = config.validate(); !valid) {
        RLY_ERROR("Invalid configuration: {}", valid.error());
        return 1;
    }

    RLY_INFO("Configuration: {}", config.to_string());

    rly::agent::SimulatedSensor sensor(config.sensor_voltage);
    rly::agent::StaticPositionProvider positions(config.position);
    rly::agent::MeasurementAgent agent(config, sensor, positions);

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        RLY_INFO("Stopping measurement agent...");
        agent.stop();
    });

    agent.start();
    io_context.run();
    agent.stop();

    RLY_INFO("Sent {} packets", agent.num_packets_sent());
    return 0;
}
