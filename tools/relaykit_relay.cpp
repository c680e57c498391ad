/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/log.hpp"
#include "relaykit/core/string.hpp"
#include "relaykit/relay/relay.hpp"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <boost/asio.hpp>

#include <iostream>
#include <thread>

/**
 * Relays telemetry from a measurement agent to an actuation agent and records the latency of every command while a
 * session is active. Sessions are controlled from the console.
 */

namespace {

class StatusPrinter final: public rly::PeerRegistry::Subscriber, public rly::SessionLog::Subscriber {
  public:
    explicit StatusPrinter(rly::Relay& relay) : relay_(relay) {
        std::ignore = relay_.registry().subscribe(this);
        std::ignore = relay_.session().subscribe(this);
    }

    ~StatusPrinter() override {
        std::ignore = relay_.registry().unsubscribe(this);
        std::ignore = relay_.session().unsubscribe(this);
    }

    void on_peer_connected(const rly::Role role, const rly::PeerInfo& info) override {
        RLY_INFO("[status] {} agent online: {}", rly::to_string(role), info.to_string());
    }

    void on_peer_disconnected(const rly::Role role, const rly::PeerInfo& info) override {
        RLY_INFO("[status] {} agent offline: {}", rly::to_string(role), info.to_string());
    }

    void on_record_appended(const rly::LatencyRecord& record) override {
        RLY_INFO("[status] Logged packet #{}, delay: {:.2f} ms", record.sequence_number, record.delay_ms);
    }

    void on_session_stopped(const rly::SessionReport& report) override {
        RLY_INFO("[status] Session stopped: {}", report.to_string());
    }

  private:
    rly::Relay& relay_;
};

void print_help() {
    fmt::println("Commands: start, stop, status, quit");
}

}  // namespace

int main(int const argc, char* argv[]) {
    rly::set_log_level_from_env();

    CLI::App app {"relaykit relay"};
    argv = app.ensure_utf8(argv);

    std::string config_file;
    app.add_option("--config", config_file, "JSON configuration file");

    std::string bind_address;
    app.add_option("--bind", bind_address, "The address to listen on");

    uint16_t measurement_port = 0;
    app.add_option("--measurement-port", measurement_port, "The port measurement agents connect to");

    uint16_t actuation_port = 0;
    app.add_option("--actuation-port", actuation_port, "The port actuation agents connect to");

    int64_t timeout_ms = 0;
    app.add_option("--timeout-ms", timeout_ms, "How long to wait for an acknowledgement");

    std::string report_directory;
    app.add_option("--report-dir", report_directory, "Directory to append CSV reports to");

    std::string log_level_name;
    app.add_option("--log-level", log_level_name, "TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL or OFF");

    CLI11_PARSE(app, argc, argv);

    if (!log_level_name.empty()) {
        rly::set_log_level(log_level_name.c_str());
    }

    rly::RelayConfig config;
    if (!config_file.empty()) {
        auto loaded = rly::load_relay_config(config_file);
        if (!loaded) {
            RLY_ERROR("Failed to load configuration: {}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    if (!bind_address.empty()) {
        config.bind_address = bind_address;
    }
    if (measurement_port != 0) {
        config.measurement_port = measurement_port;
    }
    if (actuation_port != 0) {
        config.actuation_port = actuation_port;
    }
    if (timeout_ms > 0) {
        config.correlation_timeout = std::chrono::milliseconds(timeout_ms);
    }
    if (!report_directory.empty()) {
        config.report_directory = report_directory;
    }

    RLY_INFO("Configuration: {}", config.to_string());

    boost::asio::io_context io_context;

    try {
        rly::Relay relay(config);
        relay.add_report_sink(std::make_unique<rly::LogReportSink>());
        if (!config.report_directory.empty()) {
            relay.add_report_sink(std::make_unique<rly::CsvReportSink>(config.report_directory));
        }

        StatusPrinter status_printer(relay);
        relay.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            RLY_INFO("Stopping relay...");
            io_context.stop();
        });

        // Commands are executed on the main thread, the console thread only reads them.
        auto work_guard = boost::asio::make_work_guard(io_context);
        std::thread console([&io_context, &relay] {
            print_help();
            std::string line;
            while (std::getline(std::cin, line)) {
                const auto command = rly::string_to_lower(std::string(rly::string_trim(line)));
                if (command.empty()) {
                    continue;
                }
                boost::asio::post(io_context, [command, &io_context, &relay] {
                    if (command == "start") {
                        relay.start_session();
                    } else if (command == "stop") {
                        if (!relay.stop_session()) {
                            RLY_INFO("No session active");
                        }
                    } else if (command == "status") {
                        RLY_INFO("{}", relay.status().to_string());
                    } else if (command == "quit" || command == "q") {
                        io_context.stop();
                    } else {
                        print_help();
                    }
                });
                if (command == "quit" || command == "q") {
                    return;
                }
            }
            boost::asio::post(io_context, [&io_context] {
                io_context.stop();
            });
        });
        console.detach();

        io_context.run();
        relay.stop();
    } catch (const rly::Exception& e) {
        RLY_CRITICAL("{}", e.to_string());
        return 1;
    }

    return 0;
}
