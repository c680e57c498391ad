/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/file.hpp"
#include "relaykit/relay/relay_config.hpp"

#include <catch2/catch_all.hpp>

#include <filesystem>

TEST_CASE("rly::RelayConfig") {
    SECTION("Defaults") {
        const rly::RelayConfig config;
        REQUIRE(config.measurement_port == 65430);
        REQUIRE(config.actuation_port == 65431);
        REQUIRE(config.port(rly::Role::measurement) == 65430);
        REQUIRE(config.port(rly::Role::actuation) == 65431);
        REQUIRE(config.correlation_timeout == std::chrono::milliseconds(2000));
        REQUIRE(config.report_directory.empty());
        REQUIRE(config.validate());
    }

    SECTION("Missing keys keep their defaults") {
        const auto config = rly::parse_json<rly::RelayConfig>(R"({"actuation_port": 7000, "correlation_timeout_ms": 250})");
        REQUIRE(config);
        REQUIRE(config->measurement_port == 65430);
        REQUIRE(config->actuation_port == 7000);
        REQUIRE(config->correlation_timeout == std::chrono::milliseconds(250));
        REQUIRE(config->bind_address == "0.0.0.0");
    }

    SECTION("Round trip through json") {
        rly::RelayConfig config;
        config.bind_address = "127.0.0.1";
        config.report_directory = "/var/lib/relaykit";
        config.max_plausible_delay_ms = 250.0;
        const auto parsed = rly::parse_json<rly::RelayConfig>(boost::json::serialize(boost::json::value_from(config)));
        REQUIRE(parsed);
        REQUIRE(parsed->bind_address == "127.0.0.1");
        REQUIRE(parsed->report_directory == "/var/lib/relaykit");
        REQUIRE(parsed->max_plausible_delay_ms == 250.0);
    }

    SECTION("Invalid values") {
        REQUIRE_FALSE(rly::parse_json<rly::RelayConfig>(R"({"measurement_port": 70000})"));
        REQUIRE_FALSE(rly::parse_json<rly::RelayConfig>(R"({"measurement_port": "abc"})"));
        REQUIRE_FALSE(rly::parse_json<rly::RelayConfig>(R"([])"));

        rly::RelayConfig config;
        config.actuation_port = config.measurement_port;
        REQUIRE_FALSE(config.validate());

        config = {};
        config.bind_address = "not an address";
        REQUIRE_FALSE(config.validate());

        config = {};
        config.correlation_timeout = std::chrono::milliseconds(0);
        REQUIRE_FALSE(config.validate());
    }

    SECTION("Load from file") {
        const auto file = std::filesystem::temp_directory_path() / "relaykit_relay_config_test.json";
        std::filesystem::remove(file);

        REQUIRE_FALSE(rly::load_relay_config(file));

        REQUIRE(rly::file::append_to_file(file, R"({"measurement_port": 6000, "actuation_port": 6000})"));
        const auto invalid = rly::load_relay_config(file);
        REQUIRE_FALSE(invalid);
        REQUIRE_THAT(invalid.error(), Catch::Matchers::ContainsSubstring("must differ"));

        std::filesystem::remove(file);
        REQUIRE(rly::file::append_to_file(file, R"({"measurement_port": 6000, "actuation_port": 6001})"));
        const auto loaded = rly::load_relay_config(file);
        REQUIRE(loaded);
        REQUIRE(loaded->measurement_port == 6000);
        REQUIRE(loaded->actuation_port == 6001);

        std::filesystem::remove(file);
    }
}
