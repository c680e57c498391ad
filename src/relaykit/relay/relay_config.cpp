/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/relay_config.hpp"

#include "relaykit/core/file.hpp"

#include <boost/asio/ip/address.hpp>

#include <tuple>

namespace {

uint16_t port_from_value(const boost::json::value& jv, const char* what) {
    const auto port = boost::json::value_to<int64_t>(jv);
    if (port < 0 || port > 65535) {
        throw std::invalid_argument(fmt::format("{} out of range", what));
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

tl::expected<void, std::string> rly::RelayConfig::validate() const {
    boost::system::error_code ec;
    std::ignore = boost::asio::ip::make_address(bind_address, ec);
    if (ec) {
        return tl::unexpected(fmt::format("invalid bind address '{}'", bind_address));
    }
    if (measurement_port != 0 && measurement_port == actuation_port) {
        return tl::unexpected(std::string("measurement and actuation port must differ"));
    }
    if (correlation_timeout <= std::chrono::milliseconds::zero()) {
        return tl::unexpected(std::string("correlation timeout must be positive"));
    }
    if (max_plausible_delay_ms <= 0.0) {
        return tl::unexpected(std::string("max plausible delay must be positive"));
    }
    return {};
}

std::string rly::RelayConfig::to_string() const {
    return fmt::format(
        "bind_address={}, measurement_port={}, actuation_port={}, correlation_timeout={}ms, "
        "max_plausible_delay={}ms, report_directory={}",
        bind_address, measurement_port, actuation_port, correlation_timeout.count(), max_plausible_delay_ms,
        report_directory.empty() ? "<none>" : report_directory
    );
}

void rly::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const RelayConfig& config) {
    jv = {
        {"bind_address", config.bind_address},
        {"measurement_port", config.measurement_port},
        {"actuation_port", config.actuation_port},
        {"correlation_timeout_ms", config.correlation_timeout.count()},
        {"max_plausible_delay_ms", config.max_plausible_delay_ms},
        {"report_directory", config.report_directory},
    };
}

rly::RelayConfig rly::tag_invoke(const boost::json::value_to_tag<RelayConfig>&, const boost::json::value& jv) {
    const auto* obj = jv.if_object();
    if (obj == nullptr) {
        throw std::invalid_argument("relay config must be a json object");
    }

    RelayConfig config;
    if (const auto* v = obj->if_contains("bind_address")) {
        config.bind_address = boost::json::value_to<std::string>(*v);
    }
    if (const auto* v = obj->if_contains("measurement_port")) {
        config.measurement_port = port_from_value(*v, "measurement_port");
    }
    if (const auto* v = obj->if_contains("actuation_port")) {
        config.actuation_port = port_from_value(*v, "actuation_port");
    }
    if (const auto* v = obj->if_contains("correlation_timeout_ms")) {
        config.correlation_timeout = std::chrono::milliseconds(boost::json::value_to<int64_t>(*v));
    }
    if (const auto* v = obj->if_contains("max_plausible_delay_ms")) {
        config.max_plausible_delay_ms = json_to_number(*v, "max_plausible_delay_ms");
    }
    if (const auto* v = obj->if_contains("report_directory")) {
        config.report_directory = boost::json::value_to<std::string>(*v);
    }
    return config;
}

tl::expected<rly::RelayConfig, std::string> rly::load_relay_config(const std::filesystem::path& path) {
    const auto text = file::read_file_as_string(path);
    if (!text) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), file::to_string(text.error())));
    }

    auto config = parse_json<RelayConfig>(*text);
    if (!config) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), config.error()));
    }

    if (auto valid = config->validate(); !valid) {
        return tl::unexpected(fmt::format("{}: {}", path.string(), valid.error()));
    }

    return config;
}
