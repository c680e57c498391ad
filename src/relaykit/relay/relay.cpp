/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/relay.hpp"

#include "relaykit/core/clock.hpp"
#include "relaykit/core/exception.hpp"
#include "relaykit/core/log.hpp"

namespace {

size_t index_of(const rly::Role role) {
    return static_cast<size_t>(role);
}

rly::StopReason stop_reason_for(const rly::Role lost_role) {
    return lost_role == rly::Role::measurement ? rly::StopReason::measurement_peer_lost
                                               : rly::StopReason::actuation_peer_lost;
}

std::string format_peer(const std::optional<rly::PeerInfo>& peer) {
    return peer ? peer->to_string() : std::string("not connected");
}

std::string format_position(const std::optional<rly::wire::Position>& position) {
    return position ? position->to_string() : std::string("unknown");
}

}  // namespace

std::string rly::RelayStatus::to_string() const {
    return fmt::format(
        "measurement: {} position {}, actuation: {} position {}, session: {}, records: {}, delay: {}",
        format_peer(measurement_peer), format_position(measurement_position), format_peer(actuation_peer),
        format_position(actuation_position), session_active ? "active" : "inactive", num_records,
        delay_stats.to_string()
    );
}

rly::Relay::Relay(RelayConfig config) :
    config_(std::move(config)),
    loop_(
        registry_, correlator_, session_, config_.correlation_timeout, config_.max_plausible_delay_ms,
        clock::now_wall_seconds
    ) {
    if (auto valid = config_.validate(); !valid) {
        RLY_THROW_EXCEPTION(fmt::format("Invalid relay configuration: {}", valid.error()));
    }
}

rly::Relay::~Relay() {
    stop();
}

void rly::Relay::start() {
    {
        std::lock_guard lock(readers_mutex_);
        stopping_ = false;
    }

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        RLY_THROW_EXCEPTION(fmt::format("Invalid bind address '{}': {}", config_.bind_address, ec.message()));
    }

    for (const auto role : k_all_roles) {
        auto& listener = listeners_[index_of(role)];
        if (listener) {
            continue;
        }
        const boost::asio::ip::tcp::endpoint endpoint(address, config_.port(role));
        try {
            listener = std::make_unique<TcpListener>(
                io_runner_.io_context(), endpoint,
                [this, role](boost::asio::ip::tcp::socket socket) {
                    on_accept(role, std::move(socket));
                }
            );
        } catch (const boost::system::system_error& e) {
            for (auto& l : listeners_) {
                l.reset();
            }
            RLY_THROW_EXCEPTION(fmt::format(
                "Failed to listen for {} peers on {}:{}: {}", to_string(role), config_.bind_address,
                config_.port(role), e.what()
            ));
        }
        RLY_INFO("Listening for {} peers on {}:{}", to_string(role), config_.bind_address, listener->port());
    }

    io_runner_.start();
}

void rly::Relay::stop() {
    {
        std::lock_guard lock(readers_mutex_);
        stopping_ = true;
    }

    if (auto report = session_.stop(StopReason::shutdown)) {
        finalize(*report);
    }

    io_runner_.stop();
    for (auto& listener : listeners_) {
        if (listener) {
            listener->stop();
            listener.reset();
        }
    }

    registry_.close_all();

    std::vector<Reader> readers;
    {
        std::lock_guard lock(readers_mutex_);
        readers.swap(readers_);
    }

    for (auto& reader : readers) {
        reader.connection->close();
    }

    for (auto& reader : readers) {
        if (reader.thread.joinable()) {
            reader.thread.join();
        }
    }
}

void rly::Relay::adopt_connection(const Role role, std::shared_ptr<PeerConnection> connection) {
    RLY_ASSERT_RETURN(connection != nullptr, "Connection must not be null");

    reap_finished_readers();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock(readers_mutex_);
    if (stopping_) {
        connection->close();
        return;
    }
    readers_.push_back(
        {std::thread([this, role, connection, finished] {
             try {
                 run_reader(role, connection);
             } catch (const std::exception& e) {
                 RLY_ERROR("Exception thrown on {} reader thread: {}", to_string(role), e.what());
                 on_peer_lost(role, *connection, Error::connection_lost);
             }
             *finished = true;
         }),
         connection, finished}
    );
}

void rly::Relay::start_session() {
    correlator_.clear();

    {
        std::lock_guard lock(state_mutex_);
        session_actuation_peer_ = registry_.info(Role::actuation);
    }

    for (const auto role : k_all_roles) {
        if (!registry_.is_connected(role)) {
            RLY_WARNING("Starting session without {} peer", to_string(role));
        }
    }

    session_.start();
}

std::optional<rly::SessionReport> rly::Relay::stop_session(const StopReason reason) {
    auto report = session_.stop(reason);
    if (!report) {
        return std::nullopt;
    }
    finalize(*report);
    return report;
}

void rly::Relay::add_report_sink(std::unique_ptr<ReportSink> sink) {
    RLY_ASSERT_RETURN(sink != nullptr, "Sink must not be null");
    std::lock_guard lock(sinks_mutex_);
    report_sinks_.push_back(std::move(sink));
}

uint16_t rly::Relay::port(const Role role) const {
    const auto& listener = listeners_[index_of(role)];
    return listener ? listener->port() : 0;
}

std::optional<rly::wire::Position> rly::Relay::last_position(const Role role) const {
    std::lock_guard lock(state_mutex_);
    return last_positions_[index_of(role)];
}

rly::RelayStatus rly::Relay::status() const {
    RelayStatus status;
    status.measurement_peer = registry_.info(Role::measurement);
    status.actuation_peer = registry_.info(Role::actuation);
    status.measurement_position = last_position(Role::measurement);
    status.actuation_position = last_position(Role::actuation);
    status.session_active = session_.is_active();
    status.num_records = session_.size();
    status.delay_stats = session_.delay_stats();
    return status;
}

const rly::RelayConfig& rly::Relay::config() const {
    return config_;
}

rly::PeerRegistry& rly::Relay::registry() {
    return registry_;
}

rly::SessionLog& rly::Relay::session() {
    return session_;
}

rly::ResponseCorrelator& rly::Relay::correlator() {
    return correlator_;
}

void rly::Relay::on_accept(const Role role, boost::asio::ip::tcp::socket socket) {
    boost::system::error_code ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        RLY_WARNING("Failed to disable nagle: {}", ec.message());
    }

    auto connection = TcpPeerConnection::create(std::move(socket));
    RLY_INFO("Accepted {} connection from {}", to_string(role), connection->remote_address());
    adopt_connection(role, std::move(connection));
}

void rly::Relay::run_reader(const Role role, const std::shared_ptr<PeerConnection>& connection) {
    auto hello = handshake(role, *connection);
    if (!hello) {
        RLY_WARNING(
            "Rejecting {} connection from {}: {}", to_string(role), connection->remote_address(),
            to_string(hello.error())
        );
        connection->close();
        return;
    }

    PeerInfo info;
    info.agent_id = hello->agent_id;
    info.remote_address = connection->remote_address();
    info.connected_at = clock::now_wall_seconds();

    RLY_INFO("{} peer connected: {}", to_string(role), info.to_string());

    if (role == Role::actuation && session_.is_active()) {
        std::lock_guard lock(state_mutex_);
        session_actuation_peer_ = info;
    }

    registry_.register_connection(role, connection, std::move(info));

    const auto error = role == Role::measurement ? read_measurement(connection) : read_actuation(connection);
    on_peer_lost(role, *connection, error);
}

tl::expected<rly::wire::Hello, rly::Error> rly::Relay::handshake(const Role role, PeerConnection& connection) {
    auto hello = connection.receive_message<wire::Hello>();
    if (!hello) {
        if (hello.error() == Error::malformed_message) {
            return tl::unexpected(Error::handshake_failed);
        }
        return tl::unexpected(hello.error());
    }

    if (hello->role && *hello->role != role) {
        RLY_WARNING(
            "Agent '{}' announced role {} on the {} port", hello->agent_id, to_string(*hello->role), to_string(role)
        );
        return tl::unexpected(Error::role_mismatch);
    }

    return hello;
}

rly::Error rly::Relay::read_measurement(const std::shared_ptr<PeerConnection>& connection) {
    while (true) {
        auto packet = connection->receive_message<wire::TelemetryPacket>();
        if (!packet) {
            return packet.error();
        }

        if (registry_.current(Role::measurement) != connection) {
            return Error::connection_lost;  // Replaced
        }

        update_position(Role::measurement, packet->position);

        const auto outcome = loop_.process(*packet);
        RLY_TRACE("Telemetry packet {}", to_string(outcome));
    }
}

rly::Error rly::Relay::read_actuation(const std::shared_ptr<PeerConnection>& connection) {
    while (true) {
        auto ack = connection->receive_message<wire::Acknowledgement>();
        if (!ack) {
            return ack.error();
        }

        if (registry_.current(Role::actuation) != connection) {
            return Error::connection_lost;  // Replaced
        }

        update_position(Role::actuation, ack->position);
        correlator_.publish(std::move(*ack));
    }
}

void rly::Relay::on_peer_lost(const Role role, PeerConnection& connection, const Error error) {
    connection.close();

    if (!registry_.clear(role, connection)) {
        RLY_DEBUG("Replaced {} connection {} ended", to_string(role), connection.remote_address());
        return;
    }

    RLY_WARNING("{} peer {} lost: {}", to_string(role), connection.remote_address(), to_string(error));

    if (auto report = session_.stop(stop_reason_for(role))) {
        finalize(*report);
    }
}

void rly::Relay::update_position(const Role role, const std::optional<wire::Position>& position) {
    if (!position) {
        return;
    }
    std::lock_guard lock(state_mutex_);
    last_positions_[index_of(role)] = position;
}

void rly::Relay::finalize(SessionReport& report) {
    {
        std::lock_guard lock(state_mutex_);
        if (session_actuation_peer_) {
            report.actuation_peer_address = session_actuation_peer_->remote_address;
            report.actuation_peer_connected_at = session_actuation_peer_->connected_at;
        }
    }

    if (report.records.empty()) {
        RLY_INFO("No data was relayed, skipping report");
        return;
    }

    std::lock_guard lock(sinks_mutex_);
    for (auto& sink : report_sinks_) {
        if (auto result = sink->write(report); !result) {
            RLY_ERROR("{} of {}: {}", to_string(Error::report_sink_failure), sink->name(), result.error());
        }
    }
}

void rly::Relay::reap_finished_readers() {
    std::lock_guard lock(readers_mutex_);
    for (auto it = readers_.begin(); it != readers_.end();) {
        if (!*it->finished) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) {
            it->thread.join();
        }
        it = readers_.erase(it);
    }
}
