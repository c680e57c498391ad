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

#include "peer_registry.hpp"
#include "relay_config.hpp"
#include "relay_loop.hpp"
#include "report_sink.hpp"
#include "response_correlator.hpp"
#include "session_log.hpp"
#include "relaykit/net/io_context_runner.hpp"
#include "relaykit/net/tcp_listener.hpp"

#include <array>
#include <iterator>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace rly {

/**
 * Snapshot of the relay state for status consumers.
 */
struct RelayStatus {
    std::optional<PeerInfo> measurement_peer;
    std::optional<PeerInfo> actuation_peer;
    std::optional<wire::Position> measurement_position;
    std::optional<wire::Position> actuation_position;
    bool session_active {};
    size_t num_records {};
    RunningStats delay_stats;

    [[nodiscard]] std::string to_string() const;
};

/**
 * Listens for one measurement and one actuation agent, forwards the measurement peer's telemetry as commands to the
 * actuation peer and records the latency of every cycle while a session is active.
 *
 * Both listeners are served by a single io_context thread. Every connection gets its own reader thread which performs
 * the handshake and then blocks on reading until the connection goes away. Losing a peer stops the active session.
 */
class Relay {
  public:
    /**
     * @param config The configuration.
     * @throws rly::Exception if the configuration is invalid.
     */
    explicit Relay(RelayConfig config);

    ~Relay();

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    Relay(Relay&&) = delete;
    Relay& operator=(Relay&&) = delete;

    /**
     * Binds both listening ports and starts accepting connections.
     * @throws rly::Exception if a port can't be bound.
     */
    void start();

    /**
     * Stops the active session, closes the listeners and all connections, and waits for the reader threads to finish.
     * Safe to call multiple times.
     */
    void stop();

    /**
     * Takes ownership of an established connection as if it was accepted on the port of given role. The connection's
     * first message must be a hello.
     * @param role The role of the port.
     * @param connection The connection.
     */
    void adopt_connection(Role role, std::shared_ptr<PeerConnection> connection);

    /**
     * Discards the previous session and pending acknowledgements, and arms a new session.
     */
    void start_session();

    /**
     * Stops the active session and hands the report to the report sinks.
     * @param reason Why the session ends.
     * @return The report, or nullopt if no session was active.
     */
    std::optional<SessionReport> stop_session(StopReason reason = StopReason::user_request);

    /**
     * Adds a sink which receives the report of every session that recorded at least one cycle.
     * @param sink The sink.
     */
    void add_report_sink(std::unique_ptr<ReportSink> sink);

    /**
     * @param role The role.
     * @return The port the listener of given role is bound to, or 0 if not listening.
     */
    [[nodiscard]] uint16_t port(Role role) const;

    /**
     * @param role The role.
     * @return The last position reported by the peer of given role, if any was reported.
     */
    [[nodiscard]] std::optional<wire::Position> last_position(Role role) const;

    /**
     * @return A consistent snapshot of peers and session.
     */
    [[nodiscard]] RelayStatus status() const;

    [[nodiscard]] const RelayConfig& config() const;
    [[nodiscard]] PeerRegistry& registry();
    [[nodiscard]] SessionLog& session();
    [[nodiscard]] ResponseCorrelator& correlator();

  private:
    struct Reader {
        std::thread thread;
        std::shared_ptr<PeerConnection> connection;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    RelayConfig config_;
    PeerRegistry registry_;
    ResponseCorrelator correlator_;
    SessionLog session_;
    RelayLoop loop_;
    IoContextRunner io_runner_;
    std::array<std::unique_ptr<TcpListener>, std::size(k_all_roles)> listeners_;

    mutable std::mutex state_mutex_;
    std::array<std::optional<wire::Position>, std::size(k_all_roles)> last_positions_;
    std::optional<PeerInfo> session_actuation_peer_;

    std::mutex sinks_mutex_;
    std::vector<std::unique_ptr<ReportSink>> report_sinks_;

    std::mutex readers_mutex_;
    std::vector<Reader> readers_;
    bool stopping_ {false};  // Guarded by readers_mutex_

    void on_accept(Role role, boost::asio::ip::tcp::socket socket);
    void run_reader(Role role, const std::shared_ptr<PeerConnection>& connection);
    tl::expected<wire::Hello, Error> handshake(Role role, PeerConnection& connection);
    Error read_measurement(const std::shared_ptr<PeerConnection>& connection);
    Error read_actuation(const std::shared_ptr<PeerConnection>& connection);
    void on_peer_lost(Role role, PeerConnection& connection, Error error);
    void update_position(Role role, const std::optional<wire::Position>& position);
    void finalize(SessionReport& report);
    void reap_finished_readers();
};

}  // namespace rly
