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

#include "latency_estimator.hpp"
#include "peer_registry.hpp"
#include "response_correlator.hpp"
#include "session_log.hpp"

#include <chrono>
#include <functional>
#include <mutex>

namespace rly {

/**
 * Turns telemetry packets into commands for the actuation peer, correlates the acknowledgement and records the
 * latency of the cycle. Cycles are strictly sequential: process() blocks until the cycle completed or timed out.
 */
class RelayLoop {
  public:
    enum class Outcome {
        /// No session active or no actuation peer connected, nothing was forwarded. Also returned when the session
        /// stopped while the command was in flight, in which case nothing was recorded.
        ignored,
        /// The acknowledgement arrived and a record was appended.
        correlated,
        /// No acknowledgement arrived within the correlation timeout.
        timed_out,
        /// The command could not be sent, the actuation connection was closed.
        send_failed,
    };

    using WallClock = std::function<double()>;

    /**
     * @param registry The registry holding the actuation peer.
     * @param correlator The correlator the actuation reader publishes acknowledgements to.
     * @param session The session log to append records to.
     * @param correlation_timeout How long to wait for an acknowledgement.
     * @param max_plausible_delay_ms Delays outside [0, max] are recorded, but logged as implausible.
     * @param wall_clock Source of t4.
     */
    RelayLoop(
        PeerRegistry& registry, ResponseCorrelator& correlator, SessionLog& session,
        std::chrono::milliseconds correlation_timeout, double max_plausible_delay_ms, WallClock wall_clock
    );

    /**
     * Runs one cycle for given packet.
     * @param packet The packet received from the measurement peer.
     * @return What happened.
     */
    Outcome process(const wire::TelemetryPacket& packet);

    /**
     * @return The request id of the last command sent, or 0 if none was sent yet.
     */
    [[nodiscard]] uint64_t last_request_id() const;

  private:
    PeerRegistry& registry_;
    ResponseCorrelator& correlator_;
    SessionLog& session_;
    std::chrono::milliseconds correlation_timeout_;
    double max_plausible_delay_ms_;
    WallClock wall_clock_;

    mutable std::mutex cycle_mutex_;
    uint64_t last_request_id_ {};
};

const char* to_string(RelayLoop::Outcome outcome);

}  // namespace rly
