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

#include "relaykit/core/math/running_stats.hpp"
#include "relaykit/core/util/subscriber_list.hpp"
#include "relaykit/wire/wire_messages.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace rly {

/**
 * One correlated command cycle.
 */
struct LatencyRecord {
    uint64_t sequence_number {};  // Assigned by SessionLog::append, starting at 1
    double send_time {};          // t1, measurement agent clock
    double corrected_receipt_time {};
    double delay_ms {};
    double sensor_voltage {};
    wire::DataStatus status {wire::DataStatus::junk};
    std::optional<double> applied_voltage;
    std::optional<wire::Position> sensor_position;
};

/**
 * Why a session ended.
 */
enum class StopReason {
    user_request,
    measurement_peer_lost,
    actuation_peer_lost,
    shutdown,
};

inline const char* to_string(const StopReason reason) {
    switch (reason) {
        case StopReason::user_request:
            return "user request";
        case StopReason::measurement_peer_lost:
            return "measurement peer lost";
        case StopReason::actuation_peer_lost:
            return "actuation peer lost";
        case StopReason::shutdown:
            return "shutdown";
    }
    return "unknown";
}

/**
 * A finalised session.
 */
struct SessionReport {
    double started_at {};  // Wall clock seconds
    double stopped_at {};  // Wall clock seconds
    StopReason stop_reason {StopReason::user_request};
    std::string actuation_peer_address;  // Filled in by the owner of the session
    double actuation_peer_connected_at {};  // Filled in by the owner of the session, 0 if unknown
    std::vector<LatencyRecord> records;
    RunningStats delay_stats;  // Of the delays in milliseconds

    [[nodiscard]] std::string to_string() const;
};

/**
 * The record of one measurement session. Only the relay loop appends, status consumers may read at any time.
 */
class SessionLog {
  public:
    /**
     * Callbacks run without the log's state lock, so they may read the log. They must not subscribe, unsubscribe,
     * start or stop a session, or append.
     */
    class Subscriber {
      public:
        virtual ~Subscriber() = default;

        /**
         * Called when a session was armed.
         */
        virtual void on_session_started() {}

        /**
         * Called when a record was appended.
         * @param record The record including its sequence number.
         */
        virtual void on_record_appended(const LatencyRecord& record) {
            std::ignore = record;
        }

        /**
         * Called when the session was stopped.
         * @param report The final report.
         */
        virtual void on_session_stopped(const SessionReport& report) {
            std::ignore = report;
        }
    };

    SessionLog() = default;

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    SessionLog(SessionLog&&) = delete;
    SessionLog& operator=(SessionLog&&) = delete;

    /**
     * Discards all prior records and arms the session. Starting an active session starts over.
     */
    void start();

    /**
     * Appends a record and assigns the next sequence number to it.
     * @param record The record, its sequence number is ignored.
     * @return The assigned sequence number, or nullopt if no session is active.
     */
    std::optional<uint64_t> append(LatencyRecord record);

    /**
     * Disarms the session.
     * @param reason Why the session ends.
     * @return The final report, or nullopt if no session was active.
     */
    std::optional<SessionReport> stop(StopReason reason);

    /**
     * @return True while a session is armed.
     */
    [[nodiscard]] bool is_active() const;

    /**
     * @return The number of records of the current or last session.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @return A copy of the records of the current or last session.
     */
    [[nodiscard]] std::vector<LatencyRecord> records() const;

    /**
     * @return The raw delay samples in milliseconds of the current or last session.
     */
    [[nodiscard]] std::vector<double> delay_samples() const;

    /**
     * @return Statistics of the delays in milliseconds.
     */
    [[nodiscard]] RunningStats delay_stats() const;

    /**
     * Adds a subscriber.
     * @param subscriber The subscriber to add.
     * @return True if the subscriber was added, false if it was already subscribed.
     */
    [[nodiscard]] bool subscribe(Subscriber* subscriber);

    /**
     * Removes a subscriber.
     * @param subscriber The subscriber to remove.
     * @return True if the subscriber was removed.
     */
    [[nodiscard]] bool unsubscribe(const Subscriber* subscriber);

  private:
    // Lock order is subscribers_mutex_, then mutex_.
    std::mutex subscribers_mutex_;
    SubscriberList<Subscriber> subscribers_;

    mutable std::mutex mutex_;
    bool active_ {false};
    double started_at_ {};
    std::vector<LatencyRecord> records_;
    std::vector<double> delay_samples_;
    RunningStats delay_stats_;
};

}  // namespace rly
