/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/session_log.hpp"

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

namespace {

rly::LatencyRecord make_record(const double delay_ms) {
    rly::LatencyRecord record;
    record.sequence_number = 999;  // Overwritten by the session log
    record.send_time = 100.0;
    record.corrected_receipt_time = 100.0 + delay_ms / 1000.0;
    record.delay_ms = delay_ms;
    record.sensor_voltage = 1.0;
    record.status = rly::wire::DataStatus::proper;
    return record;
}

struct RecordingSubscriber final: rly::SessionLog::Subscriber {
    int num_started {};
    std::vector<uint64_t> appended;
    std::vector<rly::StopReason> stopped;

    void on_session_started() override {
        num_started++;
    }

    void on_record_appended(const rly::LatencyRecord& record) override {
        appended.push_back(record.sequence_number);
    }

    void on_session_stopped(const rly::SessionReport& report) override {
        stopped.push_back(report.stop_reason);
    }
};

// Reads the session log back from within its callbacks.
struct QueryingSubscriber final: rly::SessionLog::Subscriber {
    explicit QueryingSubscriber(const rly::SessionLog& session) : session(session) {}

    const rly::SessionLog& session;
    std::vector<std::string> seen;

    void on_session_started() override {
        seen.push_back(fmt::format("started {} {}", session.is_active(), session.size()));
    }

    void on_record_appended(const rly::LatencyRecord& record) override {
        seen.push_back(fmt::format("appended {} {}", record.sequence_number, session.size()));
    }

    void on_session_stopped(const rly::SessionReport& report) override {
        seen.push_back(fmt::format("stopped {} {} {}", session.is_active(), session.size(), report.records.size()));
    }
};

}  // namespace

TEST_CASE("rly::SessionLog") {
    RecordingSubscriber subscriber;
    rly::SessionLog session;
    REQUIRE(session.subscribe(&subscriber));

    SECTION("Inactive session ignores records") {
        REQUIRE_FALSE(session.is_active());
        REQUIRE_FALSE(session.append(make_record(10.0)));
        REQUIRE(session.size() == 0);
        REQUIRE(subscriber.appended.empty());
    }

    SECTION("Sequence numbers are dense and start at 1") {
        session.start();
        REQUIRE(session.append(make_record(10.0)) == std::optional<uint64_t>(1));
        REQUIRE(session.append(make_record(20.0)) == std::optional<uint64_t>(2));
        REQUIRE(session.append(make_record(30.0)) == std::optional<uint64_t>(3));

        const auto records = session.records();
        REQUIRE(records.size() == 3);
        for (size_t i = 0; i < records.size(); ++i) {
            REQUIRE(records[i].sequence_number == i + 1);
        }
        REQUIRE(session.delay_samples() == std::vector<double> {10.0, 20.0, 30.0});
        REQUIRE(subscriber.appended == std::vector<uint64_t> {1, 2, 3});
    }

    SECTION("Stop returns the report with statistics") {
        session.start();
        std::ignore = session.append(make_record(10.0));
        std::ignore = session.append(make_record(30.0));

        const auto report = session.stop(rly::StopReason::actuation_peer_lost);
        REQUIRE(report);
        REQUIRE(report->records.size() == 2);
        REQUIRE(report->stop_reason == rly::StopReason::actuation_peer_lost);
        REQUIRE(report->delay_stats.count() == 2);
        REQUIRE_THAT(report->delay_stats.average(), Catch::Matchers::WithinAbs(20.0, 1e-9));
        REQUIRE_THAT(report->delay_stats.min(), Catch::Matchers::WithinAbs(10.0, 0.0));
        REQUIRE_THAT(report->delay_stats.max(), Catch::Matchers::WithinAbs(30.0, 0.0));
        REQUIRE(report->stopped_at >= report->started_at);
        REQUIRE_FALSE(session.is_active());

        // Records stay readable after stopping
        REQUIRE(session.size() == 2);
        REQUIRE_FALSE(session.append(make_record(40.0)));
        REQUIRE(session.size() == 2);
    }

    SECTION("Second stop is a no-op") {
        session.start();
        REQUIRE(session.stop(rly::StopReason::user_request));
        REQUIRE_FALSE(session.stop(rly::StopReason::measurement_peer_lost));
        REQUIRE(subscriber.stopped == std::vector<rly::StopReason> {rly::StopReason::user_request});
    }

    SECTION("Start discards the previous session") {
        session.start();
        std::ignore = session.append(make_record(10.0));
        std::ignore = session.append(make_record(20.0));
        std::ignore = session.stop(rly::StopReason::user_request);

        session.start();
        REQUIRE(session.is_active());
        REQUIRE(session.size() == 0);
        REQUIRE(session.delay_samples().empty());
        REQUIRE(session.delay_stats().count() == 0);
        REQUIRE(session.append(make_record(5.0)) == std::optional<uint64_t>(1));
        REQUIRE(subscriber.num_started == 2);
    }

    SECTION("Restarting an active session starts over") {
        session.start();
        std::ignore = session.append(make_record(10.0));
        session.start();
        REQUIRE(session.size() == 0);
        REQUIRE(session.append(make_record(5.0)) == std::optional<uint64_t>(1));
    }

    SECTION("Subscribers may read the log from their callbacks") {
        QueryingSubscriber querying(session);
        REQUIRE(session.subscribe(&querying));

        session.start();
        std::ignore = session.append(make_record(10.0));
        std::ignore = session.append(make_record(20.0));
        REQUIRE(session.stop(rly::StopReason::user_request));

        REQUIRE(
            querying.seen
            == std::vector<std::string> {"started true 0", "appended 1 1", "appended 2 2", "stopped false 2 2"}
        );
        REQUIRE(session.unsubscribe(&querying));
    }

    REQUIRE(session.unsubscribe(&subscriber));
}
