/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/clock.hpp"
#include "relaykit/core/file.hpp"
#include "relaykit/core/string.hpp"
#include "relaykit/relay/report_sink.hpp"

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <filesystem>

namespace {

rly::SessionReport make_report() {
    rly::SessionReport report;
    report.started_at = 1'700'000'000.0;
    report.stopped_at = 1'700'000'010.0;
    report.stop_reason = rly::StopReason::user_request;
    report.actuation_peer_address = "192.168.1.20:50000";
    report.actuation_peer_connected_at = 1'699'999'990.5;

    rly::LatencyRecord proper;
    proper.sequence_number = 1;
    proper.send_time = 1'700'000'001.0;
    proper.corrected_receipt_time = 1'700'000'001.055;
    proper.delay_ms = 55.0;
    proper.sensor_voltage = 1.23456;
    proper.status = rly::wire::DataStatus::proper;
    proper.applied_voltage = 1.23456;
    proper.sensor_position = rly::wire::Position {52.5, 4.25};
    report.records.push_back(proper);
    report.delay_stats.add(proper.delay_ms);

    rly::LatencyRecord junk;
    junk.sequence_number = 2;
    junk.send_time = 1'700'000'001.5;
    junk.corrected_receipt_time = 1'700'000'001.545;
    junk.delay_ms = 45.0;
    junk.sensor_voltage = 0.01;
    junk.status = rly::wire::DataStatus::junk;
    report.records.push_back(junk);
    report.delay_stats.add(junk.delay_ms);

    return report;
}

}  // namespace

TEST_CASE("rly::CsvReportSink") {
    SECTION("Report block layout") {
        const auto rows = rly::CsvReportSink::format_rows(make_report());
        REQUIRE(rows.size() == 10);

        REQUIRE(rows[0].empty());
        REQUIRE(rows[1].size() == 2);
        REQUIRE(rows[1][0] == "--- New Test Run ---");
        REQUIRE(rly::string_starts_with(rows[1][1], "Timestamp: "));
        REQUIRE(rows[2].empty());

        REQUIRE(rows[3][0] == "Connection Time");
        REQUIRE(rows[3][1] == rly::clock::format_time_of_day(1'699'999'990.5));
        REQUIRE(rows[4] == std::vector<std::string> {"Connected To (Actuator)", "192.168.1.20:50000"});
        REQUIRE(rows[5] == std::vector<std::string> {"Average Communication Delay", "50.00 ms"});
        REQUIRE(rows[6].empty());
        REQUIRE(rows[7].size() == 8);
        REQUIRE(rows[7][0] == "Packet #");
        REQUIRE(rows[7][3] == "Delay (ms)");

        const auto& first = rows[8];
        REQUIRE(first[0] == "1");
        REQUIRE(first[1] == rly::clock::format_time_of_day(1'700'000'001.0));
        REQUIRE(first[3] == "55.00");
        REQUIRE(first[4] == "1.2346V");
        REQUIRE(first[5] == "Proper");
        REQUIRE(first[6] == "1.2346V");
        REQUIRE(first[7] == "(52.500000, 4.250000)");

        const auto& second = rows[9];
        REQUIRE(second[0] == "2");
        REQUIRE(second[4] == "Junk Value");
        REQUIRE(second[5] == "Junk");
        REQUIRE(second[6] == "N/A");
        REQUIRE(second[7] == "N/A");
    }

    SECTION("Unknown actuation peer") {
        auto report = make_report();
        report.actuation_peer_address.clear();
        report.actuation_peer_connected_at = 0.0;
        const auto rows = rly::CsvReportSink::format_rows(report);
        REQUIRE(rows[3][1] == "N/A");
        REQUIRE(rows[4][1] == "N/A");
    }

    SECTION("CSV quoting") {
        REQUIRE(rly::CsvReportSink::to_csv_line({}) == "\n");
        REQUIRE(rly::CsvReportSink::to_csv_line({"a", "b"}) == "a,b\n");
        REQUIRE(rly::CsvReportSink::to_csv_line({"(1, 2)", "say \"hi\""}) == "\"(1, 2)\",\"say \"\"hi\"\"\"\n");
    }

    SECTION("Reports are appended to the file of the day") {
        const auto directory = std::filesystem::temp_directory_path() / "relaykit_csv_report_test";
        std::filesystem::remove_all(directory);

        rly::CsvReportSink sink(directory);
        const auto report = make_report();
        REQUIRE(sink.file_for(report) == directory / (rly::clock::format_date(report.stopped_at) + ".csv"));

        REQUIRE(sink.write(report));
        REQUIRE(sink.write(report));

        const auto contents = rly::file::read_file_as_string(sink.file_for(report));
        REQUIRE(contents);
        REQUIRE(std::count(contents->begin(), contents->end(), '\n') == 20);

        size_t num_blocks = 0;
        for (auto pos = contents->find("--- New Test Run ---"); pos != std::string::npos;
             pos = contents->find("--- New Test Run ---", pos + 1)) {
            num_blocks++;
        }
        REQUIRE(num_blocks == 2);

        std::filesystem::remove_all(directory);
    }

    SECTION("Unwritable directory is reported") {
        const auto file = std::filesystem::temp_directory_path() / "relaykit_csv_report_not_a_directory";
        std::filesystem::remove_all(file);
        REQUIRE(rly::file::append_to_file(file, "x"));

        rly::CsvReportSink sink(file / "reports");
        const auto result = sink.write(make_report());
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(result.error().empty());

        std::filesystem::remove_all(file);
    }
}

TEST_CASE("rly::LogReportSink") {
    rly::LogReportSink sink;
    REQUIRE(sink.write(make_report()));
    REQUIRE(sink.name() == "log");
}
