/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/report_sink.hpp"

#include "relaykit/core/clock.hpp"
#include "relaykit/core/file.hpp"
#include "relaykit/core/log.hpp"

#include <ctime>

rly::CsvReportSink::CsvReportSink(std::filesystem::path directory) : directory_(std::move(directory)) {}

tl::expected<void, std::string> rly::CsvReportSink::write(const SessionReport& report) {
    std::string text;
    for (const auto& row : format_rows(report)) {
        text += to_csv_line(row);
    }

    const auto file = file_for(report);
    auto result = file::append_to_file(file, text);
    if (!result) {
        return tl::unexpected(fmt::format("{}: {}", file.string(), file::to_string(result.error())));
    }

    RLY_INFO("Report with {} records appended to {}", report.records.size(), file.string());
    return {};
}

std::string rly::CsvReportSink::name() const {
    return fmt::format("csv ({})", directory_.string());
}

std::filesystem::path rly::CsvReportSink::file_for(const SessionReport& report) const {
    return directory_ / (clock::format_date(report.stopped_at) + ".csv");
}

std::vector<std::vector<std::string>> rly::CsvReportSink::format_rows(const SessionReport& report) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(report.records.size() + 9);

    rows.push_back({});
    rows.push_back(
        {"--- New Test Run ---",
         fmt::format("Timestamp: {:%H:%M:%S}", fmt::localtime(static_cast<std::time_t>(report.stopped_at)))}
    );
    rows.push_back({});
    rows.push_back(
        {"Connection Time",
         report.actuation_peer_connected_at > 0.0 ? clock::format_time_of_day(report.actuation_peer_connected_at)
                                                  : std::string("N/A")}
    );
    rows.push_back({"Connected To (Actuator)", report.actuation_peer_address.empty() ? "N/A" : report.actuation_peer_address});
    rows.push_back({"Average Communication Delay", fmt::format("{:.2f} ms", report.delay_stats.average())});
    rows.push_back({});
    rows.push_back(
        {"Packet #", "Sensor Send Time", "Corrected Actuator Receive Time", "Delay (ms)", "Sensor Voltage",
         "Data Status", "Actuator Voltage Set (V)", "Sensor GPS"}
    );

    for (const auto& record : report.records) {
        const bool proper = record.status == wire::DataStatus::proper;
        rows.push_back({
            std::to_string(record.sequence_number),
            clock::format_time_of_day(record.send_time),
            clock::format_time_of_day(record.corrected_receipt_time),
            fmt::format("{:.2f}", record.delay_ms),
            proper ? fmt::format("{:.4f}V", record.sensor_voltage) : std::string("Junk Value"),
            wire::to_string(record.status),
            record.applied_voltage ? fmt::format("{:.4f}V", *record.applied_voltage) : std::string("N/A"),
            record.sensor_position ? record.sensor_position->to_string() : std::string("N/A"),
        });
    }

    return rows;
}

std::string rly::CsvReportSink::to_csv_line(const std::vector<std::string>& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        const auto& cell = row[i];
        if (cell.find_first_of(",\"\n") == std::string::npos) {
            line += cell;
            continue;
        }
        line += '"';
        for (const auto c : cell) {
            if (c == '"') {
                line += '"';
            }
            line += c;
        }
        line += '"';
    }
    line += '\n';
    return line;
}

tl::expected<void, std::string> rly::LogReportSink::write(const SessionReport& report) {
    RLY_INFO(
        "Session report: {} records, connected to {}, average delay {:.2f} ms (min {:.2f} ms, max {:.2f} ms), stopped "
        "because of {}",
        report.records.size(), report.actuation_peer_address.empty() ? "N/A" : report.actuation_peer_address,
        report.delay_stats.average(), report.delay_stats.min(), report.delay_stats.max(),
        to_string(report.stop_reason)
    );
    return {};
}

std::string rly::LogReportSink::name() const {
    return "log";
}
