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

#include "session_log.hpp"
#include "relaykit/core/expected.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rly {

/**
 * Receives finalised session reports. Failures are reported back to the caller, they never affect the session itself.
 */
class ReportSink {
  public:
    virtual ~ReportSink() = default;

    /**
     * Persists a report.
     * @param report The report to write. Has at least one record.
     * @return Nothing on success, or a description of the failure.
     */
    [[nodiscard]] virtual tl::expected<void, std::string> write(const SessionReport& report) = 0;

    /**
     * @return A name identifying the sink in log messages.
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * Appends reports as CSV blocks to one file per day (<directory>/<YYYY-MM-DD>.csv). Each block consists of a separator
 * line, a summary, a header and one row per record.
 */
class CsvReportSink final: public ReportSink {
  public:
    explicit CsvReportSink(std::filesystem::path directory);

    [[nodiscard]] tl::expected<void, std::string> write(const SessionReport& report) override;
    [[nodiscard]] std::string name() const override;

    /**
     * @param report The report.
     * @return The file the report goes into.
     */
    [[nodiscard]] std::filesystem::path file_for(const SessionReport& report) const;

    /**
     * Formats the rows of the report block. Empty rows separate the sections.
     * @param report The report to format.
     * @return The rows.
     */
    static std::vector<std::vector<std::string>> format_rows(const SessionReport& report);

    /**
     * @param row The cells of one row.
     * @return The cells as CSV line, quoted where needed, terminated with a newline.
     */
    static std::string to_csv_line(const std::vector<std::string>& row);

  private:
    std::filesystem::path directory_;
};

/**
 * Writes the summary of a report to the log.
 */
class LogReportSink final: public ReportSink {
  public:
    [[nodiscard]] tl::expected<void, std::string> write(const SessionReport& report) override;
    [[nodiscard]] std::string name() const override;
};

}  // namespace rly
