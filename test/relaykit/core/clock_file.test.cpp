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

#include <catch2/catch_all.hpp>

#include <filesystem>

TEST_CASE("rly::clock") {
    SECTION("Time of day has microsecond resolution") {
        const auto formatted = rly::clock::format_time_of_day(1'700'000'000.25);
        REQUIRE(formatted.size() == 15);
        REQUIRE(rly::string_ends_with(formatted, ":250000"));
    }

    SECTION("Rounding up to the next second") {
        const auto formatted = rly::clock::format_time_of_day(1'700'000'000.9999999);
        REQUIRE(rly::string_ends_with(formatted, ":000000"));
        REQUIRE(formatted.substr(0, 8) == rly::clock::format_time_of_day(1'700'000'001.0).substr(0, 8));
    }

    SECTION("Date") {
        const auto date = rly::clock::format_date(rly::clock::now_wall_seconds());
        REQUIRE(date.size() == 10);
        REQUIRE(date[4] == '-');
        REQUIRE(date[7] == '-');
    }
}

TEST_CASE("rly::file") {
    const auto directory = std::filesystem::temp_directory_path() / "relaykit_file_test";
    std::filesystem::remove_all(directory);
    const auto file = directory / "nested" / "file.txt";

    SECTION("Append creates the file and its directories") {
        REQUIRE(rly::file::append_to_file(file, "abc"));
        REQUIRE(rly::file::append_to_file(file, "def"));
        const auto contents = rly::file::read_file_as_string(file);
        REQUIRE(contents);
        REQUIRE(*contents == "abcdef");
    }

    SECTION("Reading a missing file") {
        const auto contents = rly::file::read_file_as_string(directory / "missing.txt");
        REQUIRE_FALSE(contents);
        REQUIRE(contents.error() == rly::file::Error::file_does_not_exist);
    }

    SECTION("Empty path") {
        REQUIRE(rly::file::read_file_as_string({}).error() == rly::file::Error::invalid_path);
        REQUIRE(rly::file::append_to_file({}, "x").error() == rly::file::Error::invalid_path);
    }

    std::filesystem::remove_all(directory);
}
