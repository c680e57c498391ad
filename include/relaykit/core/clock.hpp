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

#include "format.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <string>

namespace rly::clock {

/**
 * @return The wall clock time as seconds since the unix epoch, with sub-microsecond resolution. This is the time base
 * used for all timestamps exchanged with the agents.
 */
inline double now_wall_seconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

/**
 * Formats a wall clock time as local time of day with microseconds, like 13:04:59:123456.
 * @param seconds Seconds since the unix epoch.
 * @return The formatted time.
 */
inline std::string format_time_of_day(const double seconds) {
    const auto whole = std::floor(seconds);
    auto micros = static_cast<long>(std::lround((seconds - whole) * 1'000'000.0));
    auto time = static_cast<std::time_t>(whole);
    if (micros >= 1'000'000) {
        micros -= 1'000'000;
        time += 1;
    }
    return fmt::format("{:%H:%M:%S}:{:06}", fmt::localtime(time), micros);
}

/**
 * @param seconds Seconds since the unix epoch.
 * @return The local date formatted as YYYY-MM-DD.
 */
inline std::string format_date(const double seconds) {
    return fmt::format("{:%Y-%m-%d}", fmt::localtime(static_cast<std::time_t>(seconds)));
}

}  // namespace rly::clock
