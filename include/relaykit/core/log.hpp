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

#include "string.hpp"

#include <atomic>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#ifndef RLY_ENABLE_SPDLOG
    #define RLY_ENABLE_SPDLOG 0
#endif

#if RLY_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #include <spdlog/spdlog.h>

    #ifndef RLY_TRACE
        #define RLY_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef RLY_DEBUG
        #define RLY_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef RLY_CRITICAL
        #define RLY_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef RLY_ERROR
        #define RLY_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef RLY_WARNING
        #define RLY_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef RLY_INFO
        #define RLY_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

    #include "relaykit/core/format.hpp"

enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic log_level = LogLevel::info;

    #ifndef RLY_TRACE
        #define RLY_TRACE(...)                         \
            if (log_level.load() >= LogLevel::trace) { \
                fmt::println("[T] " __VA_ARGS__);      \
            }
    #endif

    #ifndef RLY_DEBUG
        #define RLY_DEBUG(...)                         \
            if (log_level.load() >= LogLevel::debug) { \
                fmt::println("[D] " __VA_ARGS__);      \
            }
    #endif

    #ifndef RLY_CRITICAL
        #define RLY_CRITICAL(...)                         \
            if (log_level.load() >= LogLevel::critical) { \
                fmt::println("[C] " __VA_ARGS__);         \
            }
    #endif

    #ifndef RLY_ERROR
        #define RLY_ERROR(...)                         \
            if (log_level.load() >= LogLevel::error) { \
                fmt::println("[E] " __VA_ARGS__);      \
            }
    #endif

    #ifndef RLY_WARNING
        #define RLY_WARNING(...)                         \
            if (log_level.load() >= LogLevel::warning) { \
                fmt::println("[W] " __VA_ARGS__);        \
            }
    #endif

    #ifndef RLY_INFO
        #define RLY_INFO(...)                         \
            if (log_level.load() >= LogLevel::info) { \
                fmt::println("[I] " __VA_ARGS__);     \
            }
    #endif

#endif

namespace rly {

/**
 * Parses a log level name as accepted by set_log_level().
 * @param level The name, case-insensitive.
 * @return The spdlog level, or nullopt if the name is unknown.
 */
#if RLY_ENABLE_SPDLOG
inline std::optional<spdlog::level::level_enum> parse_log_level(const std::string_view level) {
    using spdlog::level::level_enum;
    constexpr std::pair<std::string_view, level_enum> k_levels[] = {
        {"TRACE", level_enum::trace}, {"DEBUG", level_enum::debug}, {"INFO", level_enum::info},
        {"WARN", level_enum::warn},   {"ERROR", level_enum::err},   {"CRITICAL", level_enum::critical},
        {"OFF", level_enum::off},
    };
#else
inline std::optional<LogLevel> parse_log_level(const std::string_view level) {
    constexpr std::pair<std::string_view, LogLevel> k_levels[] = {
        {"TRACE", LogLevel::trace}, {"DEBUG", LogLevel::debug}, {"INFO", LogLevel::info},
        {"WARN", LogLevel::warning}, {"ERROR", LogLevel::error}, {"CRITICAL", LogLevel::critical},
        {"OFF", LogLevel::off},
    };
#endif
    for (const auto& [name, value] : k_levels) {
        if (string_compare_case_insensitive(level, name)) {
            return value;
        }
    }
    return std::nullopt;
}

/**
 * Sets the log level of the process. Valid values are TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL and OFF. Unknown
 * values fall back to INFO.
 * @param level The log level as string, case-insensitive.
 * @return True if the level was recognised.
 */
inline bool set_log_level(const std::string_view level) {
    const auto parsed = parse_log_level(level);
#if RLY_ENABLE_SPDLOG
    spdlog::set_level(parsed.value_or(spdlog::level::info));
#else
    log_level = parsed.value_or(LogLevel::info);
#endif
    if (!parsed) {
        RLY_WARNING("Invalid log level: {}. Setting log level to info.", level);
    }
    return parsed.has_value();
}

/**
 * Sets the log level from an environment variable, or to INFO when the variable is not set.
 * @param env_var The name of the environment variable.
 */
inline void set_log_level_from_env(const char* env_var = "RLY_LOG_LEVEL") {
    const char* value = std::getenv(env_var);
    set_log_level(value != nullptr ? value : "INFO");
}

}  // namespace rly
