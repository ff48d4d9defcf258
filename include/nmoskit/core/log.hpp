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

#include "env.hpp"
#include "platform.hpp"
#include "string.hpp"

#include <string_view>
#include <utility>

#ifndef NMK_ENABLE_SPDLOG
    #define NMK_ENABLE_SPDLOG 1
#endif

#if NMK_ENABLE_SPDLOG
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
    #define SPDLOG_FUNCTION NMK_FUNCTION
#else
    // Compiles the log statements away while keeping spdlog as the formatting backend.
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

#include <spdlog/spdlog.h>

#ifndef NMK_TRACE
    #define NMK_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#endif

#ifndef NMK_DEBUG
    #define NMK_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#endif

#ifndef NMK_INFO
    #define NMK_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#endif

#ifndef NMK_WARNING
    #define NMK_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
#endif

#ifndef NMK_ERROR
    #define NMK_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#endif

#ifndef NMK_CRITICAL
    #define NMK_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
#endif

namespace nmk {

/**
 * Sets the log level of the default logger. Valid levels are TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL and OFF,
 * compared case-insensitively. Anything else selects INFO.
 * @param level The log level as string.
 */
inline void set_log_level(const std::string_view level) {
    static constexpr std::pair<const char*, spdlog::level::level_enum> k_levels[] = {
        {"TRACE", spdlog::level::trace}, {"DEBUG", spdlog::level::debug},       {"INFO", spdlog::level::info},
        {"WARN", spdlog::level::warn},   {"ERROR", spdlog::level::err},         {"CRITICAL", spdlog::level::critical},
        {"OFF", spdlog::level::off},
    };
    for (const auto& [name, value] : k_levels) {
        if (string_compare_case_insensitive(level, name)) {
            spdlog::set_level(value);
            return;
        }
    }
    spdlog::warn("Invalid log level: {}. Setting log level to info.", level);
    spdlog::set_level(spdlog::level::info);
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level() for the valid
 * values. If the variable is not set the log level will be set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "NMK_LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(*env_value);
    } else {
        set_log_level("INFO");
    }
}

}  // namespace nmk
