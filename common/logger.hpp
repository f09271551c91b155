/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 */

#pragma once

#include <atomic>
#include <string>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>

namespace wlink::logger {

/**
 * Parameters controlling the behavior of the logger.
 */
struct Options {
    bool log_to_stderr{true};
    std::string filename{};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v"};
    spdlog::level::level_enum log_level{spdlog::level::info};

    /**
     * Default options, with the level and the log file taken from
     * WLINK_LOGGER_LEVEL and WLINK_LOGGER_FILE when they are set.
     */
    static Options from_env();
};

/**
 * One-time initialization of the logger.
 *
 * If you don't call it, the logger will be initialized from Options::from_env()
 * the first time a message is logged.
 */
void initialize(const Options& options = Options::from_env());

/**
 * Macros for using the logger.
 */
#define WLINK_TRACE(...)                               \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_TRACE(__VA_ARGS__);                     \
    } while (0)

#define WLINK_DEBUG(...)                               \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_DEBUG(__VA_ARGS__);                     \
    } while (0)

#define WLINK_INFO(...)                                \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_INFO(__VA_ARGS__);                      \
    } while (0)

#define WLINK_WARN(...)                                \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_WARN(__VA_ARGS__);                      \
    } while (0)

#define WLINK_ERROR(...)                               \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_ERROR(__VA_ARGS__);                     \
    } while (0)

#define WLINK_CRITICAL(...)                            \
    do {                                               \
        ::wlink::logger::detail::ensure_initialized(); \
        SPDLOG_CRITICAL(__VA_ARGS__);                  \
    } while (0)

/**
 * This is not part of the API.
 */
namespace detail {
extern std::atomic_bool is_initialized;

inline void ensure_initialized() {
    if (!is_initialized.load(std::memory_order_acquire)) {
        initialize();
    }
}

}  // namespace detail

}  // namespace wlink::logger
