/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <mutex>
#include <vector>

#include "utils.hpp"

namespace wlink::logger {

constexpr auto file_env_var = "WLINK_LOGGER_FILE";
constexpr auto level_env_var = "WLINK_LOGGER_LEVEL";

Options Options::from_env() {
    Options options;
    if (auto level = utils::get_env_var_value(level_env_var)) {
        // spdlog maps unknown names to "off"; keep the default in that case.
        auto parsed = spdlog::level::from_str(utils::to_lower(*level));
        if (parsed != spdlog::level::off || utils::to_lower(*level) == "off") {
            options.log_level = parsed;
        }
    }
    if (auto filename = utils::get_env_var_value(file_env_var)) {
        options.filename = *filename;
    }
    return options;
}

void initialize(const Options& options) {
    static std::mutex mutex;
    std::scoped_lock lock{mutex};

    if (detail::is_initialized.load(std::memory_order_relaxed)) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (options.log_to_stderr) {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        sinks.push_back(stderr_sink);
    }

    if (!options.filename.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.filename);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("wlink", sinks.begin(), sinks.end());
    logger->set_level(options.log_level);
    logger->set_pattern(options.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    detail::is_initialized.store(true, std::memory_order_release);
}

namespace detail {
std::atomic_bool is_initialized = false;
}

}  // namespace wlink::logger
