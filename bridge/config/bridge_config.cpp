// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/config/bridge_config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "assert.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace wlink {

namespace {

std::chrono::milliseconds load_duration(const YAML::Node &node, std::chrono::milliseconds fallback) {
    if (!node) {
        return fallback;
    }
    const int64_t value = node.as<int64_t>();
    WLINK_ASSERT(value >= 0, "Durations must not be negative, got {}", value);
    return std::chrono::milliseconds(value);
}

void load_worker_section(const YAML::Node &worker, BridgeConfig &config) {
    if (!worker) {
        return;
    }
    if (worker["python2_binary"]) {
        config.python2_binary = worker["python2_binary"].as<std::string>();
    }
    if (worker["python3_binary"]) {
        config.python3_binary = worker["python3_binary"].as<std::string>();
    }
    if (worker["use_python3"]) {
        config.use_python3 = worker["use_python3"].as<bool>();
    }
    if (worker["plan_name"]) {
        config.plan_name = worker["plan_name"].as<std::string>();
    }
    if (worker["interpreter_flags"]) {
        config.interpreter_flags = worker["interpreter_flags"].as<std::vector<std::string>>();
    }
    if (worker["plan_arguments"]) {
        config.plan_arguments = worker["plan_arguments"].as<std::vector<std::string>>();
    }
}

void load_timeouts_section(const YAML::Node &timeouts, BridgeConfig &config) {
    if (!timeouts) {
        return;
    }
    config.startup_grace = load_duration(timeouts["startup_grace_ms"], config.startup_grace);
    config.error_drain_grace = load_duration(timeouts["error_drain_grace_ms"], config.error_drain_grace);
    config.socket_timeout = load_duration(timeouts["socket_timeout_ms"], config.socket_timeout);
}

}  // namespace

BridgeConfig BridgeConfig::create_from_yaml(const std::filesystem::path &config_file_path) {
    std::ifstream fconfig(config_file_path);
    if (fconfig.fail()) {
        throw std::runtime_error(fmt::format("Error: bridge config file {} does not exist!", config_file_path.string()));
    }
    std::stringstream buffer;
    buffer << fconfig.rdbuf();
    fconfig.close();
    return create_from_yaml_content(buffer.str());
}

BridgeConfig BridgeConfig::create_from_yaml_content(const std::string &config_file_content) {
    BridgeConfig config;

    YAML::Node yaml;
    try {
        yaml = YAML::Load(config_file_content);
    } catch (const YAML::Exception &e) {
        WLINK_THROW("Failed to parse bridge config: {}", e.what());
    }

    load_worker_section(yaml["worker"], config);
    load_timeouts_section(yaml["timeouts"], config);

    if (yaml["debug"]) {
        config.debug = yaml["debug"].as<bool>();
    }
    if (yaml["tmp_data_dir"]) {
        config.tmp_data_dir = yaml["tmp_data_dir"].as<std::string>();
    }
    if (yaml["listen_port"]) {
        config.listen_port = yaml["listen_port"].as<uint16_t>();
    }
    if (yaml["scratch_capacity"]) {
        config.scratch_capacity = yaml["scratch_capacity"].as<uint32_t>();
        WLINK_ASSERT(config.scratch_capacity > 0, "scratch_capacity must be positive");
    }

    return config;
}

void BridgeConfig::apply_env_overrides() {
    if (auto value = utils::get_env_var_value("WLINK_DEBUG")) {
        auto parsed = utils::parse_bool(*value);
        WLINK_ASSERT(parsed.has_value(), "WLINK_DEBUG must be a boolean, got '{}'", *value);
        debug = *parsed;
    }
    if (auto value = utils::get_env_var_value("WLINK_USE_PYTHON3")) {
        auto parsed = utils::parse_bool(*value);
        WLINK_ASSERT(parsed.has_value(), "WLINK_USE_PYTHON3 must be a boolean, got '{}'", *value);
        use_python3 = *parsed;
    }
    if (auto value = utils::get_env_var_value("WLINK_TMP_DATA_DIR")) {
        tmp_data_dir = *value;
    }
    if (auto value = utils::get_env_var_value("WLINK_PYTHON2_BINARY")) {
        python2_binary = *value;
    }
    if (auto value = utils::get_env_var_value("WLINK_PYTHON3_BINARY")) {
        python3_binary = *value;
    }
    WLINK_DEBUG("Bridge config: debug={} worker={} tmp_data_dir={}", debug, worker_binary().string(), tmp_data_dir.string());
}

}  // namespace wlink
