// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "wlink/utils/timeouts.hpp"

namespace wlink {

/**
 * Settings shared by every bridge of a job: which worker binary to launch and how,
 * where the scratch files live, and the timing policy of the protocol.
 */
struct BridgeConfig {
    std::filesystem::path python2_binary = "python";
    std::filesystem::path python3_binary = "python3";
    bool use_python3 = false;

    // The worker is started out-of-band and no timeouts are enforced.
    bool debug = false;

    std::filesystem::path tmp_data_dir = std::filesystem::temp_directory_path() / "wlink_data";
    std::string plan_name = "plan.py";
    std::vector<std::string> interpreter_flags = {"-O", "-B"};
    std::vector<std::string> plan_arguments;

    // 0 selects an ephemeral port.
    uint16_t listen_port = 0;

    std::chrono::milliseconds startup_grace = timeout::WORKER_STARTUP_GRACE;
    std::chrono::milliseconds error_drain_grace = timeout::WORKER_ERROR_DRAIN_GRACE;
    std::chrono::milliseconds socket_timeout = timeout::WORKER_SOCKET_TIMEOUT;

    uint32_t scratch_capacity = 1024 * 1024;

    const std::filesystem::path& worker_binary() const { return use_python3 ? python3_binary : python2_binary; }

    // Socket timeout actually applied; debug mode disables it.
    std::chrono::milliseconds effective_socket_timeout() const {
        return debug ? timeout::NO_TIMEOUT : socket_timeout;
    }

    static BridgeConfig create_from_yaml(const std::filesystem::path& config_file_path);

    static BridgeConfig create_from_yaml_content(const std::string& config_file_content);

    /**
     * Overrides fields from WLINK_DEBUG, WLINK_USE_PYTHON3, WLINK_TMP_DATA_DIR,
     * WLINK_PYTHON2_BINARY and WLINK_PYTHON3_BINARY when they are set.
     */
    void apply_env_overrides();
};

}  // namespace wlink
