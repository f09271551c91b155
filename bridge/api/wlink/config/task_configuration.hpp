// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wlink {

/**
 * Per-task key/value configuration handed to the bridge by the host.
 */
class TaskConfiguration {
public:
    static constexpr const char* BCVAR_COUNT_KEY = "PLANBINDER_BCVAR_COUNT";
    static constexpr const char* BCVAR_NAME_PREFIX = "PLANBINDER_BCVAR_";

    TaskConfiguration() = default;

    static TaskConfiguration create_from_yaml_content(const std::string& content);

    void set_string(const std::string& key, const std::string& value);
    void set_integer(const std::string& key, int32_t value);

    std::optional<std::string> get_string(const std::string& key) const;
    int32_t get_integer(const std::string& key, int32_t default_value) const;

    void add_broadcast_variable(const std::string& name);

    // Names registered under BCVAR_NAME_PREFIX<index> for every index below the count.
    std::vector<std::string> broadcast_variable_names() const;

private:
    std::map<std::string, std::string> entries_;
};

}  // namespace wlink
