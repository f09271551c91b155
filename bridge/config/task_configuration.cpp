// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/config/task_configuration.hpp"

#include <yaml-cpp/yaml.h>

#include "assert.hpp"

namespace wlink {

TaskConfiguration TaskConfiguration::create_from_yaml_content(const std::string& content) {
    TaskConfiguration config;
    YAML::Node yaml = YAML::Load(content);
    if (!yaml.IsDefined() || yaml.IsNull()) {
        return config;
    }
    WLINK_ASSERT(yaml.IsMap(), "Task configuration must be a map of scalars");
    for (YAML::const_iterator node = yaml.begin(); node != yaml.end(); ++node) {
        config.set_string(node->first.as<std::string>(), node->second.as<std::string>());
    }
    return config;
}

void TaskConfiguration::set_string(const std::string& key, const std::string& value) { entries_[key] = value; }

void TaskConfiguration::set_integer(const std::string& key, int32_t value) { entries_[key] = std::to_string(value); }

std::optional<std::string> TaskConfiguration::get_string(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int32_t TaskConfiguration::get_integer(const std::string& key, int32_t default_value) const {
    auto value = get_string(key);
    if (!value) {
        return default_value;
    }
    try {
        size_t parsed = 0;
        int32_t result = std::stoi(*value, &parsed);
        if (parsed == value->size()) {
            return result;
        }
    } catch (const std::exception&) {
        // Reported below.
    }
    WLINK_THROW("Configuration value for '{}' is not an integer: '{}'", key, *value);
}

void TaskConfiguration::add_broadcast_variable(const std::string& name) {
    const int32_t count = get_integer(BCVAR_COUNT_KEY, 0);
    set_string(BCVAR_NAME_PREFIX + std::to_string(count), name);
    set_integer(BCVAR_COUNT_KEY, count + 1);
}

std::vector<std::string> TaskConfiguration::broadcast_variable_names() const {
    const int32_t count = get_integer(BCVAR_COUNT_KEY, 0);
    WLINK_ASSERT(count >= 0, "Broadcast variable count must not be negative, got {}", count);

    std::vector<std::string> names;
    names.reserve(count);
    for (int32_t index = 0; index < count; index++) {
        const std::string key = BCVAR_NAME_PREFIX + std::to_string(index);
        auto name = get_string(key);
        if (!name) {
            WLINK_THROW("Broadcast variable {} of {} has no name under '{}'", index, count, key);
        }
        names.push_back(*name);
    }
    return names;
}

}  // namespace wlink
