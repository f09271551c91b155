// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/bridge/runtime_context.hpp"

#include "assert.hpp"

namespace wlink {

LocalRuntimeContext::LocalRuntimeContext(
    std::string task_name, int subtask_index, std::filesystem::path plan_directory) :
    task_name_(std::move(task_name)), subtask_index_(subtask_index), plan_directory_(std::move(plan_directory)) {}

std::unique_ptr<RecordIterator> LocalRuntimeContext::broadcast_variable(const std::string& name) {
    auto it = broadcast_variables_.find(name);
    if (it == broadcast_variables_.end()) {
        WLINK_THROW("Broadcast variable '{}' is not available in task {}", name, task_name_);
    }
    return std::make_unique<VectorRecordIterator>(it->second);
}

void LocalRuntimeContext::set_broadcast_variable(const std::string& name, std::vector<Record> records) {
    broadcast_variables_[name] = std::move(records);
}

}  // namespace wlink
