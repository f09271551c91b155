// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "wlink/types/record.hpp"

namespace wlink {

/**
 * What the bridge needs to know about the task that owns it.
 */
class RuntimeContext {
public:
    virtual ~RuntimeContext() = default;

    virtual std::string task_name() const = 0;

    virtual int subtask_index() const = 0;

    // Directory holding the worker's plan artifact.
    virtual std::filesystem::path plan_directory() const = 0;

    // Fresh iterator over the named broadcast collection. Throws if the name is unknown.
    virtual std::unique_ptr<RecordIterator> broadcast_variable(const std::string& name) = 0;
};

/**
 * RuntimeContext backed by in-memory broadcast collections.
 */
class LocalRuntimeContext : public RuntimeContext {
public:
    LocalRuntimeContext(std::string task_name, int subtask_index, std::filesystem::path plan_directory);

    std::string task_name() const override { return task_name_; }

    int subtask_index() const override { return subtask_index_; }

    std::filesystem::path plan_directory() const override { return plan_directory_; }

    std::unique_ptr<RecordIterator> broadcast_variable(const std::string& name) override;

    void set_broadcast_variable(const std::string& name, std::vector<Record> records);

private:
    std::string task_name_;
    int subtask_index_;
    std::filesystem::path plan_directory_;
    std::map<std::string, std::vector<Record>> broadcast_variables_;
};

}  // namespace wlink
