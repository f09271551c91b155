// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/bridge/failure_reporter.hpp"

#include <fmt/format.h>

#include <thread>

#include "logger.hpp"
#include "wlink/utils/exceptions.hpp"

namespace wlink {

FailureReporter::FailureReporter(
    std::string task_name, DiagnosticsSource diagnostics, std::chrono::milliseconds error_drain_grace) :
    task_name_(std::move(task_name)), diagnostics_(std::move(diagnostics)), error_drain_grace_(error_drain_grace) {}

std::string FailureReporter::diagnostics() const { return diagnostics_ ? diagnostics_() : std::string(); }

void FailureReporter::startup_failed(int exit_code) const {
    WLINK_ERROR("Worker for task {} exited with {} during startup", task_name_, exit_code);
    throw WorkerStartupError(
        fmt::format("External process for task {} terminated prematurely (exit code {}).", task_name_, exit_code),
        diagnostics());
}

void FailureReporter::protocol_violation(const std::string& detail) const {
    WLINK_ERROR("Protocol violation in task {}: {}", task_name_, detail);
    throw ProtocolViolationError(
        fmt::format("External process for task {} violated the protocol: {}", task_name_, detail), diagnostics());
}

void FailureReporter::worker_failed() const {
    std::this_thread::sleep_for(error_drain_grace_);
    WLINK_ERROR("Worker for task {} reported an error", task_name_);
    throw WorkerFailedError(
        fmt::format("External process for task {} terminated prematurely due to an error.", task_name_),
        diagnostics());
}

void FailureReporter::connection_lost(const std::string& detail) const {
    std::this_thread::sleep_for(error_drain_grace_);
    WLINK_ERROR("Worker for task {} closed the connection: {}", task_name_, detail);
    throw WorkerFailedError(
        fmt::format("External process for task {} terminated prematurely: {}", task_name_, detail), diagnostics());
}

void FailureReporter::exchange_failed(const std::string& detail) const {
    WLINK_ERROR("Data exchange with the worker of task {} failed: {}", task_name_, detail);
    throw DataExchangeError(
        fmt::format("Records of task {} could not be exchanged with the external process: {}", task_name_, detail),
        diagnostics());
}

void FailureReporter::stopped_responding(const std::string& detail) const {
    WLINK_ERROR("Worker for task {} stopped responding: {}", task_name_, detail);
    throw WorkerTimeoutError(
        fmt::format("External process for task {} stopped responding ({}).", task_name_, detail), diagnostics());
}

}  // namespace wlink
