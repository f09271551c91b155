// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace wlink {

/**
 * Turns worker failures into BridgeError exceptions that name the task and carry the
 * diagnostic text captured from the worker. Every method throws.
 */
class FailureReporter {
public:
    using DiagnosticsSource = std::function<std::string()>;

    FailureReporter(
        std::string task_name, DiagnosticsSource diagnostics, std::chrono::milliseconds error_drain_grace);

    // WorkerStartupError.
    [[noreturn]] void startup_failed(int exit_code) const;

    // ProtocolViolationError.
    [[noreturn]] void protocol_violation(const std::string& detail) const;

    // WorkerFailedError, raised after the error drain grace period so the worker's
    // error output has arrived.
    [[noreturn]] void worker_failed() const;

    // WorkerFailedError for a connection the worker closed mid-protocol.
    [[noreturn]] void connection_lost(const std::string& detail) const;

    // DataExchangeError for a Sender or Receiver that failed outside the protocol.
    [[noreturn]] void exchange_failed(const std::string& detail) const;

    // WorkerTimeoutError.
    [[noreturn]] void stopped_responding(const std::string& detail) const;

    const std::string& task_name() const { return task_name_; }

private:
    std::string diagnostics() const;

    std::string task_name_;
    DiagnosticsSource diagnostics_;
    std::chrono::milliseconds error_drain_grace_;
};

}  // namespace wlink
