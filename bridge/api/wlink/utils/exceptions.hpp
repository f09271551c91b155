// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wlink {

/**
 * @brief Base of every fatal condition raised by the bridge.
 * Carries the diagnostic text captured from the worker's error stream
 * at the time the condition was detected.
 */
class BridgeError : public std::runtime_error {
public:
    BridgeError(const std::string& message, std::string diagnostics = {}) :
        std::runtime_error(diagnostics.empty() ? message : message + "\n" + diagnostics),
        diagnostics_(std::move(diagnostics)) {}

    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string diagnostics_;
};

/**
 * @brief The worker could not be started, or exited before the connection was accepted.
 */
class WorkerStartupError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/**
 * @brief The worker asked for something the bridge cannot supply, or sent malformed data.
 */
class ProtocolViolationError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/**
 * @brief The worker reported an error in-band, or dropped the connection mid-protocol.
 */
class WorkerFailedError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/**
 * @brief The worker did not answer within the configured socket timeout.
 */
class WorkerTimeoutError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/**
 * @brief Records could not be written to or read from the scratch files.
 */
class DataExchangeError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/**
 * @brief A blocking socket operation ran past its deadline.
 */
class SocketTimeoutError : public std::runtime_error {
public:
    explicit SocketTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The peer closed the connection while a frame was expected.
 */
class ConnectionClosedError : public std::runtime_error {
public:
    explicit ConnectionClosedError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace wlink
