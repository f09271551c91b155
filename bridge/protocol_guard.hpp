// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>

#include "wlink/bridge/failure_reporter.hpp"
#include "wlink/utils/exceptions.hpp"

namespace wlink {

// Runs one protocol phase, reporting socket-level failures with worker diagnostics.
template <typename Fn>
void run_protocol_phase(const FailureReporter& reporter, Fn&& phase) {
    try {
        phase();
    } catch (const SocketTimeoutError& e) {
        reporter.stopped_responding(e.what());
    } catch (const ConnectionClosedError& e) {
        reporter.connection_lost(e.what());
    }
}

// Calls into a Sender or Receiver; their failures are reported with worker diagnostics.
template <typename Fn>
decltype(auto) call_collaborator(const FailureReporter& reporter, Fn&& call) {
    try {
        return call();
    } catch (const ProtocolViolationError& e) {
        reporter.protocol_violation(e.what());
    } catch (const BridgeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        reporter.exchange_failed(e.what());
    }
}

}  // namespace wlink
