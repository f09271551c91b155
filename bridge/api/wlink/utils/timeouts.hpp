/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace wlink::timeout {
// Time given to a freshly spawned worker to fail before the connection is accepted.
inline constexpr auto WORKER_STARTUP_GRACE = std::chrono::milliseconds(2'000);

// Time given to the worker's error stream to drain after an in-band error.
inline constexpr auto WORKER_ERROR_DRAIN_GRACE = std::chrono::milliseconds(2'000);

inline constexpr auto WORKER_SOCKET_TIMEOUT = std::chrono::milliseconds(300'000);

// A zero duration disables the corresponding timeout.
inline constexpr auto NO_TIMEOUT = std::chrono::milliseconds(0);
}  // namespace wlink::timeout
