// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace wlink {

/**
 * Process-wide registry of callbacks run when the host process exits, so workers are
 * not left behind by owners that never reached an orderly close. Hooks run from a
 * std::atexit handler installed on first use, or from an explicit run_all() call made
 * by a host with its own shutdown handling. Each hook runs at most once.
 *
 * Hooks cannot run from a signal handler. For a host ended by SIGTERM, SIGINT or SIGHUP
 * the watched worker processes are killed directly, after which the signal goes on to
 * the handler that was installed before, or to its default action. Signals the host
 * ignores are left alone.
 */
class ShutdownHooks {
public:
    using HookId = uint64_t;

    // Number of worker processes that can be watched at the same time.
    static constexpr size_t MAX_WATCHED_PROCESSES = 256;

    static ShutdownHooks& instance();

    HookId add(std::function<void()> hook);

    // False if the hook already ran or was removed.
    bool remove(HookId id);

    void run_all();

    size_t size() const;

    // Kill `pid` with SIGKILL if the host is ended by a termination signal. False if the
    // watch list is full. The handlers are only in place once instance() was called.
    static bool watch_process(pid_t pid);

    // Must be called before `pid` is reaped.
    static void unwatch_process(pid_t pid);

    static size_t watched_processes();

private:
    ShutdownHooks() = default;

    static void install_signal_handlers();

    mutable std::mutex mutex_;
    std::map<HookId, std::function<void()>> hooks_;
    HookId next_id_ = 1;
};

}  // namespace wlink
