// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/process/shutdown_hooks.hpp"

#include <signal.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>

#include "logger.hpp"

namespace wlink {

namespace {

constexpr std::array<int, 3> TERMINATION_SIGNALS = {SIGTERM, SIGINT, SIGHUP};

// Read from the signal handler: lock-free slots, 0 marks a free one.
std::array<std::atomic<pid_t>, ShutdownHooks::MAX_WATCHED_PROCESSES> watched_pids{};

struct sigaction previous_actions[NSIG];

void on_termination_signal(int signo, siginfo_t* info, void* context) {
    const int saved_errno = errno;
    for (auto& slot : watched_pids) {
        const pid_t pid = slot.load();
        if (pid > 0) {
            ::kill(pid, SIGKILL);
        }
    }

    const struct sigaction& previous = previous_actions[signo];
    if (previous.sa_flags & SA_SIGINFO) {
        previous.sa_sigaction(signo, info, context);
    } else if (previous.sa_handler == SIG_DFL) {
        // Delivered with the default action once this handler returns.
        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        sigemptyset(&default_action.sa_mask);
        sigaction(signo, &default_action, nullptr);
        raise(signo);
    } else if (previous.sa_handler != SIG_IGN) {
        previous.sa_handler(signo);
    }
    errno = saved_errno;
}

}  // namespace

ShutdownHooks& ShutdownHooks::instance() {
    static ShutdownHooks hooks;
    static std::once_flag installed;
    std::call_once(installed, []() {
        // The logger has to outlive the exit handler, so it is created first.
        logger::detail::ensure_initialized();
        std::atexit([]() { ShutdownHooks::instance().run_all(); });
        install_signal_handlers();
    });
    return hooks;
}

void ShutdownHooks::install_signal_handlers() {
    for (int signo : TERMINATION_SIGNALS) {
        struct sigaction current {};
        if (sigaction(signo, nullptr, &current) != 0) {
            WLINK_WARN("Failed to query handler of signal {}: {}", signo, strerror(errno));
            continue;
        }
        if (!(current.sa_flags & SA_SIGINFO) && current.sa_handler == SIG_IGN) {
            continue;
        }
        previous_actions[signo] = current;

        struct sigaction action {};
        action.sa_sigaction = on_termination_signal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_SIGINFO | SA_RESTART;
        if (sigaction(signo, &action, nullptr) != 0) {
            WLINK_WARN("Failed to install handler for signal {}: {}", signo, strerror(errno));
        }
    }
}

ShutdownHooks::HookId ShutdownHooks::add(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    HookId id = next_id_++;
    hooks_.emplace(id, std::move(hook));
    return id;
}

bool ShutdownHooks::remove(HookId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.erase(id) > 0;
}

void ShutdownHooks::run_all() {
    std::map<HookId, std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(hooks_);
    }
    for (auto& [id, hook] : pending) {
        try {
            hook();
        } catch (const std::exception& e) {
            WLINK_ERROR("Shutdown hook {} failed: {}", id, e.what());
        }
    }
}

size_t ShutdownHooks::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.size();
}

bool ShutdownHooks::watch_process(pid_t pid) {
    for (auto& slot : watched_pids) {
        pid_t expected = 0;
        if (slot.compare_exchange_strong(expected, pid)) {
            return true;
        }
    }
    WLINK_WARN("Cannot watch worker process {}: {} processes are watched already", pid, MAX_WATCHED_PROCESSES);
    return false;
}

void ShutdownHooks::unwatch_process(pid_t pid) {
    for (auto& slot : watched_pids) {
        pid_t expected = pid;
        if (slot.compare_exchange_strong(expected, 0)) {
            return;
        }
    }
}

size_t ShutdownHooks::watched_processes() {
    size_t count = 0;
    for (const auto& slot : watched_pids) {
        if (slot.load() > 0) {
            count++;
        }
    }
    return count;
}

}  // namespace wlink
