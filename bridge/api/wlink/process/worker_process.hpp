// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wlink {

enum class TerminationOutcome {
    NOT_STARTED,
    ALREADY_EXITED,
    KILLED,
    DESTROYED,
    STILL_RUNNING,
    ALREADY_TERMINATED,
};

std::string to_string(TerminationOutcome outcome);

/**
 * WorkerProcess owns one external worker process and the pipes to its standard streams.
 * Standard output and error are drained continuously by two passive threads; the error
 * stream is kept as diagnostic text for failure reports.
 *
 * The worker leads its own process group and is watched by ShutdownHooks until it is
 * reaped. terminate() and exit_status() may be called concurrently, e.g. from a shutdown
 * hook.
 */
class WorkerProcess {
public:
    // Captured text beyond this many bytes per stream drops its oldest part.
    static constexpr size_t MAX_CAPTURED_OUTPUT = 1024 * 1024;

    // How long destroy() waits for the process group to go away.
    static constexpr auto DESTROY_GRACE = std::chrono::milliseconds(2'000);

    // Maps the spawned pid to the id signalled by terminate(); std::nullopt if unknown.
    using PidResolver = std::function<std::optional<pid_t>(pid_t spawned_pid)>;

    explicit WorkerProcess(PidResolver pid_resolver = {});
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    /**
     * Spawns `executable` with `arguments` (argv[1..]). Throws WorkerStartupError if the
     * executable cannot be resolved to an existing, executable file.
     */
    void start(const std::filesystem::path& executable, const std::vector<std::string>& arguments);

    // Writes to the worker's standard input.
    void write_input(const std::string& text);

    /**
     * Non-blocking exit check. Returns the exit code, or 128 + signal number if the worker
     * was killed by a signal, once the worker has terminated.
     */
    std::optional<int> exit_status();

    bool is_running() { return started() && !exit_status().has_value(); }

    bool started() const;

    // std::nullopt once the process is gone or was never started.
    std::optional<pid_t> native_pid() const;

    /**
     * Ends the worker. Checks for a regular exit first, then sends SIGKILL to the native
     * process id. If the id cannot be resolved or signalled, falls back to destroy(),
     * which closes standard input and sends SIGTERM to the worker's process group.
     * Returns DESTROYED only if the worker is gone afterwards, STILL_RUNNING otherwise.
     * Only the first call acts; later calls return ALREADY_TERMINATED.
     */
    TerminationOutcome terminate();

    // Captured standard error.
    std::string diagnostics() const;

    // Captured standard output.
    std::string output() const;

    // Absolute path of an executable, searching PATH for bare names.
    static std::optional<std::filesystem::path> resolve_executable(const std::filesystem::path& executable);

private:
    std::optional<int> reap(bool block);
    std::optional<pid_t> native_pid_locked() const;
    bool destroy();
    void drain(int fd, bool error_stream);
    void stop_drains();
    void close_input();

    PidResolver pid_resolver_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    bool started_ = false;
    bool reaped_ = false;
    bool termination_attempted_ = false;
    std::optional<int> exit_code_;

    int stdin_fd_ = -1;
    // Written to stop the drain threads even if the pipes stay open.
    int wakeup_fds_[2] = {-1, -1};

    std::thread stdout_drain_;
    std::thread stderr_drain_;

    mutable std::mutex output_mutex_;
    std::string stdout_text_;
    std::string stderr_text_;
};

}  // namespace wlink
