// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/process/worker_process.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>

#include "assert.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "wlink/process/shutdown_hooks.hpp"
#include "wlink/utils/exceptions.hpp"

extern char **environ;

namespace wlink {

namespace {

// A worker that dies while we write its preamble must not take the host down with SIGPIPE.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction current;
        if (sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL) {
            struct sigaction sa;
            sa.sa_handler = SIG_IGN;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            sigaction(SIGPIPE, &sa, nullptr);
        }
    });
}

void close_fd(int &fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void append_bounded(std::string &text, const char *data, size_t size) {
    text.append(data, size);
    if (text.size() > WorkerProcess::MAX_CAPTURED_OUTPUT) {
        text.erase(0, text.size() - WorkerProcess::MAX_CAPTURED_OUTPUT);
    }
}

}  // namespace

std::string to_string(TerminationOutcome outcome) {
    switch (outcome) {
        case TerminationOutcome::NOT_STARTED:
            return "not started";
        case TerminationOutcome::ALREADY_EXITED:
            return "already exited";
        case TerminationOutcome::KILLED:
            return "killed";
        case TerminationOutcome::DESTROYED:
            return "destroyed";
        case TerminationOutcome::STILL_RUNNING:
            return "still running";
        case TerminationOutcome::ALREADY_TERMINATED:
            return "already terminated";
    }
    return "unknown";
}

WorkerProcess::WorkerProcess(PidResolver pid_resolver) : pid_resolver_(std::move(pid_resolver)) {}

WorkerProcess::~WorkerProcess() {
    terminate();
    stop_drains();
    close_input();
}

std::optional<std::filesystem::path> WorkerProcess::resolve_executable(const std::filesystem::path &executable) {
    auto is_executable = [](const std::filesystem::path &path) {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    if (executable.empty()) {
        return std::nullopt;
    }
    if (executable.has_parent_path()) {
        if (is_executable(executable)) {
            return std::filesystem::absolute(executable);
        }
        return std::nullopt;
    }

    const auto path_env = utils::get_env_var_value("PATH");
    if (!path_env) {
        return std::nullopt;
    }
    std::stringstream ss(*path_env);
    std::string directory;
    while (std::getline(ss, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        std::filesystem::path candidate = std::filesystem::path(directory) / executable;
        if (is_executable(candidate)) {
            return std::filesystem::absolute(candidate);
        }
    }
    return std::nullopt;
}

void WorkerProcess::start(const std::filesystem::path &executable, const std::vector<std::string> &arguments) {
    std::lock_guard<std::mutex> lock(mutex_);
    WLINK_ASSERT(!started_, "Worker process already started with pid {}", pid_);

    auto resolved = resolve_executable(executable);
    if (!resolved) {
        throw WorkerStartupError(fmt::format("{} does not point to a valid worker binary.", executable.string()));
    }

    ignore_sigpipe();

    // [0] stdin, [1] stdout, [2] stderr; each as {read end, write end}.
    int fds[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    auto close_all = [&fds]() {
        for (auto &pair : fds) {
            close_fd(pair[0]);
            close_fd(pair[1]);
        }
    };
    for (auto &pair : fds) {
        if (pipe2(pair, O_CLOEXEC) == -1) {
            int saved_errno = errno;
            close_all();
            WLINK_THROW("Failed to create worker pipe: {}", strerror(saved_errno));
        }
    }
    if (pipe2(wakeup_fds_, O_CLOEXEC) == -1) {
        int saved_errno = errno;
        close_all();
        WLINK_THROW("Failed to create drain wakeup pipe: {}", strerror(saved_errno));
    }

    std::vector<std::string> args = {resolved->string()};
    args.insert(args.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, fds[0][0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, fds[1][1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, fds[2][1], STDERR_FILENO);

    // A group of its own, so the fallback termination reaches the worker and its children.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    int result = posix_spawn(&pid_, resolved->c_str(), &file_actions, &attributes, argv.data(), environ);

    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    // Child ends are only needed by the worker.
    close_fd(fds[0][0]);
    close_fd(fds[1][1]);
    close_fd(fds[2][1]);

    if (result != 0) {
        close_all();
        close_fd(wakeup_fds_[0]);
        close_fd(wakeup_fds_[1]);
        pid_ = -1;
        throw WorkerStartupError(fmt::format("Failed to spawn worker {}: {}", resolved->string(), strerror(result)));
    }

    started_ = true;
    ShutdownHooks::instance();
    ShutdownHooks::watch_process(pid_);
    stdin_fd_ = fds[0][1];
    stdout_drain_ = std::thread(&WorkerProcess::drain, this, fds[1][0], false);
    stderr_drain_ = std::thread(&WorkerProcess::drain, this, fds[2][0], true);

    WLINK_INFO("Worker process spawned with PID {}: {}", pid_, utils::join_arguments(args));
}

void WorkerProcess::write_input(const std::string &text) {
    // A private duplicate stays valid even if terminate() closes stdin_fd_ meanwhile.
    int fd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        WLINK_ASSERT(stdin_fd_ != -1, "Worker standard input is not open");
        fd = fcntl(stdin_fd_, F_DUPFD_CLOEXEC, 0);
    }
    if (fd == -1) {
        WLINK_THROW("Failed to duplicate worker standard input: {}", strerror(errno));
    }

    size_t total_written = 0;
    while (total_written < text.size()) {
        ssize_t bytes_written = write(fd, text.data() + total_written, text.size() - total_written);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            ::close(fd);
            WLINK_THROW("Failed to write to worker standard input: {}", strerror(saved_errno));
        }
        total_written += bytes_written;
    }
    ::close(fd);
}

bool WorkerProcess::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

std::optional<int> WorkerProcess::exit_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return std::nullopt;
    }
    return reap(false);
}

std::optional<int> WorkerProcess::reap(bool block) {
    if (reaped_) {
        return exit_code_;
    }

    // Peek first: the pid stays reserved, and watched, until it is reaped below.
    siginfo_t info{};
    int peek;
    do {
        peek = waitid(P_PID, pid_, &info, WEXITED | WNOWAIT | (block ? 0 : WNOHANG));
    } while (peek == -1 && errno == EINTR);

    if (peek == 0 && info.si_pid == 0) {
        return std::nullopt;
    }
    ShutdownHooks::unwatch_process(pid_);

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    reaped_ = true;
    if (result == -1) {
        // Somebody else reaped it; the status is lost.
        WLINK_WARN("Could not reap worker process {}: {}", pid_, strerror(errno));
        exit_code_ = -1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    WLINK_DEBUG("Worker process {} exited with {}", pid_, *exit_code_);
    return exit_code_;
}

std::optional<pid_t> WorkerProcess::native_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return native_pid_locked();
}

std::optional<pid_t> WorkerProcess::native_pid_locked() const {
    if (!started_ || reaped_ || pid_ <= 0) {
        return std::nullopt;
    }
    return pid_resolver_ ? pid_resolver_(pid_) : std::optional<pid_t>(pid_);
}

TerminationOutcome WorkerProcess::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return TerminationOutcome::NOT_STARTED;
    }
    if (termination_attempted_) {
        return TerminationOutcome::ALREADY_TERMINATED;
    }
    termination_attempted_ = true;

    if (reap(false).has_value()) {
        return TerminationOutcome::ALREADY_EXITED;
    }

    auto pid = native_pid_locked();
    if (pid && ::kill(*pid, SIGKILL) == 0) {
        reap(true);
        WLINK_INFO("Worker process {} killed", *pid);
        return TerminationOutcome::KILLED;
    }

    if (pid) {
        WLINK_WARN("Failed to kill worker process {}: {}", *pid, strerror(errno));
    } else {
        WLINK_WARN("Worker process id could not be resolved");
    }
    if (destroy()) {
        WLINK_INFO("Worker process {} destroyed", pid_);
        return TerminationOutcome::DESTROYED;
    }
    WLINK_ERROR("Worker process {} is still running after {} ms", pid_, DESTROY_GRACE.count());
    return TerminationOutcome::STILL_RUNNING;
}

bool WorkerProcess::destroy() {
    close_fd(stdin_fd_);
    if (::killpg(pid_, SIGTERM) != 0 && errno != ESRCH) {
        WLINK_WARN("Failed to signal process group of worker {}: {}", pid_, strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + DESTROY_GRACE;
    while (!reap(false).has_value()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void WorkerProcess::close_input() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_fd(stdin_fd_);
}

void WorkerProcess::stop_drains() {
    if (wakeup_fds_[1] != -1) {
        const char token = 'x';
        if (write(wakeup_fds_[1], &token, 1) < 0) {
            WLINK_WARN("Failed to wake up worker output drains: {}", strerror(errno));
        }
    }
    if (stdout_drain_.joinable()) {
        stdout_drain_.join();
    }
    if (stderr_drain_.joinable()) {
        stderr_drain_.join();
    }
    close_fd(wakeup_fds_[0]);
    close_fd(wakeup_fds_[1]);
}

void WorkerProcess::drain(int fd, bool error_stream) {
    const char *stream_name = error_stream ? "stderr" : "stdout";
    std::array<char, 4096> chunk;
    std::string pending_line;

    auto emit = [&](const std::string &line) {
        if (error_stream) {
            WLINK_ERROR("[worker {}] {}", stream_name, line);
        } else {
            WLINK_INFO("[worker {}] {}", stream_name, line);
        }
    };

    std::array<pollfd, 2> fds = {pollfd{fd, POLLIN, 0}, pollfd{wakeup_fds_[0], POLLIN, 0}};
    while (true) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            WLINK_WARN("Polling worker {} failed: {}", stream_name, strerror(errno));
            break;
        }
        // Finish reading what the worker already wrote before honouring a wakeup.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            break;
        }
        ssize_t bytes_read = read(fd, chunk.data(), chunk.size());
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            append_bounded(error_stream ? stderr_text_ : stdout_text_, chunk.data(), bytes_read);
        }
        pending_line.append(chunk.data(), bytes_read);
        size_t newline;
        while ((newline = pending_line.find('\n')) != std::string::npos) {
            emit(pending_line.substr(0, newline));
            pending_line.erase(0, newline + 1);
        }
    }
    if (!pending_line.empty()) {
        emit(pending_line);
    }
    ::close(fd);
}

std::string WorkerProcess::diagnostics() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return stderr_text_;
}

std::string WorkerProcess::output() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return stdout_text_;
}

}  // namespace wlink
