// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_utils/wait.hpp"
#include "wlink/process/shutdown_hooks.hpp"
#include "wlink/process/worker_process.hpp"
#include "wlink/utils/exceptions.hpp"

using namespace wlink;
using namespace wlink::test_utils;

TEST(WorkerProcess, MissingBinaryIsStartupError) {
    WorkerProcess process;
    try {
        process.start("/nonexistent/wlink/python", {});
        FAIL() << "Expected WorkerStartupError";
    } catch (const WorkerStartupError& e) {
        EXPECT_NE(std::string(e.what()).find("does not point to a valid worker binary."), std::string::npos);
    }
    EXPECT_FALSE(process.started());
    EXPECT_EQ(process.terminate(), TerminationOutcome::NOT_STARTED);
}

TEST(WorkerProcess, ResolvesExecutableFromPath) {
    auto resolved = WorkerProcess::resolve_executable("sh");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->is_absolute());
    EXPECT_FALSE(WorkerProcess::resolve_executable("wlink-no-such-binary").has_value());
}

TEST(WorkerProcess, CapturesOutputAndExitCode) {
    WorkerProcess process;
    process.start("sh", {"-c", "echo regular output; echo diagnostic text >&2; exit 3"});

    ASSERT_TRUE(wait_until([&]() { return process.exit_status().has_value(); }));
    EXPECT_EQ(process.exit_status(), 3);
    EXPECT_FALSE(process.is_running());

    EXPECT_TRUE(wait_until([&]() { return process.diagnostics().find("diagnostic text") != std::string::npos; }));
    EXPECT_TRUE(wait_until([&]() { return process.output().find("regular output") != std::string::npos; }));
    EXPECT_EQ(process.diagnostics().find("regular output"), std::string::npos);
}

TEST(WorkerProcess, ForwardsStandardInput) {
    WorkerProcess process;
    process.start("sh", {"-c", "read line; echo got:$line >&2"});
    process.write_input("handshake\n");

    ASSERT_TRUE(wait_until([&]() { return process.exit_status().has_value(); }));
    EXPECT_TRUE(wait_until([&]() { return process.diagnostics().find("got:handshake") != std::string::npos; }));
}

TEST(WorkerProcess, TerminateKillsRunningWorkerOnce) {
    WorkerProcess process;
    process.start("sleep", {"30"});
    EXPECT_TRUE(process.is_running());
    EXPECT_TRUE(process.native_pid().has_value());

    EXPECT_EQ(process.terminate(), TerminationOutcome::KILLED);
    EXPECT_EQ(process.exit_status(), 128 + 9);
    EXPECT_FALSE(process.native_pid().has_value());

    EXPECT_EQ(process.terminate(), TerminationOutcome::ALREADY_TERMINATED);
}

TEST(WorkerProcess, TerminateAfterExit) {
    WorkerProcess process;
    process.start("sh", {"-c", "exit 0"});
    ASSERT_TRUE(wait_until([&]() { return process.exit_status().has_value(); }));

    EXPECT_EQ(process.terminate(), TerminationOutcome::ALREADY_EXITED);
}

TEST(WorkerProcess, SignalExitStatus) {
    WorkerProcess process;
    process.start("sh", {"-c", "kill -TERM $$"});
    ASSERT_TRUE(wait_until([&]() { return process.exit_status().has_value(); }));
    EXPECT_EQ(process.exit_status(), 128 + 15);
}

TEST(WorkerProcess, ReapedWorkerIsNoLongerWatched) {
    const size_t watched_before = ShutdownHooks::watched_processes();

    WorkerProcess process;
    process.start("sleep", {"30"});
    EXPECT_EQ(ShutdownHooks::watched_processes(), watched_before + 1);

    EXPECT_EQ(process.terminate(), TerminationOutcome::KILLED);
    EXPECT_EQ(ShutdownHooks::watched_processes(), watched_before);
}

TEST(WorkerProcess, UnresolvedPidFallsBackToProcessGroup) {
    // sleep never reads its input, so only the group signal can end it.
    WorkerProcess process([](pid_t) { return std::optional<pid_t>(); });
    process.start("sleep", {"30"});
    EXPECT_FALSE(process.native_pid().has_value());

    EXPECT_EQ(process.terminate(), TerminationOutcome::DESTROYED);
    EXPECT_EQ(process.exit_status(), 128 + SIGTERM);
    EXPECT_FALSE(process.is_running());
    EXPECT_THROW(process.write_input("late\n"), std::runtime_error);
}

TEST(WorkerProcess, InputWriterRacesTermination) {
    WorkerProcess process([](pid_t) { return std::optional<pid_t>(); });
    process.start("sh", {"-c", "cat > /dev/null"});

    std::thread writer([&]() {
        const std::string line(512, 'x');
        try {
            while (true) {
                process.write_input(line);
            }
        } catch (const std::runtime_error&) {
            // Input was closed by terminate().
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(process.terminate(), TerminationOutcome::DESTROYED);
    writer.join();
    EXPECT_TRUE(process.exit_status().has_value());
}
