// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <unistd.h>

#include <stdexcept>
#include <vector>

#include "wlink/process/shutdown_hooks.hpp"

using namespace wlink;

TEST(ShutdownHooks, RunsRegisteredHooksOnce) {
    ShutdownHooks& hooks = ShutdownHooks::instance();
    hooks.run_all();

    std::vector<int> calls;
    hooks.add([&]() { calls.push_back(1); });
    hooks.add([&]() { calls.push_back(2); });
    EXPECT_EQ(hooks.size(), 2u);

    hooks.run_all();
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(hooks.size(), 0u);

    hooks.run_all();
    EXPECT_EQ(calls.size(), 2u);
}

TEST(ShutdownHooks, RemovedHookDoesNotRun) {
    ShutdownHooks& hooks = ShutdownHooks::instance();
    hooks.run_all();

    bool ran = false;
    auto id = hooks.add([&]() { ran = true; });
    EXPECT_TRUE(hooks.remove(id));
    EXPECT_FALSE(hooks.remove(id));

    hooks.run_all();
    EXPECT_FALSE(ran);
}

TEST(ShutdownHooks, FailingHookDoesNotStopOthers) {
    ShutdownHooks& hooks = ShutdownHooks::instance();
    hooks.run_all();

    bool ran = false;
    hooks.add([]() { throw std::runtime_error("hook failure"); });
    hooks.add([&]() { ran = true; });

    EXPECT_NO_THROW(hooks.run_all());
    EXPECT_TRUE(ran);
}

TEST(ShutdownHooks, WatchesProcessesUntilUnwatched) {
    ShutdownHooks& hooks = ShutdownHooks::instance();
    const size_t watched_before = hooks.watched_processes();

    // Never signalled here; only the bookkeeping is checked.
    const pid_t self = getpid();
    EXPECT_TRUE(hooks.watch_process(self));
    EXPECT_EQ(hooks.watched_processes(), watched_before + 1);

    hooks.unwatch_process(self);
    EXPECT_EQ(hooks.watched_processes(), watched_before);

    hooks.unwatch_process(self);
    EXPECT_EQ(hooks.watched_processes(), watched_before);
}
