// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "temp_directory.hpp"
#include "worker_side_channel.hpp"
#include "wlink/bridge/failure_reporter.hpp"
#include "wlink/bridge/signal_multiplexer.hpp"
#include "wlink/io/frame_channel.hpp"
#include "wlink/io/scratch_file_receiver.hpp"
#include "wlink/io/scratch_file_sender.hpp"
#include "wlink/io/stream_socket.hpp"

namespace wlink::test_utils {

/**
 * Bridge-side protocol pieces wired to an in-process worker end over loopback,
 * without a worker process.
 */
struct BridgeHarness {
    explicit BridgeHarness(
        uint32_t capacity = ScratchFileSender::DEFAULT_CAPACITY,
        std::chrono::milliseconds read_timeout = std::chrono::seconds(10)) :
        sender(capacity), reporter("harness task", [this]() { return diagnostics; }, std::chrono::milliseconds(0)) {
        sender.open(input());
        receiver.open(output());
        worker = std::make_unique<WorkerSideChannel>(listener.local_port());
        connection = listener.accept(std::chrono::seconds(5));
        connection->set_read_timeout(read_timeout);
        channel = std::make_unique<FrameChannel>(*connection);
    }

    std::filesystem::path input() const { return dir.path() / "0input"; }
    std::filesystem::path output() const { return dir.path() / "0output"; }

    SignalMultiplexer multiplexer() { return SignalMultiplexer(*channel, sender, receiver, reporter); }

    TempDirectory dir;
    ListeningSocket listener;
    ScratchFileSender sender;
    ScratchFileReceiver receiver;
    std::string diagnostics = "Traceback: harness worker diagnostics";
    FailureReporter reporter;
    std::unique_ptr<WorkerSideChannel> worker;
    std::unique_ptr<StreamConnection> connection;
    std::unique_ptr<FrameChannel> channel;
};

// Runs the worker side of a test on its own thread; failures there are reported to gtest.
template <typename Fn>
std::thread run_worker(Fn fn) {
    return std::thread([fn = std::move(fn)]() mutable {
        try {
            fn();
        } catch (const std::exception& e) {
            ADD_FAILURE() << "Worker side failed: " << e.what();
        }
    });
}

// Requests buffers until the last one, echoing each back as a result, then finishes.
inline void echo_worker(WorkerSideChannel& worker, const std::filesystem::path& input, const std::filesystem::path& output) {
    WorkerSideChannel::Notification notification{0, true, signal::FLAG_MORE};
    while (notification.has_next) {
        std::vector<Record> records = worker.request_buffer(input, &notification);
        if (!records.empty()) {
            EXPECT_EQ(worker.send_result(output, records), 0);
        }
    }
    worker.send_signal(signal::FINISHED);
}

inline std::vector<Record> make_records(size_t count, const std::string& prefix = "record-") {
    std::vector<Record> records;
    for (size_t i = 0; i < count; i++) {
        records.push_back(to_record(prefix + std::to_string(i)));
    }
    return records;
}

}  // namespace wlink::test_utils
