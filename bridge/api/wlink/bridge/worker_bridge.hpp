// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "wlink/bridge/failure_reporter.hpp"
#include "wlink/config/bridge_config.hpp"
#include "wlink/io/receiver.hpp"
#include "wlink/io/sender.hpp"
#include "wlink/process/shutdown_hooks.hpp"
#include "wlink/types/record.hpp"

namespace wlink {

class FrameChannel;
class ListeningSocket;
class RuntimeContext;
class StreamConnection;
class TaskConfiguration;
class WorkerProcess;

/**
 * WorkerBridge connects one task to one external worker process: it launches and
 * supervises the worker, performs the handshake and drives the framed protocol.
 *
 * Usage: open(), optionally send_broadcast_variables(), any number of stream_* calls,
 * close(). Every failure surfaces as a BridgeError; close() is always safe to call.
 */
class WorkerBridge {
public:
    /**
     * @param id Identifier of this bridge, unique among the bridges of one subtask.
     * @param sender Encoder for the input scratch file, ScratchFileSender if null.
     * @param receiver Decoder for the output scratch file, ScratchFileReceiver if null.
     */
    WorkerBridge(
        RuntimeContext& context,
        int id,
        BridgeConfig config,
        std::unique_ptr<Sender> sender = nullptr,
        std::unique_ptr<Receiver> receiver = nullptr);
    ~WorkerBridge();

    WorkerBridge(const WorkerBridge&) = delete;
    WorkerBridge& operator=(const WorkerBridge&) = delete;

    /**
     * Starts the worker (unless in debug mode), sends the handshake preamble and
     * accepts the worker's connection.
     */
    void open();

    /**
     * Releases the connection, both scratch files, the worker process and the shutdown
     * hook. Idempotent; errors are logged, never thrown.
     */
    void close();

    void send_broadcast_variables(const TaskConfiguration& config);

    void stream_without_groups(RecordIterator& source, Collector& sink);

    void stream_with_groups(RecordIterator& source0, RecordIterator& source1, Collector& sink);

    bool is_open() const { return channel_ != nullptr && !closed_; }

    // Listening port, 0 until open() bound it.
    uint16_t port() const { return port_.load(); }

    int id() const { return id_; }

    const BridgeConfig& config() const { return config_; }

    const std::filesystem::path& input_file_path() const { return input_file_path_; }

    const std::filesystem::path& output_file_path() const { return output_file_path_; }

    // Null before open() and in debug mode.
    std::shared_ptr<WorkerProcess> worker_process() const { return process_; }

    // Text captured from the worker's error stream so far.
    std::string diagnostics() const;

    // Preamble written to the worker's standard input.
    std::string handshake_preamble() const;

private:
    void prepare_scratch_files();
    void start_worker();
    void accept_worker();
    FrameChannel& channel();

    RuntimeContext& context_;
    int id_;
    BridgeConfig config_;
    std::unique_ptr<Sender> sender_;
    std::unique_ptr<Receiver> receiver_;
    FailureReporter reporter_;

    std::filesystem::path input_file_path_;
    std::filesystem::path output_file_path_;

    std::unique_ptr<ListeningSocket> listener_;
    std::unique_ptr<StreamConnection> connection_;
    std::unique_ptr<FrameChannel> channel_;
    std::shared_ptr<WorkerProcess> process_;
    std::optional<ShutdownHooks::HookId> shutdown_hook_;

    std::atomic<uint16_t> port_{0};
    bool opened_ = false;
    bool closed_ = false;
};

}  // namespace wlink
