// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/bridge/worker_bridge.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <system_error>
#include <thread>
#include <utility>

#include "assert.hpp"
#include "logger.hpp"
#include "protocol_guard.hpp"
#include "wlink/bridge/broadcast_distributor.hpp"
#include "wlink/bridge/runtime_context.hpp"
#include "wlink/bridge/signal_multiplexer.hpp"
#include "wlink/config/task_configuration.hpp"
#include "wlink/io/frame_channel.hpp"
#include "wlink/io/scratch_file_receiver.hpp"
#include "wlink/io/scratch_file_sender.hpp"
#include "wlink/io/stream_socket.hpp"
#include "wlink/process/worker_process.hpp"
#include "wlink/utils/exceptions.hpp"

namespace wlink {

WorkerBridge::WorkerBridge(
    RuntimeContext& context,
    int id,
    BridgeConfig config,
    std::unique_ptr<Sender> sender,
    std::unique_ptr<Receiver> receiver) :
    context_(context),
    id_(id),
    config_(std::move(config)),
    sender_(sender ? std::move(sender) : std::make_unique<ScratchFileSender>(config_.scratch_capacity)),
    receiver_(receiver ? std::move(receiver) : std::make_unique<ScratchFileReceiver>()),
    reporter_(
        context.task_name(),
        [this]() { return diagnostics(); },
        config_.error_drain_grace) {}

WorkerBridge::~WorkerBridge() { close(); }

std::string WorkerBridge::diagnostics() const { return process_ ? process_->diagnostics() : std::string(); }

std::string WorkerBridge::handshake_preamble() const {
    return fmt::format(
        "operator\n{}\n{}\n{}\n{}\n", port(), id_, input_file_path_.string(), output_file_path_.string());
}

void WorkerBridge::prepare_scratch_files() {
    const int subtask = context_.subtask_index();
    input_file_path_ = config_.tmp_data_dir / fmt::format("{}{}input", id_, subtask);
    output_file_path_ = config_.tmp_data_dir / fmt::format("{}{}output", id_, subtask);

    std::error_code ec;
    std::filesystem::create_directories(config_.tmp_data_dir, ec);
    if (ec) {
        WLINK_THROW("Failed to create scratch directory {}: {}", config_.tmp_data_dir.string(), ec.message());
    }

    sender_->open(input_file_path_);
    receiver_->open(output_file_path_);
}

void WorkerBridge::start_worker() {
    std::vector<std::string> arguments = config_.interpreter_flags;
    arguments.push_back((context_.plan_directory() / config_.plan_name).string());
    arguments.insert(arguments.end(), config_.plan_arguments.begin(), config_.plan_arguments.end());

    if (config_.debug) {
        WLINK_INFO(
            "Debug mode: start the worker for task {} manually with: {} {}",
            context_.task_name(),
            config_.worker_binary().string(),
            fmt::join(arguments, " "));
        WLINK_INFO(
            "Debug mode: handshake for task {} is port={} id={} input={} output={}",
            context_.task_name(),
            port(),
            id_,
            input_file_path_.string(),
            output_file_path_.string());
        return;
    }

    process_ = std::make_shared<WorkerProcess>();
    process_->start(config_.worker_binary(), arguments);

    std::weak_ptr<WorkerProcess> weak_process = process_;
    shutdown_hook_ = ShutdownHooks::instance().add([weak_process]() {
        if (auto process = weak_process.lock()) {
            process->terminate();
        }
    });

    bool preamble_sent = true;
    try {
        process_->write_input(handshake_preamble());
    } catch (const std::runtime_error& e) {
        preamble_sent = false;
        WLINK_WARN("Failed to send handshake to worker of task {}: {}", context_.task_name(), e.what());
    }

    std::this_thread::sleep_for(config_.startup_grace);

    if (auto exit_code = process_->exit_status()) {
        reporter_.startup_failed(*exit_code);
    }
    if (!preamble_sent) {
        throw WorkerStartupError(
            fmt::format("Worker for task {} did not accept the handshake.", context_.task_name()), diagnostics());
    }
}

void WorkerBridge::accept_worker() {
    try {
        connection_ = listener_->accept(config_.effective_socket_timeout());
    } catch (const SocketTimeoutError& e) {
        reporter_.stopped_responding(e.what());
    }
    connection_->set_read_timeout(config_.effective_socket_timeout());
    channel_ = std::make_unique<FrameChannel>(*connection_);
    WLINK_DEBUG("Worker of task {} connected on port {}", context_.task_name(), port());
}

void WorkerBridge::open() {
    WLINK_ASSERT(!opened_, "Bridge {} of task {} was already opened", id_, context_.task_name());
    opened_ = true;

    call_collaborator(reporter_, [this]() { prepare_scratch_files(); });

    listener_ = std::make_unique<ListeningSocket>(config_.listen_port);
    port_.store(listener_->local_port());

    start_worker();
    accept_worker();
}

void WorkerBridge::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    auto step = [this](const char* what, auto&& action) {
        try {
            action();
        } catch (const std::exception& e) {
            WLINK_ERROR("Failed to close {} of task {}: {}", what, context_.task_name(), e.what());
        }
    };

    step("worker connection", [this]() {
        channel_.reset();
        if (connection_) {
            connection_->close();
        }
        connection_.reset();
    });
    step("input scratch file", [this]() { sender_->close(); });
    step("output scratch file", [this]() { receiver_->close(); });

    if (!config_.debug && process_) {
        step("worker process", [this]() {
            const TerminationOutcome outcome = process_->terminate();
            WLINK_DEBUG("Worker of task {} terminated: {}", context_.task_name(), to_string(outcome));
        });
    }
    if (shutdown_hook_) {
        ShutdownHooks::instance().remove(*shutdown_hook_);
        shutdown_hook_.reset();
    }

    step("listening socket", [this]() {
        if (listener_) {
            listener_->close();
        }
    });
    step("scratch files", [this]() {
        std::error_code ec;
        if (!input_file_path_.empty()) {
            std::filesystem::remove(input_file_path_, ec);
        }
        if (!output_file_path_.empty()) {
            std::filesystem::remove(output_file_path_, ec);
        }
    });
}

FrameChannel& WorkerBridge::channel() {
    WLINK_ASSERT(is_open(), "Bridge {} of task {} is not open", id_, context_.task_name());
    return *channel_;
}

void WorkerBridge::send_broadcast_variables(const TaskConfiguration& config) {
    BroadcastDistributor(channel(), *sender_, reporter_).distribute(config, context_);
}

void WorkerBridge::stream_without_groups(RecordIterator& source, Collector& sink) {
    SignalMultiplexer(channel(), *sender_, *receiver_, reporter_).stream_without_groups(source, sink);
}

void WorkerBridge::stream_with_groups(RecordIterator& source0, RecordIterator& source1, Collector& sink) {
    SignalMultiplexer(channel(), *sender_, *receiver_, reporter_).stream_with_groups(source0, source1, sink);
}

}  // namespace wlink
