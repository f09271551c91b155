// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/bridge/broadcast_distributor.hpp"

#include <fmt/format.h>

#include "logger.hpp"
#include "protocol_guard.hpp"
#include "wlink/bridge/failure_reporter.hpp"
#include "wlink/bridge/runtime_context.hpp"
#include "wlink/config/task_configuration.hpp"
#include "wlink/io/frame_channel.hpp"
#include "wlink/io/sender.hpp"
#include "wlink/types/signal.hpp"

namespace wlink {

BroadcastDistributor::BroadcastDistributor(FrameChannel& channel, Sender& sender, const FailureReporter& reporter) :
    channel_(channel), sender_(sender), reporter_(reporter) {}

void BroadcastDistributor::await_buffer_request() {
    const int32_t sig = channel_.read_signal();
    if (sig == signal::ERROR) {
        reporter_.worker_failed();
    }
    if (sig != signal::BUFFER_REQUEST) {
        reporter_.protocol_violation(
            fmt::format("Expected a buffer request during broadcast distribution, got {}", signal::to_string(sig)));
    }
}

void BroadcastDistributor::distribute(const TaskConfiguration& config, RuntimeContext& context) {
    distribute(config.broadcast_variable_names(), context);
}

void BroadcastDistributor::distribute(const std::vector<std::string>& names, RuntimeContext& context) {
    run_protocol_phase(reporter_, [&]() {
        await_buffer_request();
        uint32_t size = call_collaborator(
            reporter_, [&]() { return sender_.send_record(static_cast<int32_t>(names.size())); });
        channel_.send_write_notification(size, false);

        for (const std::string& name : names) {
            std::unique_ptr<RecordIterator> elements = context.broadcast_variable(name);

            await_buffer_request();
            size = call_collaborator(reporter_, [&]() { return sender_.send_record(name); });
            channel_.send_write_notification(size, false);

            size_t chunks = 0;
            bool has_next = true;
            while (has_next) {
                await_buffer_request();
                size = call_collaborator(reporter_, [&]() { return sender_.send_buffer(*elements, 0); });
                has_next = elements->has_next() || sender_.has_remaining(0);
                channel_.send_write_notification(size, has_next);
                chunks++;
            }
            sender_.reset();
            WLINK_DEBUG("Broadcast variable '{}' sent in {} chunk(s)", name, chunks);
        }
    });
}

}  // namespace wlink
