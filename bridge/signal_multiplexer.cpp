// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/bridge/signal_multiplexer.hpp"

#include "logger.hpp"
#include "protocol_guard.hpp"
#include "wlink/bridge/failure_reporter.hpp"
#include "wlink/io/frame_channel.hpp"
#include "wlink/io/receiver.hpp"
#include "wlink/io/sender.hpp"
#include "wlink/types/signal.hpp"

namespace wlink {

SignalMultiplexer::SignalMultiplexer(
    FrameChannel& channel, Sender& sender, Receiver& receiver, const FailureReporter& reporter) :
    channel_(channel), sender_(sender), receiver_(receiver), reporter_(reporter) {}

void SignalMultiplexer::send_next_buffer(RecordIterator& source, int slot) {
    const uint32_t size = call_collaborator(reporter_, [&]() { return sender_.send_buffer(source, slot); });
    channel_.send_write_notification(size, sender_.has_remaining(slot) || source.has_next());
}

void SignalMultiplexer::collect_result(int32_t size, Collector& sink) {
    call_collaborator(reporter_, [&]() { receiver_.collect_buffer(sink, size); });
    channel_.send_read_confirmation();
}

void SignalMultiplexer::stream_without_groups(RecordIterator& source, Collector& sink) {
    if (!source.has_next()) {
        WLINK_DEBUG("No input records for task {}, skipping worker exchange", reporter_.task_name());
        return;
    }

    run_protocol_phase(reporter_, [&]() {
        while (true) {
            const int32_t sig = channel_.read_signal();
            switch (sig) {
                case signal::BUFFER_REQUEST:
                    if (source.has_next() || sender_.has_remaining(0)) {
                        send_next_buffer(source, 0);
                    } else {
                        reporter_.protocol_violation("External process requested data even though none is available.");
                    }
                    break;
                case signal::FINISHED:
                    return;
                case signal::ERROR:
                    reporter_.worker_failed();
                    break;
                default:
                    collect_result(sig, sink);
                    break;
            }
        }
    });
}

void SignalMultiplexer::stream_with_groups(RecordIterator& source0, RecordIterator& source1, Collector& sink) {
    if (!source0.has_next() && !source1.has_next()) {
        WLINK_DEBUG("No input records for task {}, skipping worker exchange", reporter_.task_name());
        return;
    }

    run_protocol_phase(reporter_, [&]() {
        while (true) {
            const int32_t sig = channel_.read_signal();
            switch (sig) {
                case signal::BUFFER_REQUEST_G0:
                    if (source0.has_next() || sender_.has_remaining(0)) {
                        send_next_buffer(source0, 0);
                    }
                    break;
                case signal::BUFFER_REQUEST_G1:
                    if (source1.has_next() || sender_.has_remaining(1)) {
                        send_next_buffer(source1, 1);
                    }
                    break;
                case signal::FINISHED:
                    return;
                case signal::ERROR:
                    reporter_.worker_failed();
                    break;
                default:
                    collect_result(sig, sink);
                    break;
            }
        }
    });
}

}  // namespace wlink
