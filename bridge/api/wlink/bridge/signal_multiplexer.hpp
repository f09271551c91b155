// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "wlink/types/record.hpp"

namespace wlink {

class FailureReporter;
class FrameChannel;
class Receiver;
class Sender;

/**
 * Steady-state request/response loop. The worker drives the exchange: it asks for
 * input buffers, hands back result buffers, and ends the loop with FINISHED.
 */
class SignalMultiplexer {
public:
    SignalMultiplexer(FrameChannel& channel, Sender& sender, Receiver& receiver, const FailureReporter& reporter);

    /**
     * Streams every record of `source` to the worker and collects the results into
     * `sink`. Returns without any exchange if `source` is empty.
     */
    void stream_without_groups(RecordIterator& source, Collector& sink);

    /**
     * Two-input variant: slot 0 is fed from `source0`, slot 1 from `source1`. A request
     * for an exhausted slot is ignored. Returns without any exchange if both are empty.
     */
    void stream_with_groups(RecordIterator& source0, RecordIterator& source1, Collector& sink);

private:
    // Encodes the next buffer of `slot` and announces it.
    void send_next_buffer(RecordIterator& source, int slot);
    void collect_result(int32_t size, Collector& sink);

    FrameChannel& channel_;
    Sender& sender_;
    Receiver& receiver_;
    const FailureReporter& reporter_;
};

}  // namespace wlink
