// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace wlink {

class StreamConnection;

/**
 * Bridge side of the control frames exchanged with the worker. Exactly one frame
 * is in flight per direction; every call blocks until its bytes are transferred.
 */
class FrameChannel {
public:
    explicit FrameChannel(StreamConnection& connection);

    // 4-byte big endian signal or result size.
    int32_t read_signal();

    // 4-byte big endian payload size followed by FLAG_MORE or FLAG_LAST.
    void send_write_notification(uint32_t size, bool has_next);

    // A single zero byte acknowledging a consumed result buffer.
    void send_read_confirmation();

private:
    StreamConnection& connection_;
};

}  // namespace wlink
