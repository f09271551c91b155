// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/io/frame_channel.hpp"

#include <array>

#include "logger.hpp"
#include "wlink/io/stream_socket.hpp"
#include "wlink/types/signal.hpp"

namespace wlink {

FrameChannel::FrameChannel(StreamConnection& connection) : connection_(connection) {}

int32_t FrameChannel::read_signal() {
    std::array<uint8_t, signal::SIGNAL_SIZE> buffer{};
    connection_.read_exact(buffer.data(), buffer.size());
    const int32_t value = signal::get_int(buffer.data());
    WLINK_TRACE("Received {}", signal::to_string(value));
    return value;
}

void FrameChannel::send_write_notification(uint32_t size, bool has_next) {
    std::array<uint8_t, signal::WRITE_NOTIFICATION_SIZE> buffer{};
    signal::put_int(buffer.data(), static_cast<int32_t>(size));
    buffer[4] = has_next ? signal::FLAG_MORE : signal::FLAG_LAST;
    WLINK_TRACE("Sending write notification: {} bytes, {}", size, has_next ? "more" : "last");
    connection_.write_all(buffer.data(), buffer.size());
}

void FrameChannel::send_read_confirmation() {
    const uint8_t confirmation = 0;
    connection_.write_all(&confirmation, 1);
}

}  // namespace wlink
