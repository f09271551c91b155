// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <memory>

#include "wlink/io/frame_channel.hpp"
#include "wlink/io/stream_socket.hpp"
#include "wlink/types/signal.hpp"
#include "wlink/utils/exceptions.hpp"

using namespace wlink;
using namespace std::chrono_literals;

TEST(StreamSocket, EphemeralPortIsAssigned) {
    ListeningSocket listener;
    EXPECT_NE(listener.local_port(), 0);
}

TEST(StreamSocket, ExchangeBytes) {
    ListeningSocket listener;
    auto client = StreamConnection::connect(listener.local_port());
    auto server = listener.accept(5000ms);
    server->set_read_timeout(5000ms);

    const std::array<uint8_t, 3> sent = {7, 8, 9};
    client->write_all(sent.data(), sent.size());

    std::array<uint8_t, 3> received{};
    server->read_exact(received.data(), received.size());
    EXPECT_EQ(received, sent);
}

TEST(StreamSocket, AcceptTimesOut) {
    ListeningSocket listener;
    EXPECT_THROW(listener.accept(100ms), SocketTimeoutError);
}

TEST(StreamSocket, ReadTimesOut) {
    ListeningSocket listener;
    auto client = StreamConnection::connect(listener.local_port());
    auto server = listener.accept(5000ms);
    server->set_read_timeout(100ms);

    uint8_t byte = 0;
    EXPECT_THROW(server->read_exact(&byte, 1), SocketTimeoutError);
}

TEST(StreamSocket, PeerCloseIsReported) {
    ListeningSocket listener;
    auto client = StreamConnection::connect(listener.local_port());
    auto server = listener.accept(5000ms);
    server->set_read_timeout(5000ms);

    const uint8_t partial = 1;
    client->write_all(&partial, 1);
    client->close();

    std::array<uint8_t, 4> frame{};
    EXPECT_THROW(server->read_exact(frame.data(), frame.size()), ConnectionClosedError);
}

TEST(FrameChannel, EncodesFrames) {
    ListeningSocket listener;
    auto worker = StreamConnection::connect(listener.local_port());
    worker->set_read_timeout(5000ms);
    auto bridge = listener.accept(5000ms);
    bridge->set_read_timeout(5000ms);
    FrameChannel channel(*bridge);

    std::array<uint8_t, 4> signal_bytes{};
    signal::put_int(signal_bytes.data(), signal::BUFFER_REQUEST_G0);
    worker->write_all(signal_bytes.data(), signal_bytes.size());
    EXPECT_EQ(channel.read_signal(), signal::BUFFER_REQUEST_G0);

    channel.send_write_notification(300, true);
    channel.send_write_notification(12, false);
    channel.send_read_confirmation();

    std::array<uint8_t, 11> received{};
    worker->read_exact(received.data(), received.size());
    const std::array<uint8_t, 11> expected = {0, 0, 1, 44, 0, 0, 0, 0, 12, 32, 0};
    EXPECT_EQ(received, expected);
}
