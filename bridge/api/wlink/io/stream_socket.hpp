// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "wlink_asio.hpp"

namespace wlink {

/**
 * One connected TCP stream on the loopback interface. Reads block until the
 * requested byte count arrived, the read timeout expired (SocketTimeoutError)
 * or the peer closed the stream (ConnectionClosedError).
 */
class StreamConnection {
public:
    StreamConnection(std::shared_ptr<asio::io_context> io, tcp::socket socket);
    ~StreamConnection();

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

    // Client side, used by workers and tests.
    static std::unique_ptr<StreamConnection> connect(uint16_t port);

    void set_read_timeout(std::chrono::milliseconds timeout) { read_timeout_ = timeout; }
    std::chrono::milliseconds get_read_timeout() const { return read_timeout_; }

    void read_exact(void* data, size_t size);
    void write_all(const void* data, size_t size);

    void close();
    bool is_open() const { return socket_.is_open(); }

private:
    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    std::chrono::milliseconds read_timeout_{0};
};

/**
 * Listening endpoint bound to 127.0.0.1.
 */
class ListeningSocket {
public:
    // Port 0 binds an ephemeral port, see local_port().
    explicit ListeningSocket(uint16_t port = 0);
    ~ListeningSocket();

    ListeningSocket(const ListeningSocket&) = delete;
    ListeningSocket& operator=(const ListeningSocket&) = delete;

    uint16_t local_port() const { return port_; }

    // Zero timeout blocks until a peer connects.
    std::unique_ptr<StreamConnection> accept(std::chrono::milliseconds timeout);

    void close();

private:
    std::shared_ptr<asio::io_context> io_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
};

}  // namespace wlink
