// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/io/stream_socket.hpp"

#include <fmt/format.h>

#include "assert.hpp"
#include "logger.hpp"
#include "wlink/utils/exceptions.hpp"

namespace wlink {

namespace {

// Drives the single pending operation on `io`. Returns false if it had to be
// cancelled because it did not complete within `timeout`.
template <typename CancelFn>
bool run_pending(asio::io_context &io, std::chrono::milliseconds timeout, const bool &done, CancelFn cancel) {
    io.restart();
    if (timeout.count() == 0) {
        io.run();
        return true;
    }
    io.run_for(timeout);
    if (done) {
        return true;
    }
    cancel();
    io.restart();
    io.run();
    return false;
}

}  // namespace

StreamConnection::StreamConnection(std::shared_ptr<asio::io_context> io, tcp::socket socket) :
    io_(std::move(io)), socket_(std::move(socket)) {}

StreamConnection::~StreamConnection() { close(); }

std::unique_ptr<StreamConnection> StreamConnection::connect(uint16_t port) {
    auto io = std::make_shared<asio::io_context>();
    tcp::socket socket(*io);
    error_code error;
    socket.connect(loopback_endpoint(port), error);
    if (error) {
        WLINK_THROW("Failed to connect to 127.0.0.1:{}: {}", port, error.message());
    }
    socket.set_option(tcp::no_delay(true), error);
    if (error) {
        WLINK_WARN("Failed to disable Nagle on connection to port {}: {}", port, error.message());
    }
    return std::make_unique<StreamConnection>(std::move(io), std::move(socket));
}

void StreamConnection::read_exact(void *data, size_t size) {
    if (size == 0) {
        return;
    }
    WLINK_ASSERT(socket_.is_open(), "Read on a closed connection");

    error_code error;
    size_t transferred = 0;
    bool done = false;
    asio::async_read(socket_, asio::buffer(data, size), [&](const error_code &ec, size_t n) {
        error = ec;
        transferred = n;
        done = true;
    });

    bool in_time = run_pending(*io_, read_timeout_, done, [this]() {
        error_code ignored;
        socket_.cancel(ignored);
    });

    if (!in_time && error == asio::error::operation_aborted) {
        throw SocketTimeoutError(fmt::format(
            "Read timed out after {} ms ({} of {} bytes received)", read_timeout_.count(), transferred, size));
    }
    if (is_connection_closed(error)) {
        throw ConnectionClosedError(
            fmt::format("Connection closed by peer ({} of {} bytes received)", transferred, size));
    }
    if (error) {
        WLINK_THROW("Failed to read from connection: {}", error.message());
    }
}

void StreamConnection::write_all(const void *data, size_t size) {
    WLINK_ASSERT(socket_.is_open(), "Write on a closed connection");

    error_code error;
    asio::write(socket_, asio::buffer(data, size), error);
    if (is_connection_closed(error)) {
        throw ConnectionClosedError(fmt::format("Connection closed by peer while writing {} bytes", size));
    }
    if (error) {
        WLINK_THROW("Failed to write to connection: {}", error.message());
    }
}

void StreamConnection::close() {
    if (!socket_.is_open()) {
        return;
    }
    error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

ListeningSocket::ListeningSocket(uint16_t port) : io_(std::make_shared<asio::io_context>()), acceptor_(*io_) {
    const tcp::endpoint endpoint = loopback_endpoint(port);
    error_code error;
    acceptor_.open(endpoint.protocol(), error);
    if (!error) {
        acceptor_.bind(endpoint, error);
    }
    if (!error) {
        acceptor_.listen(1, error);
    }
    if (error) {
        WLINK_THROW("Failed to listen on 127.0.0.1:{}: {}", port, error.message());
    }
    port_ = acceptor_.local_endpoint().port();
    WLINK_DEBUG("Listening on 127.0.0.1:{}", port_);
}

ListeningSocket::~ListeningSocket() { close(); }

std::unique_ptr<StreamConnection> ListeningSocket::accept(std::chrono::milliseconds timeout) {
    WLINK_ASSERT(acceptor_.is_open(), "Accept on a closed listening socket");

    tcp::socket socket(*io_);
    error_code error;
    bool done = false;
    acceptor_.async_accept(socket, [&](const error_code &ec) {
        error = ec;
        done = true;
    });

    bool in_time = run_pending(*io_, timeout, done, [this]() {
        error_code ignored;
        acceptor_.cancel(ignored);
    });

    if (!in_time && error == asio::error::operation_aborted) {
        throw SocketTimeoutError(fmt::format("No connection on port {} within {} ms", port_, timeout.count()));
    }
    if (error) {
        WLINK_THROW("Failed to accept connection on port {}: {}", port_, error.message());
    }

    error_code ignored;
    socket.set_option(tcp::no_delay(true), ignored);
    WLINK_DEBUG("Accepted connection on port {}", port_);
    return std::make_unique<StreamConnection>(io_, std::move(socket));
}

void ListeningSocket::close() {
    if (!acceptor_.is_open()) {
        return;
    }
    error_code ignored;
    acceptor_.close(ignored);
}

}  // namespace wlink
