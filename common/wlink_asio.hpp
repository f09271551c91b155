/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <utility>

#ifdef WLINK_USE_BOOST
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace wlink {
namespace asio = boost::asio;
using error_code = boost::system::error_code;
}  // namespace wlink

#else
#include <asio.hpp>

namespace wlink {
namespace asio = ::asio;
using error_code = std::error_code;
}  // namespace wlink

#endif

namespace wlink {

using tcp = asio::ip::tcp;

// Worker connections only ever use the loopback interface.
inline tcp::endpoint loopback_endpoint(uint16_t port) { return tcp::endpoint(asio::ip::address_v4::loopback(), port); }

// Errors meaning the peer went away rather than the local side failing.
inline bool is_connection_closed(const error_code& error) {
    return error == asio::error::eof || error == asio::error::connection_reset || error == asio::error::broken_pipe ||
           error == asio::error::connection_aborted;
}

}  // namespace wlink
