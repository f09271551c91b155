// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wlink::signal {

// Control values read from the worker. They share one 32-bit slot with result
// sizes: any value not reserved for the current streaming mode is a result size.
inline constexpr int32_t BUFFER_REQUEST = 0;
inline constexpr int32_t FINISHED = -1;
inline constexpr int32_t ERROR = -2;
inline constexpr int32_t BUFFER_REQUEST_G0 = -3;
inline constexpr int32_t BUFFER_REQUEST_G1 = -4;

// Flag byte closing a write notification.
inline constexpr uint8_t FLAG_MORE = 0;
inline constexpr uint8_t FLAG_LAST = 32;

inline constexpr size_t SIGNAL_SIZE = 4;
inline constexpr size_t WRITE_NOTIFICATION_SIZE = 5;

inline int32_t get_int(const uint8_t* bytes) {
    return static_cast<int32_t>(
        (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
        (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]));
}

inline void put_int(uint8_t* bytes, int32_t value) {
    const uint32_t v = static_cast<uint32_t>(value);
    bytes[0] = static_cast<uint8_t>(v >> 24);
    bytes[1] = static_cast<uint8_t>(v >> 16);
    bytes[2] = static_cast<uint8_t>(v >> 8);
    bytes[3] = static_cast<uint8_t>(v);
}

inline std::string to_string(int32_t value) {
    switch (value) {
        case BUFFER_REQUEST:
            return "BUFFER_REQUEST";
        case FINISHED:
            return "FINISHED";
        case ERROR:
            return "ERROR";
        case BUFFER_REQUEST_G0:
            return "BUFFER_REQUEST_G0";
        case BUFFER_REQUEST_G1:
            return "BUFFER_REQUEST_G1";
        default:
            return "RESULT(" + std::to_string(value) + ")";
    }
}

}  // namespace wlink::signal
