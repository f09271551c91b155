// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace wlink {

// Positional read that handles partial reads. Returns the bytes read, short only at end of file, or -1.
inline ssize_t safe_pread(int fd, void* buf, size_t count, off_t offset) {
    size_t total_read = 0;
    uint8_t* buffer = static_cast<uint8_t*>(buf);

    while (total_read < count) {
        ssize_t bytes_read = pread(fd, buffer + total_read, count - total_read, offset + total_read);
        if (bytes_read == 0) {
            return total_read;
        } else if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        total_read += bytes_read;
    }
    return total_read;
}

// Positional write that handles partial writes. Returns the bytes written or -1.
inline ssize_t safe_pwrite(int fd, const void* buf, size_t count, off_t offset) {
    size_t total_written = 0;
    const uint8_t* buffer = static_cast<const uint8_t*>(buf);

    while (total_written < count) {
        ssize_t bytes_written = pwrite(fd, buffer + total_written, count - total_written, offset + total_written);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        total_written += bytes_written;
    }
    return total_written;
}

}  // namespace wlink
