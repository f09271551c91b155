// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/io/scratch_file_receiver.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "assert.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "wlink/io/record_framing.hpp"
#include "wlink/utils/exceptions.hpp"

namespace wlink {

ScratchFileReceiver::~ScratchFileReceiver() { close(); }

void ScratchFileReceiver::open(const std::filesystem::path &path) {
    close();
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        WLINK_THROW("Failed to open output scratch file {}: {}", path.string(), strerror(errno));
    }
    path_ = path;
    WLINK_DEBUG("Opened output scratch file {}", path_.string());
}

void ScratchFileReceiver::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

void ScratchFileReceiver::collect_buffer(Collector &collector, int32_t size) {
    WLINK_ASSERT(fd_ != -1, "Output scratch file is not open");
    if (size < 0) {
        throw ProtocolViolationError(fmt::format("Worker announced a result buffer of invalid size {}", size));
    }

    buffer_.resize(size);
    ssize_t bytes_read = safe_pread(fd_, buffer_.data(), buffer_.size(), 0);
    if (bytes_read < 0) {
        WLINK_THROW("Failed to read output scratch file {}: {}", path_.string(), strerror(errno));
    }
    if (bytes_read != size) {
        throw ProtocolViolationError(fmt::format(
            "Result buffer truncated: worker announced {} bytes, {} holds {}", size, path_.string(), bytes_read));
    }

    auto records = framing::split_records(buffer_.data(), buffer_.size());
    if (!records) {
        throw ProtocolViolationError(fmt::format("Malformed result buffer of {} bytes in {}", size, path_.string()));
    }
    for (auto &record : *records) {
        collector.collect(std::move(record));
    }
}

}  // namespace wlink
