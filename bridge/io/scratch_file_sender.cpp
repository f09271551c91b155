// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include "wlink/io/scratch_file_sender.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "assert.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "wlink/io/record_framing.hpp"

namespace wlink {

ScratchFileSender::ScratchFileSender(uint32_t capacity) : capacity_(capacity) {
    WLINK_ASSERT(capacity_ > framing::LENGTH_PREFIX_SIZE, "Scratch capacity {} is too small", capacity_);
    buffer_.reserve(capacity_);
}

ScratchFileSender::~ScratchFileSender() { close(); }

void ScratchFileSender::open(const std::filesystem::path &path) {
    close();
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        WLINK_THROW("Failed to open input scratch file {}: {}", path.string(), strerror(errno));
    }
    path_ = path;
    reset();
    WLINK_DEBUG("Opened input scratch file {}", path_.string());
}

void ScratchFileSender::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint32_t ScratchFileSender::send_record(int32_t value) {
    Record record(framing::LENGTH_PREFIX_SIZE);
    signal::put_int(record.data(), value);
    buffer_.clear();
    append(record);
    return flush();
}

uint32_t ScratchFileSender::send_record(const std::string &value) {
    buffer_.clear();
    append(to_record(value));
    return flush();
}

uint32_t ScratchFileSender::send_buffer(RecordIterator &iterator, int slot) {
    WLINK_ASSERT(slot >= 0 && slot < NUM_SLOTS, "Invalid input slot {}", slot);

    buffer_.clear();
    if (remainder_[slot]) {
        append(*remainder_[slot]);
        remainder_[slot].reset();
    }
    while (iterator.has_next()) {
        Record record = iterator.next();
        if (!buffer_.empty() && buffer_.size() + framing::encoded_size(record) > capacity_) {
            remainder_[slot] = std::move(record);
            break;
        }
        // Throws if the record alone exceeds the capacity.
        append(record);
    }
    return flush();
}

bool ScratchFileSender::has_remaining(int slot) const {
    WLINK_ASSERT(slot >= 0 && slot < NUM_SLOTS, "Invalid input slot {}", slot);
    return remainder_[slot].has_value();
}

void ScratchFileSender::reset() {
    for (auto &remainder : remainder_) {
        remainder.reset();
    }
}

void ScratchFileSender::append(const Record &record) {
    if (buffer_.size() + framing::encoded_size(record) > capacity_) {
        WLINK_THROW(
            "Record of {} bytes does not fit into the {} byte scratch buffer {}",
            record.size(),
            capacity_,
            path_.string());
    }
    framing::append_record(buffer_, record);
}

uint32_t ScratchFileSender::flush() {
    WLINK_ASSERT(fd_ != -1, "Input scratch file is not open");
    ssize_t bytes_written = safe_pwrite(fd_, buffer_.data(), buffer_.size(), 0);
    if (bytes_written < 0) {
        WLINK_THROW("Failed to write input scratch file {}: {}", path_.string(), strerror(errno));
    }
    return static_cast<uint32_t>(buffer_.size());
}

}  // namespace wlink
