// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <vector>

#include "wlink/io/sender.hpp"

namespace wlink {

/**
 * Sender writing length-prefixed records (u32 big endian length, then the bytes)
 * from offset 0 of a scratch file, at most `capacity` bytes per buffer.
 */
class ScratchFileSender : public Sender {
public:
    static constexpr uint32_t DEFAULT_CAPACITY = 1024 * 1024;
    static constexpr int NUM_SLOTS = 2;

    explicit ScratchFileSender(uint32_t capacity = DEFAULT_CAPACITY);
    ~ScratchFileSender() override;

    void open(const std::filesystem::path& path) override;
    void close() override;

    uint32_t send_record(int32_t value) override;
    uint32_t send_record(const std::string& value) override;
    uint32_t send_buffer(RecordIterator& iterator, int slot) override;

    bool has_remaining(int slot) const override;
    void reset() override;

    const std::filesystem::path& path() const { return path_; }

private:
    void append(const Record& record);
    uint32_t flush();

    int fd_ = -1;
    std::filesystem::path path_;
    uint32_t capacity_;
    std::vector<uint8_t> buffer_;
    std::array<std::optional<Record>, NUM_SLOTS> remainder_;
};

}  // namespace wlink
