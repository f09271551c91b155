// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "wlink/io/receiver.hpp"

namespace wlink {

/**
 * Receiver reading `size` bytes of length-prefixed records from offset 0 of the
 * output scratch file.
 */
class ScratchFileReceiver : public Receiver {
public:
    ScratchFileReceiver() = default;
    ~ScratchFileReceiver() override;

    void open(const std::filesystem::path& path) override;
    void close() override;

    void collect_buffer(Collector& collector, int32_t size) override;

private:
    int fd_ = -1;
    std::filesystem::path path_;
    std::vector<uint8_t> buffer_;
};

}  // namespace wlink
