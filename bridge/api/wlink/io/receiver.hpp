// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>

#include "wlink/types/record.hpp"

namespace wlink {

/**
 * Decodes result buffers the worker wrote to the output scratch file.
 */
class Receiver {
public:
    virtual ~Receiver() = default;

    virtual void open(const std::filesystem::path& path) = 0;
    virtual void close() = 0;

    // `size` is the value the worker sent in place of a signal.
    virtual void collect_buffer(Collector& collector, int32_t size) = 0;
};

}  // namespace wlink
