// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "wlink/types/record.hpp"

namespace wlink {

/**
 * Encodes records into the input scratch file read by the worker.
 * Every send_* call replaces the previous buffer and returns its byte length.
 */
class Sender {
public:
    virtual ~Sender() = default;

    virtual void open(const std::filesystem::path& path) = 0;
    virtual void close() = 0;

    virtual uint32_t send_record(int32_t value) = 0;
    virtual uint32_t send_record(const std::string& value) = 0;

    // Encodes as many records of `iterator` as fit, starting with the slot's remainder.
    virtual uint32_t send_buffer(RecordIterator& iterator, int slot) = 0;

    // True if a record was taken from the slot's iterator but not yet sent.
    virtual bool has_remaining(int slot) const = 0;

    // Drops all remainders.
    virtual void reset() = 0;
};

}  // namespace wlink
