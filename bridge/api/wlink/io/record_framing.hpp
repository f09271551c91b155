// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "wlink/types/record.hpp"
#include "wlink/types/signal.hpp"

namespace wlink::framing {

inline constexpr size_t LENGTH_PREFIX_SIZE = 4;

inline size_t encoded_size(const Record& record) { return LENGTH_PREFIX_SIZE + record.size(); }

inline void append_record(std::vector<uint8_t>& out, const Record& record) {
    const size_t offset = out.size();
    out.resize(offset + encoded_size(record));
    signal::put_int(out.data() + offset, static_cast<int32_t>(record.size()));
    std::copy(record.begin(), record.end(), out.begin() + offset + LENGTH_PREFIX_SIZE);
}

// Splits a buffer of length-prefixed records. std::nullopt if the buffer is malformed.
inline std::optional<std::vector<Record>> split_records(const uint8_t* data, size_t size) {
    std::vector<Record> records;
    size_t position = 0;
    while (position < size) {
        if (size - position < LENGTH_PREFIX_SIZE) {
            return std::nullopt;
        }
        const int32_t length = signal::get_int(data + position);
        position += LENGTH_PREFIX_SIZE;
        if (length < 0 || static_cast<size_t>(length) > size - position) {
            return std::nullopt;
        }
        records.emplace_back(data + position, data + position + length);
        position += length;
    }
    return records;
}

}  // namespace wlink::framing
