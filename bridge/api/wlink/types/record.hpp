// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wlink {

// Records are opaque to the bridge; only their encoded length matters.
using Record = std::vector<uint8_t>;

inline Record to_record(const std::string& str) { return Record(str.begin(), str.end()); }

inline std::string to_string(const Record& record) { return std::string(record.begin(), record.end()); }

/**
 * Source of records streamed to the worker. Iteration is single pass.
 */
class RecordIterator {
public:
    virtual ~RecordIterator() = default;

    virtual bool has_next() = 0;

    virtual Record next() = 0;
};

/**
 * Sink for records produced by the worker.
 */
class Collector {
public:
    virtual ~Collector() = default;

    virtual void collect(Record record) = 0;
};

class VectorRecordIterator : public RecordIterator {
public:
    explicit VectorRecordIterator(std::vector<Record> records) : records_(std::move(records)) {}

    bool has_next() override { return position_ < records_.size(); }

    Record next() override { return records_.at(position_++); }

    size_t position() const { return position_; }

private:
    std::vector<Record> records_;
    size_t position_ = 0;
};

class VectorCollector : public Collector {
public:
    void collect(Record record) override { records_.push_back(std::move(record)); }

    const std::vector<Record>& records() const { return records_; }

private:
    std::vector<Record> records_;
};

}  // namespace wlink
