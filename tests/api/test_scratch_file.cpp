// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "test_utils/temp_directory.hpp"
#include "test_utils/worker_side_channel.hpp"
#include "wlink/io/scratch_file_receiver.hpp"
#include "wlink/io/scratch_file_sender.hpp"
#include "wlink/utils/exceptions.hpp"

using namespace wlink;
using namespace wlink::test_utils;

namespace {

std::vector<Record> make_records(const std::vector<std::string>& values) {
    std::vector<Record> records;
    for (const auto& value : values) {
        records.push_back(to_record(value));
    }
    return records;
}

}  // namespace

class ScratchFileTest : public ::testing::Test {
protected:
    TempDirectory dir;
    std::filesystem::path input_path() const { return dir.path() / "0input"; }
    std::filesystem::path output_path() const { return dir.path() / "0output"; }
};

TEST_F(ScratchFileTest, SingleBufferHoldsAllRecords) {
    ScratchFileSender sender;
    sender.open(input_path());

    VectorRecordIterator source(make_records({"one", "two", "three"}));
    const uint32_t size = sender.send_buffer(source, 0);

    EXPECT_EQ(size, uint32_t{3 * 4 + 3 + 3 + 5});
    EXPECT_FALSE(source.has_next());
    EXPECT_FALSE(sender.has_remaining(0));
    EXPECT_EQ(read_scratch_records(input_path(), size), make_records({"one", "two", "three"}));
}

TEST_F(ScratchFileTest, OverflowCarriesIntoNextBuffer) {
    // Room for two 8-byte records per buffer.
    ScratchFileSender sender(16);
    sender.open(input_path());

    VectorRecordIterator source(make_records({"aaaa", "bbbb", "cccc"}));

    uint32_t size = sender.send_buffer(source, 0);
    EXPECT_EQ(size, 16u);
    EXPECT_EQ(read_scratch_records(input_path(), size), make_records({"aaaa", "bbbb"}));
    EXPECT_FALSE(source.has_next());
    EXPECT_TRUE(sender.has_remaining(0));

    size = sender.send_buffer(source, 0);
    EXPECT_EQ(size, 8u);
    EXPECT_EQ(read_scratch_records(input_path(), size), make_records({"cccc"}));
    EXPECT_FALSE(sender.has_remaining(0));
}

TEST_F(ScratchFileTest, SlotsKeepSeparateRemainders) {
    ScratchFileSender sender(8);
    sender.open(input_path());

    VectorRecordIterator left(make_records({"L1", "L2"}));
    VectorRecordIterator right(make_records({"R1", "R2"}));

    EXPECT_EQ(read_scratch_records(input_path(), sender.send_buffer(left, 0)), make_records({"L1"}));
    EXPECT_EQ(read_scratch_records(input_path(), sender.send_buffer(right, 1)), make_records({"R1"}));
    EXPECT_TRUE(sender.has_remaining(0));
    EXPECT_TRUE(sender.has_remaining(1));

    EXPECT_EQ(read_scratch_records(input_path(), sender.send_buffer(left, 0)), make_records({"L2"}));
    EXPECT_EQ(read_scratch_records(input_path(), sender.send_buffer(right, 1)), make_records({"R2"}));

    sender.reset();
    EXPECT_FALSE(sender.has_remaining(0));
    EXPECT_FALSE(sender.has_remaining(1));
}

TEST_F(ScratchFileTest, OversizedRecordIsRejected) {
    ScratchFileSender sender(8);
    sender.open(input_path());

    VectorRecordIterator source(make_records({std::string(16, 'x')}));
    EXPECT_THROW(sender.send_buffer(source, 0), std::runtime_error);
}

TEST_F(ScratchFileTest, EmptySourceProducesEmptyBuffer) {
    ScratchFileSender sender;
    sender.open(input_path());

    VectorRecordIterator source(std::vector<Record>{});
    EXPECT_EQ(sender.send_buffer(source, 0), 0u);
}

TEST_F(ScratchFileTest, SingleValueRecords) {
    ScratchFileSender sender;
    sender.open(input_path());

    uint32_t size = sender.send_record(int32_t{3});
    auto records = read_scratch_records(input_path(), size);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(signal::get_int(records[0].data()), 3);

    size = sender.send_record(std::string("lookup"));
    EXPECT_EQ(read_scratch_records(input_path(), size), make_records({"lookup"}));
}

TEST_F(ScratchFileTest, ReceiverCollectsResultBuffer) {
    ScratchFileReceiver receiver;
    receiver.open(output_path());

    const uint32_t size = write_scratch_records(output_path(), make_records({"r1", "", "r3"}));

    VectorCollector sink;
    receiver.collect_buffer(sink, size);
    EXPECT_EQ(sink.records(), make_records({"r1", "", "r3"}));
}

TEST_F(ScratchFileTest, ReceiverRejectsTruncatedBuffer) {
    ScratchFileReceiver receiver;
    receiver.open(output_path());

    const uint32_t size = write_scratch_records(output_path(), make_records({"abc"}));

    VectorCollector sink;
    EXPECT_THROW(receiver.collect_buffer(sink, size + 10), ProtocolViolationError);
    EXPECT_THROW(receiver.collect_buffer(sink, -5), ProtocolViolationError);
    EXPECT_TRUE(sink.records().empty());
}

TEST_F(ScratchFileTest, ReceiverRejectsMalformedBuffer) {
    ScratchFileReceiver receiver;
    receiver.open(output_path());

    {
        std::ofstream file(output_path(), std::ios::binary);
        const char bytes[] = {0, 0, 0, 40, 'x', 'y'};
        file.write(bytes, sizeof(bytes));
    }

    VectorCollector sink;
    EXPECT_THROW(receiver.collect_buffer(sink, 6), ProtocolViolationError);
}
