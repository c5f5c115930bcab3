//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/record.hpp>
//
#include <segstore/record.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segstore/block_record.hpp>
#include <segstore/memory_segment_store.hpp>

#include <batteries/stream_util.hpp>

#include <array>
#include <limits>
#include <numeric>
#include <sstream>
#include <vector>

namespace {

using namespace segstore::int_types;

// A record laid out as: u16 flags, two record ids, then a u32 payload.
//
class TwoChildRecord : public segstore::Record
{
 public:
  explicit TwoChildRecord(const segstore::RecordId& id) noexcept : Record{id}
  {
  }

  i32 first_child_offset() const
  {
    return this->get_offset(2, 0);
  }

  i32 second_child_offset() const
  {
    return this->get_offset(2, 1);
  }

  i32 payload_offset() const
  {
    return this->get_offset(2, 2);
  }
};

class RecordTest : public ::testing::Test
{
 public:
  segstore::MemorySegmentStore store;

  const segstore::SegmentId* seg = this->store.tracker().get_segment_id(i64{7}, i64{9});
};

TEST_F(RecordTest, RecordIdAndOffsets)
{
  const TwoChildRecord record{segstore::RecordId{this->seg, 64}};

  EXPECT_EQ(record.record_id(), (segstore::RecordId{this->seg, 64}));
  EXPECT_EQ(&record.segment_id(), this->seg);

  EXPECT_EQ(record.get_offset(), 64);
  EXPECT_EQ(record.get_offset(0), 64);
  EXPECT_EQ(record.get_offset(5), 69);
  EXPECT_EQ(record.get_offset(10, 2), 64 + 10 + 2 * segstore::kRecordIdBytes);
  EXPECT_EQ(record.get_offset(0, 0), 64);

  EXPECT_EQ(record.first_child_offset(), 66);
  EXPECT_EQ(record.second_child_offset(), 66 + segstore::kRecordIdBytes);
  EXPECT_EQ(record.payload_offset(), 66 + 2 * segstore::kRecordIdBytes);
}

TEST_F(RecordTest, OffsetsAreNotBoundsChecked)
{
  const TwoChildRecord record{segstore::RecordId{this->seg, segstore::kMaxSegmentSize - 4}};

  EXPECT_EQ(record.get_offset(100, 100), segstore::kMaxSegmentSize - 4 + 100 +
                                              100 * segstore::kRecordIdBytes);
}

TEST_F(RecordTest, HashIsSegmentHashXorOffset)
{
  const TwoChildRecord record{segstore::RecordId{this->seg, 40}};

  EXPECT_EQ(segstore::hash_value(record),
            segstore::hash_value(*this->seg) ^ static_cast<usize>(40));

  const TwoChildRecord same_address{segstore::RecordId{this->seg, 40}};

  EXPECT_EQ(segstore::Record::Hash{}(record), segstore::Record::Hash{}(same_address));
}

TEST_F(RecordTest, PrintsRecordId)
{
  const TwoChildRecord record{segstore::RecordId{this->seg, 40}};

  std::ostringstream oss;
  oss << record;

  EXPECT_EQ(oss.str(), segstore::to_string(record.record_id()));
  EXPECT_EQ(oss.str(), "00000000-0000-0007-0000-000000000009:40");
}

TEST_F(RecordTest, GetSegment)
{
  const TwoChildRecord missing{segstore::RecordId{this->seg, 0}};

  EXPECT_EQ(missing.get_segment(this->store).status(),
            segstore::make_status(segstore::StatusCode::kSegmentNotFound));

  auto segment = this->store.add_segment(this->seg->uuid(), std::vector<u8>(128, 0));
  ASSERT_TRUE(segment.ok()) << BATT_INSPECT(segment.status());

  auto resolved = missing.get_segment(this->store);
  ASSERT_TRUE(resolved.ok()) << BATT_INSPECT(resolved.status());

  EXPECT_EQ(resolved->get(), segment->get());
  EXPECT_EQ(&(*resolved)->segment_id(), this->seg);

  EXPECT_TRUE((*resolved)->contains_offset(0));
  EXPECT_TRUE((*resolved)->contains_offset(127));
  EXPECT_FALSE((*resolved)->contains_offset(128));
  EXPECT_FALSE((*resolved)->contains_offset(-1));
}

TEST_F(RecordTest, BlockRecordRead)
{
  std::vector<u8> bytes(256);
  std::iota(bytes.begin(), bytes.end(), u8{0});

  auto segment = this->store.add_segment(std::move(bytes));
  ASSERT_TRUE(segment.ok()) << BATT_INSPECT(segment.status());

  const segstore::BlockRecord block{segstore::RecordId{&(*segment)->segment_id(), 100}, 32};

  EXPECT_EQ(block.size(), 32);

  std::array<u8, 8> dst;
  ASSERT_TRUE(block.read(this->store, 4, segstore::MutableBuffer{dst.data(), dst.size()}).ok());
  EXPECT_THAT(dst, ::testing::ElementsAre(104, 105, 106, 107, 108, 109, 110, 111));

  // Reading past the end of the block.
  //
  EXPECT_EQ(block.read(this->store, 28, segstore::MutableBuffer{dst.data(), dst.size()}),
            batt::Status{batt::StatusCode::kOutOfRange});

  EXPECT_EQ(block.read(this->store, -1, segstore::MutableBuffer{dst.data(), 1}),
            batt::Status{batt::StatusCode::kOutOfRange});

  // A block that claims to extend past the end of its segment.
  //
  const segstore::BlockRecord overhanging{segstore::RecordId{&(*segment)->segment_id(), 240}, 32};

  EXPECT_EQ(overhanging.read(this->store, 10, segstore::MutableBuffer{dst.data(), dst.size()}),
            batt::Status{batt::StatusCode::kOutOfRange});
}

TEST_F(RecordTest, BlockRecordAtEndOfLargestSegment)
{
  std::vector<u8> bytes(segstore::kMaxSegmentSize);
  std::iota(bytes.begin(), bytes.end(), u8{0});

  auto segment = this->store.add_segment(std::move(bytes));
  ASSERT_TRUE(segment.ok()) << BATT_INSPECT(segment.status());

  const segstore::BlockRecord block{
      segstore::RecordId{&(*segment)->segment_id(), segstore::kMaxSegmentSize - 8}, 8};

  std::array<u8, 8> dst;
  ASSERT_TRUE(block.read(this->store, 0, segstore::MutableBuffer{dst.data(), dst.size()}).ok());
  EXPECT_THAT(dst, ::testing::ElementsAre(0xf8, 0xf9, 0xfa, 0xfb, 0xfc, 0xfd, 0xfe, 0xff));
}

TEST_F(RecordTest, BlockRecordLargerThanSegmentDeath)
{
  EXPECT_DEATH(segstore::BlockRecord(segstore::RecordId{this->seg, 100},
                                     std::numeric_limits<i32>::max()),
               "BlockRecord does not fit in a segment");

  EXPECT_DEATH(segstore::BlockRecord(segstore::RecordId{this->seg, segstore::kMaxSegmentSize - 8},
                                     9),
               "BlockRecord does not fit in a segment");
}

}  // namespace
