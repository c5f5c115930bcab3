//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/record_id.hpp>
//
#include <segstore/record_id.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segstore/segment_tracker.hpp>

#include <batteries/stream_util.hpp>

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace {

using namespace segstore::int_types;

class RecordIdTest : public ::testing::Test
{
 public:
  segstore::SegmentTracker tracker;

  const segstore::SegmentId* seg_a = this->tracker.get_segment_id(i64{1}, i64{1});
  const segstore::SegmentId* seg_b = this->tracker.get_segment_id(i64{1}, i64{2});
  const segstore::SegmentId* seg_c = this->tracker.get_segment_id(i64{-5}, i64{7});
};

TEST_F(RecordIdTest, EqualityIsAddressEquality)
{
  EXPECT_EQ((segstore::RecordId{this->seg_a, 16}), (segstore::RecordId{this->seg_a, 16}));
  EXPECT_NE((segstore::RecordId{this->seg_a, 16}), (segstore::RecordId{this->seg_a, 20}));
  EXPECT_NE((segstore::RecordId{this->seg_a, 16}), (segstore::RecordId{this->seg_b, 16}));

  // Re-interning the same uuid yields the same SegmentId, hence equal record ids.
  //
  EXPECT_EQ((segstore::RecordId{this->tracker.get_segment_id(i64{1}, i64{2}), 8}),
            (segstore::RecordId{this->seg_b, 8}));
}

TEST_F(RecordIdTest, Ordering)
{
  std::vector<segstore::RecordId> ids{
      segstore::RecordId{this->seg_b, 4},
      segstore::RecordId{this->seg_a, 100},
      segstore::RecordId{this->seg_c, 0},
      segstore::RecordId{this->seg_a, 4},
  };

  std::sort(ids.begin(), ids.end());

  EXPECT_THAT(ids, ::testing::ElementsAre(segstore::RecordId{this->seg_c, 0},
                                          segstore::RecordId{this->seg_a, 4},
                                          segstore::RecordId{this->seg_a, 100},
                                          segstore::RecordId{this->seg_b, 4}));

  EXPECT_LT((segstore::RecordId{this->seg_a, 4}), (segstore::RecordId{this->seg_a, 8}));
  EXPECT_GT((segstore::RecordId{this->seg_b, 0}), (segstore::RecordId{this->seg_a, 8}));
  EXPECT_LE((segstore::RecordId{this->seg_a, 4}), (segstore::RecordId{this->seg_a, 4}));
  EXPECT_GE((segstore::RecordId{this->seg_a, 4}), (segstore::RecordId{this->seg_a, 4}));
}

TEST_F(RecordIdTest, Hash)
{
  std::unordered_set<segstore::RecordId, segstore::RecordId::Hash> ids;

  ids.insert(segstore::RecordId{this->seg_a, 4});
  ids.insert(segstore::RecordId{this->seg_a, 4});
  ids.insert(segstore::RecordId{this->seg_a, 8});
  ids.insert(segstore::RecordId{this->seg_b, 4});

  EXPECT_EQ(ids.size(), 3u);
  EXPECT_EQ(segstore::hash_value(segstore::RecordId{this->seg_c, 12}),
            segstore::hash_value(segstore::RecordId{this->seg_c, 12}));
}

TEST_F(RecordIdTest, PrintAndParse)
{
  const segstore::RecordId id{this->seg_c, 1024};
  const std::string str = segstore::to_string(id);

  EXPECT_EQ(str, "ffffffff-ffff-fffb-0000-000000000007:1024");

  segstore::StatusOr<segstore::RecordId> parsed = segstore::parse_record_id(this->tracker, str);

  ASSERT_TRUE(parsed.ok()) << BATT_INSPECT(parsed.status());
  EXPECT_EQ(*parsed, id);
  EXPECT_EQ(&parsed->segment_id(), this->seg_c);
}

TEST_F(RecordIdTest, ParseInternsNewSegmentIds)
{
  const usize count_before = this->tracker.segment_id_count();

  segstore::StatusOr<segstore::RecordId> parsed =
      segstore::parse_record_id(this->tracker, "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4:12");

  ASSERT_TRUE(parsed.ok()) << BATT_INSPECT(parsed.status());
  EXPECT_EQ(parsed->offset(), 12);
  EXPECT_EQ(this->tracker.segment_id_count(), count_before + 1);
  EXPECT_TRUE(parsed->segment_id().is_data_segment_id());
}

TEST_F(RecordIdTest, ParseErrors)
{
  for (const char* bad : {
           "",
           ":",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4:",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4:-4",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4:12x",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4:262144",
           "0b8a1e3c2c5d4f6ea7b8c9d0e1f2a3b4:12",
           "0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3bz:12",
           "{0b8a1e3c-2c5d-4f6e-a7b8-c9d0e1f2a3b4}:12",
       }) {
    segstore::StatusOr<segstore::RecordId> parsed = segstore::parse_record_id(this->tracker, bad);

    EXPECT_EQ(parsed.status(), segstore::make_status(segstore::StatusCode::kInvalidRecordIdString))
        << BATT_INSPECT(bad);
  }
}

}  // namespace
