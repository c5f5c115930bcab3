//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/memory_segment_store.hpp>
//
#include <segstore/memory_segment_store.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segstore/relocation_table.hpp>
#include <segstore/uuid.hpp>

#include <batteries/stream_util.hpp>

#include <boost/uuid/uuid.hpp>

#include <vector>

namespace {

using namespace segstore::int_types;

using segstore::CanonicalRecordId;
using segstore::make_status;
using segstore::MemorySegmentStore;
using segstore::RecordId;
using segstore::SegmentStoreOptions;
using segstore::StatusCode;

TEST(MemorySegmentStoreTest, AddAndResolve)
{
  MemorySegmentStore store;

  EXPECT_EQ(store.segment_count(), 0u);
  EXPECT_EQ(store.relocation_index(), nullptr);

  auto added = store.add_segment(std::vector<u8>(64, u8{0x5a}));
  ASSERT_TRUE(added.ok()) << BATT_INSPECT(added.status());

  const segstore::Segment& segment = **added;

  EXPECT_EQ(store.segment_count(), 1u);
  EXPECT_EQ(segment.size(), 64);
  EXPECT_TRUE(segment.segment_id().is_data_segment_id());

  auto resolved = store.resolve_segment(segment.segment_id());
  ASSERT_TRUE(resolved.ok()) << BATT_INSPECT(resolved.status());
  EXPECT_EQ(resolved->get(), &segment);

  // A known id with no segment behind it.
  //
  const segstore::SegmentId* unknown = store.tracker().new_data_segment_id();

  EXPECT_EQ(store.resolve_segment(*unknown).status(), make_status(StatusCode::kSegmentNotFound));
}

TEST(MemorySegmentStoreTest, AddUnderExplicitId)
{
  MemorySegmentStore store;

  const boost::uuids::uuid uuid = segstore::uuid_from_bits(i64{0x4444}, i64{0x5555});

  auto first = store.add_segment(uuid, std::vector<u8>(16));
  ASSERT_TRUE(first.ok()) << BATT_INSPECT(first.status());

  EXPECT_EQ(&(*first)->segment_id(), store.tracker().get_segment_id(i64{0x4444}, i64{0x5555}));

  auto second = store.add_segment(uuid, std::vector<u8>(16));
  EXPECT_EQ(second.status(), make_status(StatusCode::kDuplicateSegment));
  EXPECT_EQ(store.segment_count(), 1u);
}

TEST(MemorySegmentStoreTest, MaxSegmentSize)
{
  MemorySegmentStore store{SegmentStoreOptions::with_default_values().set_max_segment_size(100)};

  EXPECT_EQ(store.options().max_segment_size(), 100);

  EXPECT_TRUE(store.add_segment(std::vector<u8>(100)).ok());

  // A rejected segment does not leave a segment id behind.
  //
  const usize id_count = store.tracker().segment_id_count();

  EXPECT_EQ(store.add_segment(std::vector<u8>(101)).status(),
            make_status(StatusCode::kSegmentTooLarge));
  EXPECT_EQ(store.segment_count(), 1u);
  EXPECT_EQ(store.tracker().segment_id_count(), id_count);
}

TEST(MemorySegmentStoreTest, DefaultOptions)
{
  const SegmentStoreOptions options = SegmentStoreOptions::with_default_values();

  EXPECT_EQ(options.max_segment_size(), segstore::kMaxSegmentSize);

  const SegmentStoreOptions default_constructed;

  EXPECT_EQ(default_constructed.max_segment_size(), segstore::kMaxSegmentSize);

  MemorySegmentStore store;

  EXPECT_TRUE(store.add_segment(std::vector<u8>(segstore::kMaxSegmentSize)).ok());
  EXPECT_EQ(store.add_segment(std::vector<u8>(segstore::kMaxSegmentSize + 1)).status(),
            make_status(StatusCode::kSegmentTooLarge));
}

TEST(MemorySegmentStoreTest, InstallAndClearRelocationIndex)
{
  SegmentStoreOptions options = SegmentStoreOptions::with_default_values();
  options.verbose_relocation_log = false;

  MemorySegmentStore store{options};

  const segstore::SegmentId* seg = store.tracker().get_segment_id(i64{1}, i64{1});

  auto first = segstore::RelocationTableBuilder{}
                   .add(RecordId{seg, 4}, CanonicalRecordId{1, 1, 4})
                   .build();
  ASSERT_TRUE(first.ok());

  auto second = segstore::RelocationTableBuilder{}
                    .add(RecordId{seg, 4}, CanonicalRecordId{2, 2, 8})
                    .build();
  ASSERT_TRUE(second.ok());

  store.install_relocation_index(*first);
  EXPECT_EQ(store.relocation_index(), *first);

  // A snapshot taken before a swap is unaffected by it.
  //
  std::shared_ptr<const segstore::RelocationIndex> snapshot = store.relocation_index();

  store.install_relocation_index(*second);
  EXPECT_EQ(store.relocation_index(), *second);

  auto canonical = snapshot->lookup(RecordId{seg, 4});
  ASSERT_TRUE(canonical.ok());
  EXPECT_EQ(*canonical, (CanonicalRecordId{1, 1, 4}));

  std::shared_ptr<const segstore::RelocationIndex> prev = store.clear_relocation_index();

  EXPECT_EQ(prev, *second);
  EXPECT_EQ(store.relocation_index(), nullptr);
  EXPECT_EQ(store.clear_relocation_index(), nullptr);

  // Clearing drops the store's reference only.
  //
  first->reset();
  canonical = snapshot->lookup(RecordId{seg, 4});
  ASSERT_TRUE(canonical.ok());
  EXPECT_EQ(*canonical, (CanonicalRecordId{1, 1, 4}));
}

}  // namespace
