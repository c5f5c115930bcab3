//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/segment_tracker.hpp>
//

#include <segstore/logging.hpp>
#include <segstore/uuid.hpp>

#include <batteries/assert.hpp>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SegmentId* SegmentTracker::get_segment_id(i64 msb, i64 lsb)
{
  return this->get_segment_id(uuid_from_bits(msb, lsb));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SegmentId* SegmentTracker::get_segment_id(const boost::uuids::uuid& uuid)
{
  auto locked = this->ids_.lock();

  std::unique_ptr<SegmentId>& slot = (*locked)[uuid];
  if (!slot) {
    slot.reset(new SegmentId{uuid});
    SEGSTORE_VLOG(1) << "SegmentTracker: new segment id " << *slot;
  }
  return slot.get();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SegmentId* SegmentTracker::new_data_segment_id()
{
  return this->new_segment_id(kDataSegmentType);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SegmentId* SegmentTracker::new_bulk_segment_id()
{
  return this->new_segment_id(kBulkSegmentType);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize SegmentTracker::segment_id_count() const
{
  return this->ids_.lock()->size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SegmentId* SegmentTracker::new_segment_id(u64 segment_type)
{
  static constexpr u64 kTypeMask = u64{0xF} << kSegmentTypeShift;

  const boost::uuids::uuid uuid = random_uuid();
  const u64 lsb = (static_cast<u64>(uuid_least_significant_bits(uuid)) & ~kTypeMask) |
                  (segment_type << kSegmentTypeShift);

  const SegmentId* segment_id =
      this->get_segment_id(uuid_most_significant_bits(uuid), static_cast<i64>(lsb));

  BATT_CHECK_EQ(segment_id->segment_type(), segment_type);

  return segment_id;
}

}  // namespace segstore
