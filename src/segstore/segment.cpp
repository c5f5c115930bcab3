//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/segment.hpp>
//

#include <batteries/assert.hpp>
#include <batteries/checked_cast.hpp>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Segment::Segment(const SegmentId& segment_id, std::vector<u8>&& bytes) noexcept
    : segment_id_{&segment_id}
    , bytes_{std::move(bytes)}
{
  BATT_CHECK_LE(this->bytes_.size(), BATT_CHECKED_CAST(usize, kMaxSegmentSize));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ConstBuffer> Segment::get_bytes(i32 offset, i32 length) const
{
  if (offset < 0 || length < 0 || i64{offset} + i64{length} > i64{this->size()}) {
    return {batt::StatusCode::kOutOfRange};
  }
  return ConstBuffer{this->bytes_.data() + offset, static_cast<usize>(length)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Segment& t)
{
  return out << "Segment{.id=" << t.segment_id() << ", .size=" << t.size() << ",}";
}

}  // namespace segstore
