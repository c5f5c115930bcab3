//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/block_record.hpp>
//

#include <segstore/segment_store.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <cstring>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ BlockRecord::BlockRecord(const RecordId& id, i32 size) noexcept
    : Record{id}
    , size_{size}
{
  BATT_CHECK_GE(this->size_, 0);
  BATT_CHECK_LE(i64{id.offset()} + i64{this->size_}, i64{kMaxSegmentSize})
      << "BlockRecord does not fit in a segment;" << BATT_INSPECT(id) << BATT_INSPECT(size);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status BlockRecord::read(const SegmentStore& store, i32 position, const MutableBuffer& dst) const
{
  const i64 length = static_cast<i64>(dst.size());

  if (position < 0 || i64{position} + length > i64{this->size_}) {
    return {batt::StatusCode::kOutOfRange};
  }

  BATT_ASSIGN_OK_RESULT(std::shared_ptr<const Segment> segment, this->get_segment(store));
  BATT_ASSIGN_OK_RESULT(ConstBuffer src,
                        segment->get_bytes(this->get_offset(position), static_cast<i32>(length)));

  if (src.size() != 0) {
    std::memcpy(dst.data(), src.data(), src.size());
  }

  return OkStatus();
}

}  // namespace segstore
