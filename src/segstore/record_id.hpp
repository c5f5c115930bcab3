//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_RECORD_ID_HPP
#define SEGSTORE_RECORD_ID_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>
#include <segstore/segment_id.hpp>
#include <segstore/status.hpp>

#include <batteries/assert.hpp>
#include <batteries/utility.hpp>

#include <boost/functional/hash.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace segstore {

class SegmentTracker;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The physical address of a record: the segment that holds it plus a byte offset within that
// segment.
//
// Segment ids are compared by identity (see SegmentId), so RecordId equality is a pointer
// comparison plus an integer comparison.  RecordId does not know about relocation; see
// `fast_equals` for logical record equality.
//
class RecordId
{
 public:
  struct Hash {
    usize operator()(const RecordId& record_id) const
    {
      usize seed = SegmentId::Hash{}(record_id.segment_id());
      boost::hash_combine(seed, record_id.offset());
      return seed;
    }
  };

  BATT_ALWAYS_INLINE explicit RecordId(const SegmentId* segment_id, i32 offset) noexcept
      : segment_id_{segment_id}
      , offset_{offset}
  {
    BATT_CHECK(this->segment_id_ != nullptr);
    BATT_CHECK_GE(this->offset_, 0);
  }

  BATT_ALWAYS_INLINE const SegmentId& segment_id() const
  {
    return *this->segment_id_;
  }

  BATT_ALWAYS_INLINE i32 offset() const
  {
    return this->offset_;
  }

 private:
  const SegmentId* segment_id_;
  i32 offset_;
};

inline usize hash_value(const RecordId& record_id)
{
  return RecordId::Hash{}(record_id);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

// Prints `<segment-uuid>:<offset>`.
//
std::ostream& operator<<(std::ostream& out, const RecordId& t);

std::string to_string(const RecordId& record_id);

// Parses the format produced by `operator<<`, interning the segment id in `tracker`.
//
StatusOr<RecordId> parse_record_id(SegmentTracker& tracker, std::string_view str);

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

inline bool operator==(const RecordId& l, const RecordId& r)
{
  return &l.segment_id() == &r.segment_id() && l.offset() == r.offset();
}

inline bool operator!=(const RecordId& l, const RecordId& r)
{
  return !(l == r);
}

// Orders by segment uuid (msb, then lsb), then by offset.
//
inline bool operator<(const RecordId& l, const RecordId& r)
{
  const SegmentId& l_seg = l.segment_id();
  const SegmentId& r_seg = r.segment_id();

  if (l_seg.most_significant_bits() != r_seg.most_significant_bits()) {
    return l_seg.most_significant_bits() < r_seg.most_significant_bits();
  }
  if (l_seg.least_significant_bits() != r_seg.least_significant_bits()) {
    return l_seg.least_significant_bits() < r_seg.least_significant_bits();
  }
  return l.offset() < r.offset();
}

inline bool operator>(const RecordId& l, const RecordId& r)
{
  return r < l;
}

inline bool operator<=(const RecordId& l, const RecordId& r)
{
  return !(r < l);
}

inline bool operator>=(const RecordId& l, const RecordId& r)
{
  return !(l < r);
}

}  // namespace segstore

#endif  // SEGSTORE_RECORD_ID_HPP
