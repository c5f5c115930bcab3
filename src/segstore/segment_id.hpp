//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_SEGMENT_ID_HPP
#define SEGSTORE_SEGMENT_ID_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>
#include <segstore/uuid.hpp>

#include <batteries/utility.hpp>

#include <boost/uuid/uuid.hpp>

#include <functional>
#include <ostream>

namespace segstore {

class SegmentTracker;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Identifies a Segment.
//
// SegmentId objects are interned by a SegmentTracker: for a given tracker there is exactly one
// SegmentId instance per uuid, so two ids name the same segment iff they are the same object.
// SegmentIds are owned by the tracker and are not copyable.
//
class SegmentId
{
 public:
  struct Hash {
    usize operator()(const SegmentId& segment_id) const
    {
      return std::hash<i64>{}(segment_id.least_significant_bits());
    }
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  SegmentId(const SegmentId&) = delete;
  SegmentId& operator=(const SegmentId&) = delete;

  const boost::uuids::uuid& uuid() const
  {
    return this->uuid_;
  }

  BATT_ALWAYS_INLINE i64 most_significant_bits() const
  {
    return this->msb_;
  }

  BATT_ALWAYS_INLINE i64 least_significant_bits() const
  {
    return this->lsb_;
  }

  u64 segment_type() const
  {
    return static_cast<u64>(this->lsb_) >> kSegmentTypeShift;
  }

  bool is_data_segment_id() const
  {
    return this->segment_type() == kDataSegmentType;
  }

  bool is_bulk_segment_id() const
  {
    return this->segment_type() == kBulkSegmentType;
  }

 private:
  friend class SegmentTracker;

  explicit SegmentId(const boost::uuids::uuid& uuid) noexcept
      : uuid_{uuid}
      , msb_{uuid_most_significant_bits(uuid)}
      , lsb_{uuid_least_significant_bits(uuid)}
  {
  }

  const boost::uuids::uuid uuid_;
  const i64 msb_;
  const i64 lsb_;
};

inline usize hash_value(const SegmentId& segment_id)
{
  return SegmentId::Hash{}(segment_id);
}

std::ostream& operator<<(std::ostream& out, const SegmentId& t);

}  // namespace segstore

#endif  // SEGSTORE_SEGMENT_ID_HPP
