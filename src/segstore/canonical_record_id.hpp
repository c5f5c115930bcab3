//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_CANONICAL_RECORD_ID_HPP
#define SEGSTORE_CANONICAL_RECORD_ID_HPP

#include <segstore/int_types.hpp>
#include <segstore/record_id.hpp>

#include <boost/functional/hash.hpp>

#include <ostream>
#include <tuple>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The location-independent identity of a record after all relocations have been resolved: the
// uuid halves of the segment it now lives in, plus its offset there.
//
struct CanonicalRecordId {
  i64 segment_msb;
  i64 segment_lsb;
  i64 offset;

  static CanonicalRecordId from(const RecordId& record_id)
  {
    return CanonicalRecordId{
        .segment_msb = record_id.segment_id().most_significant_bits(),
        .segment_lsb = record_id.segment_id().least_significant_bits(),
        .offset = record_id.offset(),
    };
  }

  auto as_tuple() const
  {
    return std::make_tuple(this->segment_msb, this->segment_lsb, this->offset);
  }
};

inline bool operator==(const CanonicalRecordId& l, const CanonicalRecordId& r)
{
  return l.segment_msb == r.segment_msb && l.segment_lsb == r.segment_lsb && l.offset == r.offset;
}

inline bool operator!=(const CanonicalRecordId& l, const CanonicalRecordId& r)
{
  return !(l == r);
}

inline bool operator<(const CanonicalRecordId& l, const CanonicalRecordId& r)
{
  return l.as_tuple() < r.as_tuple();
}

inline usize hash_value(const CanonicalRecordId& id)
{
  usize seed = 0;
  boost::hash_combine(seed, id.segment_msb);
  boost::hash_combine(seed, id.segment_lsb);
  boost::hash_combine(seed, id.offset);
  return seed;
}

inline std::ostream& operator<<(std::ostream& out, const CanonicalRecordId& t)
{
  return out << "(" << t.segment_msb << ", " << t.segment_lsb << ", " << t.offset << ")";
}

}  // namespace segstore

#endif  // SEGSTORE_CANONICAL_RECORD_ID_HPP
