//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_PACKED_RELOCATION_ENTRY_HPP
#define SEGSTORE_PACKED_RELOCATION_ENTRY_HPP

#include <segstore/buffer.hpp>
#include <segstore/canonical_record_id.hpp>
#include <segstore/int_types.hpp>

#include <batteries/static_assert.hpp>

#include <ostream>

namespace segstore {

// One row of a packed relocation table: the pre-compaction address of a record (the key) and the
// canonical id it resolves to (the value).  Tables are arrays of these, sorted by key.
//
struct PackedRelocationEntry {
  static PackedRelocationEntry from(const CanonicalRecordId& key, const CanonicalRecordId& value)
  {
    PackedRelocationEntry entry;

    entry.from_msb = key.segment_msb;
    entry.from_lsb = key.segment_lsb;
    entry.from_offset = key.offset;
    entry.to_msb = value.segment_msb;
    entry.to_lsb = value.segment_lsb;
    entry.to_offset = value.offset;

    return entry;
  }

  little_i64 from_msb;
  little_i64 from_lsb;
  little_i64 from_offset;
  little_i64 to_msb;
  little_i64 to_lsb;
  little_i64 to_offset;

  CanonicalRecordId key() const
  {
    return CanonicalRecordId{
        .segment_msb = this->from_msb,
        .segment_lsb = this->from_lsb,
        .offset = this->from_offset,
    };
  }

  CanonicalRecordId value() const
  {
    return CanonicalRecordId{
        .segment_msb = this->to_msb,
        .segment_lsb = this->to_lsb,
        .offset = this->to_offset,
    };
  }
};

BATT_STATIC_ASSERT_EQ(sizeof(PackedRelocationEntry), 48);

inline std::ostream& operator<<(std::ostream& out, const PackedRelocationEntry& t)
{
  return out << t.key() << " => " << t.value();
}

}  // namespace segstore

#endif  // SEGSTORE_PACKED_RELOCATION_ENTRY_HPP
