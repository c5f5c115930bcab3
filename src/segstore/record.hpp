//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_RECORD_HPP
#define SEGSTORE_RECORD_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>
#include <segstore/record_id.hpp>
#include <segstore/segment.hpp>
#include <segstore/segment_id.hpp>
#include <segstore/status.hpp>

#include <batteries/assert.hpp>
#include <batteries/utility.hpp>

#include <memory>
#include <ostream>

namespace segstore {

class SegmentStore;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Base class for all records stored within a segment.
//
// A Record is an immutable (segment id, offset) pair plus helpers for locating the fields of a
// record in its segment.  It does not own the segment (or the SegmentId); both are owned by the
// store, which must outlive every Record that refers to it.
//
// There is no operator== for Record: whether two records are the same depends on the store's
// relocation state.  Use `fast_equals` (<segstore/record_equivalence.hpp>).
//
class Record
{
 public:
  // Hashes the raw address only; the relocation index is never consulted.
  //
  struct Hash {
    usize operator()(const Record& record) const
    {
      return SegmentId::Hash{}(record.segment_id()) ^ static_cast<usize>(record.get_offset());
    }
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the identifier of this record.
   */
  RecordId record_id() const
  {
    return RecordId{this->segment_id_, this->offset_};
  }

  /** \brief Returns the identifier of the segment that contains this record.
   */
  BATT_ALWAYS_INLINE const SegmentId& segment_id() const
  {
    return *this->segment_id_;
  }

  /** \brief Resolves the segment that contains this record through `store`.
   */
  StatusOr<std::shared_ptr<const Segment>> get_segment(const SegmentStore& store) const;

  /** \brief Returns the segment offset of this record.
   */
  BATT_ALWAYS_INLINE i32 get_offset() const
  {
    return this->offset_;
  }

  /** \brief Returns the segment offset of the given byte position in this record.
   */
  BATT_ALWAYS_INLINE i32 get_offset(i32 position) const
  {
    return this->get_offset() + position;
  }

  /** \brief Returns the segment offset of a byte position in this record, calculated from the
   * given number of raw bytes and record identifiers that precede it.
   *
   * No bounds checking is done against the size of the segment.
   */
  BATT_ALWAYS_INLINE i32 get_offset(i32 bytes, i32 ids) const
  {
    return this->get_offset(bytes + ids * kRecordIdBytes);
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 protected:
  explicit Record(const RecordId& id) noexcept : Record{id.segment_id(), id.offset()}
  {
  }

  explicit Record(const SegmentId& segment_id, i32 offset) noexcept
      : segment_id_{&segment_id}
      , offset_{offset}
  {
    BATT_CHECK_GE(this->offset_, 0);
  }

  Record(const Record&) = default;
  Record& operator=(const Record&) = delete;

  ~Record() = default;

 private:
  const SegmentId* const segment_id_;
  const i32 offset_;
};

inline usize hash_value(const Record& record)
{
  return Record::Hash{}(record);
}

// Prints the record id.
//
std::ostream& operator<<(std::ostream& out, const Record& t);

}  // namespace segstore

#endif  // SEGSTORE_RECORD_HPP
