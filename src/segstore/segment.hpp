//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_SEGMENT_HPP
#define SEGSTORE_SEGMENT_HPP

#include <segstore/config.hpp>
//
#include <segstore/buffer.hpp>
#include <segstore/int_types.hpp>
#include <segstore/segment_id.hpp>
#include <segstore/status.hpp>

#include <ostream>
#include <vector>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// An immutable, fully loaded segment: a run of bytes containing many records.
//
class Segment
{
 public:
  explicit Segment(const SegmentId& segment_id, std::vector<u8>&& bytes) noexcept;

  Segment(const Segment&) = delete;
  Segment& operator=(const Segment&) = delete;

  const SegmentId& segment_id() const
  {
    return *this->segment_id_;
  }

  i32 size() const
  {
    return static_cast<i32>(this->bytes_.size());
  }

  ConstBuffer data() const
  {
    return ConstBuffer{this->bytes_.data(), this->bytes_.size()};
  }

  bool contains_offset(i32 offset) const
  {
    return offset >= 0 && offset < this->size();
  }

  /** \brief Returns the `length` bytes starting at `offset`.
   *
   * Returns batt::StatusCode::kOutOfRange if any part of the range is outside the segment.
   */
  StatusOr<ConstBuffer> get_bytes(i32 offset, i32 length) const;

 private:
  const SegmentId* segment_id_;
  const std::vector<u8> bytes_;
};

std::ostream& operator<<(std::ostream& out, const Segment& t);

}  // namespace segstore

#endif  // SEGSTORE_SEGMENT_HPP
