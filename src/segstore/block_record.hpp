//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_BLOCK_RECORD_HPP
#define SEGSTORE_BLOCK_RECORD_HPP

#include <segstore/config.hpp>
//
#include <segstore/buffer.hpp>
#include <segstore/int_types.hpp>
#include <segstore/record.hpp>
#include <segstore/record_id.hpp>
#include <segstore/status.hpp>

namespace segstore {

class SegmentStore;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A record holding `size` raw bytes, stored contiguously at the record's offset.
//
class BlockRecord : public Record
{
 public:
  // `id.offset() + size` must not exceed kMaxSegmentSize.
  //
  explicit BlockRecord(const RecordId& id, i32 size) noexcept;

  i32 size() const
  {
    return this->size_;
  }

  /** \brief Copies `dst.size()` bytes from `position` within this block into `dst`.
   *
   * Returns batt::StatusCode::kOutOfRange if the requested range is not entirely inside the block
   * (or the block is not entirely inside its segment).
   */
  Status read(const SegmentStore& store, i32 position, const MutableBuffer& dst) const;

 private:
  i32 size_;
};

}  // namespace segstore

#endif  // SEGSTORE_BLOCK_RECORD_HPP
