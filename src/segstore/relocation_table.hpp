//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_RELOCATION_TABLE_HPP
#define SEGSTORE_RELOCATION_TABLE_HPP

#include <segstore/buffer.hpp>
#include <segstore/canonical_record_id.hpp>
#include <segstore/int_types.hpp>
#include <segstore/packed_relocation_entry.hpp>
#include <segstore/relocation_index.hpp>
#include <segstore/status.hpp>

#include <batteries/slice.hpp>

#include <memory>
#include <ostream>
#include <utility>
#include <vector>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A RelocationIndex backed by a sorted array of PackedRelocationEntry; lookups are a binary search.
//
// The packed form (see `packed_bytes()`) is what a store persists alongside its segments; it can
// be reloaded (and re-validated) with `RelocationTable::from_packed`.
//
class RelocationTable : public RelocationIndex
{
 public:
  friend class RelocationTableBuilder;

  /** \brief Validates and copies a packed table.
   *
   * Fails with StatusCode::kRelocationTableBadSize if the buffer is not a whole number of entries,
   * kRelocationTableUnsorted if keys are out of order, or kRelocationTableDuplicateKey if a key
   * appears more than once.
   */
  static StatusOr<std::shared_ptr<const RelocationTable>> from_packed(const ConstBuffer& packed);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  StatusOr<CanonicalRecordId> lookup(const RecordId& record_id) const override;

  usize size() const override
  {
    return this->entries_.size();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  batt::Slice<const PackedRelocationEntry> entries() const
  {
    return batt::as_slice(this->entries_.data(), this->entries_.size());
  }

  ConstBuffer packed_bytes() const
  {
    return ConstBuffer{this->entries_.data(),
                       this->entries_.size() * sizeof(PackedRelocationEntry)};
  }

 private:
  // `entries` must already be validated.
  //
  explicit RelocationTable(std::vector<PackedRelocationEntry>&& entries) noexcept;

  static Status validate_order(const std::vector<PackedRelocationEntry>& entries);

  const std::vector<PackedRelocationEntry> entries_;
};

std::ostream& operator<<(std::ostream& out, const RelocationTable& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Accumulates (from => to) pairs in any order and produces a RelocationTable.
//
class RelocationTableBuilder
{
 public:
  RelocationTableBuilder() = default;

  RelocationTableBuilder(const RelocationTableBuilder&) = delete;
  RelocationTableBuilder& operator=(const RelocationTableBuilder&) = delete;

  RelocationTableBuilder& add(const RecordId& from, const CanonicalRecordId& to);

  RelocationTableBuilder& add(const CanonicalRecordId& from, const CanonicalRecordId& to);

  usize size() const
  {
    return this->pending_.size();
  }

  /** \brief Sorts the accumulated entries and returns the finished table.
   *
   * May only be called once.  Fails with StatusCode::kRelocationTableDuplicateKey if the same
   * `from` id was added more than once.
   */
  StatusOr<std::shared_ptr<const RelocationTable>> build();

 private:
  std::vector<std::pair<CanonicalRecordId, CanonicalRecordId>> pending_;
  bool built_ = false;
};

}  // namespace segstore

#endif  // SEGSTORE_RELOCATION_TABLE_HPP
