//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_RELOCATION_INDEX_HPP
#define SEGSTORE_RELOCATION_INDEX_HPP

#include <segstore/canonical_record_id.hpp>
#include <segstore/int_types.hpp>
#include <segstore/record_id.hpp>
#include <segstore/status.hpp>

namespace segstore {

/** \brief Read-only query interface over a compaction map.
 *
 * A RelocationIndex maps every record id that was live when the index was built to the canonical
 * id of the logical record it holds.  Implementations must be immutable once published, so that
 * any number of threads may call `lookup` concurrently.
 */
class RelocationIndex
{
 public:
  RelocationIndex(const RelocationIndex&) = delete;
  RelocationIndex& operator=(const RelocationIndex&) = delete;

  virtual ~RelocationIndex() = default;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the canonical id for `record_id`.
   *
   * If the index has no entry for `record_id`, returns StatusCode::kRelocationIndexMiss.  This
   * means the index is stale or incomplete (or `record_id` is bogus); it is never a normal
   * outcome and callers must not treat it as "not equal".
   */
  virtual StatusOr<CanonicalRecordId> lookup(const RecordId& record_id) const = 0;

  /** \brief The number of record ids this index can resolve.
   */
  virtual usize size() const = 0;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 protected:
  RelocationIndex() = default;
};

}  // namespace segstore

#endif  // SEGSTORE_RELOCATION_INDEX_HPP
