//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_MEMORY_SEGMENT_STORE_HPP
#define SEGSTORE_MEMORY_SEGMENT_STORE_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>
#include <segstore/relocation_index.hpp>
#include <segstore/segment.hpp>
#include <segstore/segment_store.hpp>
#include <segstore/segment_store_options.hpp>
#include <segstore/segment_tracker.hpp>
#include <segstore/status.hpp>

#include <batteries/async/mutex.hpp>

#include <boost/uuid/uuid.hpp>

#include <memory>
#include <unordered_map>
#include <vector>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A SegmentStore that keeps all segments in memory.
//
// The relocation index is swapped atomically as a whole: readers that called `relocation_index()`
// keep their snapshot alive (and unchanged) regardless of later installs or clears.
//
class MemorySegmentStore : public SegmentStore
{
 public:
  explicit MemorySegmentStore(
      const SegmentStoreOptions& options = SegmentStoreOptions::with_default_values()) noexcept;

  const SegmentStoreOptions& options() const
  {
    return this->options_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Adds a new data segment under a freshly allocated id.
   */
  StatusOr<std::shared_ptr<const Segment>> add_segment(std::vector<u8>&& bytes);

  /** \brief Adds a segment under the given id.
   *
   * Fails with StatusCode::kDuplicateSegment if the id is already in use, or kSegmentTooLarge if
   * `bytes` exceeds `options().max_segment_size()`.
   */
  StatusOr<std::shared_ptr<const Segment>> add_segment(const boost::uuids::uuid& uuid,
                                                       std::vector<u8>&& bytes);

  usize segment_count() const;

  /** \brief Makes `index` the active relocation index; replaces any previous one.
   */
  void install_relocation_index(std::shared_ptr<const RelocationIndex> index);

  /** \brief Deactivates relocation; returns the index that was active (nullptr if none).
   */
  std::shared_ptr<const RelocationIndex> clear_relocation_index();

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // SegmentStore interface

  std::shared_ptr<const RelocationIndex> relocation_index() const override;

  StatusOr<std::shared_ptr<const Segment>> resolve_segment(
      const SegmentId& segment_id) const override;

  SegmentTracker& tracker() override
  {
    return this->tracker_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 private:
  const SegmentStoreOptions options_;

  SegmentTracker tracker_;

  mutable batt::Mutex<std::unordered_map<const SegmentId*, std::shared_ptr<const Segment>>>
      segments_;

  mutable batt::Mutex<std::shared_ptr<const RelocationIndex>> relocation_index_;
};

}  // namespace segstore

#endif  // SEGSTORE_MEMORY_SEGMENT_STORE_HPP
