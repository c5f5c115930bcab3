//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_SEGMENT_STORE_HPP
#define SEGSTORE_SEGMENT_STORE_HPP

#include <segstore/config.hpp>
//
#include <segstore/relocation_index.hpp>
#include <segstore/segment.hpp>
#include <segstore/segment_id.hpp>
#include <segstore/segment_tracker.hpp>
#include <segstore/status.hpp>

#include <memory>

namespace segstore {

/** \brief The store-level context that record identities are evaluated against.
 *
 * Every operation that needs store state (relocation-aware equality, container resolution) takes a
 * SegmentStore explicitly; nothing is reached through global or ambient state.
 */
class SegmentStore
{
 public:
  SegmentStore(const SegmentStore&) = delete;
  SegmentStore& operator=(const SegmentStore&) = delete;

  virtual ~SegmentStore() = default;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns a snapshot of the active relocation index, or nullptr if no compaction map is
   * currently in effect.
   *
   * The returned index must stay valid and unchanged for as long as the caller holds the pointer,
   * even if the store installs a newer index in the meantime.  Callers that perform more than one
   * lookup as part of a single logical operation must do all of them against the same snapshot.
   */
  virtual std::shared_ptr<const RelocationIndex> relocation_index() const = 0;

  /** \brief Resolves a segment id to the live segment object.
   *
   * Returns StatusCode::kSegmentNotFound if the store has no such segment.
   */
  virtual StatusOr<std::shared_ptr<const Segment>> resolve_segment(
      const SegmentId& segment_id) const = 0;

  /** \brief The tracker that interns this store's segment ids.
   */
  virtual SegmentTracker& tracker() = 0;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 protected:
  SegmentStore() = default;
};

}  // namespace segstore

#endif  // SEGSTORE_SEGMENT_STORE_HPP
