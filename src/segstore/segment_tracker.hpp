//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_SEGMENT_TRACKER_HPP
#define SEGSTORE_SEGMENT_TRACKER_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>
#include <segstore/segment_id.hpp>

#include <batteries/async/mutex.hpp>

#include <boost/functional/hash.hpp>
#include <boost/uuid/uuid.hpp>

#include <memory>
#include <unordered_map>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Owns and interns the SegmentId objects of a store.
//
// All returned pointers remain valid for the lifetime of the tracker.  Safe to use concurrently
// from multiple threads.
//
class SegmentTracker
{
 public:
  SegmentTracker() = default;

  SegmentTracker(const SegmentTracker&) = delete;
  SegmentTracker& operator=(const SegmentTracker&) = delete;

  /** \brief Returns the unique SegmentId for the given uuid halves, creating it if necessary.
   */
  const SegmentId* get_segment_id(i64 msb, i64 lsb);

  /** \brief Returns the unique SegmentId for the given uuid, creating it if necessary.
   */
  const SegmentId* get_segment_id(const boost::uuids::uuid& uuid);

  /** \brief Allocates a fresh random id for a data segment.
   */
  const SegmentId* new_data_segment_id();

  /** \brief Allocates a fresh random id for a bulk (raw binary) segment.
   */
  const SegmentId* new_bulk_segment_id();

  usize segment_id_count() const;

 private:
  const SegmentId* new_segment_id(u64 segment_type);

  mutable batt::Mutex<std::unordered_map<boost::uuids::uuid, std::unique_ptr<SegmentId>,
                                         boost::hash<boost::uuids::uuid>>>
      ids_;
};

}  // namespace segstore

#endif  // SEGSTORE_SEGMENT_TRACKER_HPP
