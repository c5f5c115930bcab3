//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_SEGMENT_STORE_OPTIONS_HPP
#define SEGSTORE_SEGMENT_STORE_OPTIONS_HPP

#include <segstore/config.hpp>
//
#include <segstore/int_types.hpp>

namespace segstore {

class SegmentStoreOptions
{
 public:
  static SegmentStoreOptions with_default_values();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Sets the largest segment (in bytes) the store will accept; must not exceed
   * kMaxSegmentSize.
   */
  SegmentStoreOptions& set_max_segment_size(i32 max_size);

  i32 max_segment_size() const
  {
    return this->max_segment_size_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  // If true, the store logs every relocation index install/clear at INFO; otherwise at VLOG(1).
  //
  bool verbose_relocation_log = true;

 private:
  i32 max_segment_size_ = kMaxSegmentSize;
};

}  // namespace segstore

#endif  // SEGSTORE_SEGMENT_STORE_OPTIONS_HPP
