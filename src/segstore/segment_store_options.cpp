//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/segment_store_options.hpp>
//
#include <batteries/assert.hpp>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SegmentStoreOptions SegmentStoreOptions::with_default_values()
{
  SegmentStoreOptions opts;

  opts.set_max_segment_size(kMaxSegmentSize);
  opts.verbose_relocation_log = true;

  return opts;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SegmentStoreOptions& SegmentStoreOptions::set_max_segment_size(i32 max_size)
{
  BATT_CHECK_GT(max_size, 0);
  BATT_CHECK_LE(max_size, kMaxSegmentSize);

  this->max_segment_size_ = max_size;
  return *this;
}

}  // namespace segstore
