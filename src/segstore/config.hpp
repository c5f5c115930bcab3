//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_CONFIG_HPP
#define SEGSTORE_CONFIG_HPP

#include <segstore/int_types.hpp>

#include <batteries/constants.hpp>
#include <batteries/static_assert.hpp>

#include <atomic>

namespace segstore {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// The number of bytes used to serialize a single record identifier inside a segment: one byte of
// segment reference index followed by a 16-bit (aligned) offset.
//
constexpr i32 kRecordIdBytes = 3;

// Records start on 4-byte boundaries within a segment.
//
constexpr usize kRecordAlignBits = 2;

// The largest segment size the store will accept.
//
constexpr i32 kMaxSegmentSize = static_cast<i32>(256 * ::batt::constants::kKiB);

BATT_STATIC_ASSERT_EQ(kMaxSegmentSize >> kRecordAlignBits, i32{1} << 16);

// The top nibble of a segment id's least significant bits identifies the segment type.
//
constexpr u64 kSegmentTypeShift = 60;
constexpr u64 kDataSegmentType = 0xA;
constexpr u64 kBulkSegmentType = 0xB;

// ** FOR TESTING ONLY **
//
// Suppress WARNING level output for expected errors while running unit tests.
//
inline std::atomic<bool>& suppress_log_output_for_test()
{
  static std::atomic<bool> value_{false};
  return value_;
}

}  // namespace segstore

#endif  // SEGSTORE_CONFIG_HPP
