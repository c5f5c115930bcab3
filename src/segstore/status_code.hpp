//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_STATUS_CODE_HPP
#define SEGSTORE_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace segstore {

enum struct StatusCode {
  kOk = 0,
  kRelocationIndexMiss = 1,
  kSegmentNotFound = 2,
  kRelocationTableBadSize = 3,
  kRelocationTableUnsorted = 4,
  kRelocationTableDuplicateKey = 5,
  kSegmentTooLarge = 6,
  kDuplicateSegment = 7,
  kInvalidRecordIdString = 8,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

}  // namespace segstore

#endif  // SEGSTORE_STATUS_CODE_HPP
