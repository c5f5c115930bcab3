//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/status_code.hpp>
//

#include <batteries/status.hpp>

namespace segstore {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kRelocationIndexMiss,
                     "The relocation index has no entry for the given record id; the index is "
                     "stale or incomplete, or the record id is bogus"),  // 1
      CODE_WITH_MSG_(StatusCode::kSegmentNotFound,
                     "The store does not hold a segment with the given id"),  // 2
      CODE_WITH_MSG_(StatusCode::kRelocationTableBadSize,
                     "Packed relocation table size is not a multiple of the entry size"),  // 3
      CODE_WITH_MSG_(StatusCode::kRelocationTableUnsorted,
                     "Packed relocation table entries are not sorted by record id"),  // 4
      CODE_WITH_MSG_(StatusCode::kRelocationTableDuplicateKey,
                     "Relocation table contains more than one entry for the same record id"),  // 5
      CODE_WITH_MSG_(StatusCode::kSegmentTooLarge,
                     "Segment size exceeds the configured maximum"),  // 6
      CODE_WITH_MSG_(StatusCode::kDuplicateSegment,
                     "A segment with the same id is already registered in the store"),  // 7
      CODE_WITH_MSG_(StatusCode::kInvalidRecordIdString,
                     "Could not parse record id; expected <segment-uuid>:<offset>"),  // 8
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

}  // namespace segstore
