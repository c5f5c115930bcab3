//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/record_equivalence.hpp>
//

#include <segstore/logging.hpp>

#include <batteries/stream_util.hpp>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> fast_equals(const Record& a, const Record& b, const SegmentStore& store)
{
  // Hold the snapshot for the whole comparison so both lookups see the same index.
  //
  const std::shared_ptr<const RelocationIndex> index = store.relocation_index();

  if (!index) {
    return {&a.segment_id() == &b.segment_id() && a.get_offset() == b.get_offset()};
  }

  BATT_ASSIGN_OK_RESULT(const CanonicalRecordId a_canonical, resolve_canonical_id(*index, a));
  BATT_ASSIGN_OK_RESULT(const CanonicalRecordId b_canonical, resolve_canonical_id(*index, b));

  SEGSTORE_VLOG(2) << "fast_equals (relocated):" << BATT_INSPECT(a) << BATT_INSPECT(a_canonical)
                   << BATT_INSPECT(b) << BATT_INSPECT(b_canonical);

  return {a_canonical == b_canonical};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> fast_equals(const Record* a, const Record* b, const SegmentStore& store)
{
  if (a == nullptr || b == nullptr) {
    return {false};
  }
  return fast_equals(*a, *b, store);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> fast_equals(const Record& a, const Record* b, const SegmentStore& store)
{
  return fast_equals(&a, b, store);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> fast_equals(const Record* a, const Record& b, const SegmentStore& store)
{
  return fast_equals(a, &b, store);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<CanonicalRecordId> resolve_canonical_id(const RelocationIndex& index,
                                                 const Record& record)
{
  StatusOr<CanonicalRecordId> canonical = index.lookup(record.record_id());

  if (!canonical.ok()) {
    SEGSTORE_LOG_WARNING_UNLESS_SUPPRESSED()
        << "Relocation index could not resolve a record id;" << BATT_INSPECT(record)
        << BATT_INSPECT(index.size()) << BATT_INSPECT(canonical.status());
  }

  return canonical;
}

}  // namespace segstore
