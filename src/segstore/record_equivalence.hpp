//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_RECORD_EQUIVALENCE_HPP
#define SEGSTORE_RECORD_EQUIVALENCE_HPP

#include <segstore/config.hpp>
//
#include <segstore/canonical_record_id.hpp>
#include <segstore/record.hpp>
#include <segstore/relocation_index.hpp>
#include <segstore/segment_store.hpp>
#include <segstore/status.hpp>

#include <type_traits>

namespace segstore {

// True iff `T` is a Record (or subclass), or a pointer to one.
//
template <typename T>
inline constexpr bool IsRecordOperand =
    std::is_base_of_v<Record, std::remove_cv_t<std::remove_pointer_t<std::decay_t<T>>>>;

/** \brief Returns whether `a` and `b` are the same logical record in `store`.
 *
 * If the store has no relocation index, this is a raw address comparison: same SegmentId object
 * and same offset.  Otherwise both record ids are resolved through a single snapshot of the index
 * and the canonical ids are compared.
 *
 * A relocation index that cannot resolve either record id is an error
 * (StatusCode::kRelocationIndexMiss), never a "false" result.
 *
 * NOTE: `hash_value(const Record&)` only ever hashes the raw address.  While a relocation index is
 * active, two records for which this function returns true may hash differently, so unordered
 * containers keyed by Record must not rely on relocation-aware equality.
 */
StatusOr<bool> fast_equals(const Record& a, const Record& b, const SegmentStore& store);

/** \brief As above; a null operand is never equal to anything (including another null).
 */
StatusOr<bool> fast_equals(const Record* a, const Record* b, const SegmentStore& store);

// Mixed reference/pointer forms; same rules as the pointer form.
//
StatusOr<bool> fast_equals(const Record& a, const Record* b, const SegmentStore& store);

StatusOr<bool> fast_equals(const Record* a, const Record& b, const SegmentStore& store);

/** \brief Comparisons involving anything that isn't a Record are always false.
 */
template <typename A, typename B,
          typename = std::enable_if_t<!(IsRecordOperand<A> && IsRecordOperand<B>)>>
inline StatusOr<bool> fast_equals(const A&, const B&, const SegmentStore&)
{
  return {false};
}

/** \brief Resolves the canonical id of `record` through `index`.
 */
StatusOr<CanonicalRecordId> resolve_canonical_id(const RelocationIndex& index,
                                                 const Record& record);

}  // namespace segstore

#endif  // SEGSTORE_RECORD_EQUIVALENCE_HPP
