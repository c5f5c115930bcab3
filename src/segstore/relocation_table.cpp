//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/relocation_table.hpp>
//

#include <segstore/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <algorithm>
#include <cstring>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<const RelocationTable>> RelocationTable::from_packed(
    const ConstBuffer& packed)
{
  if (packed.size() % sizeof(PackedRelocationEntry) != 0) {
    return make_status(StatusCode::kRelocationTableBadSize);
  }

  std::vector<PackedRelocationEntry> entries(packed.size() / sizeof(PackedRelocationEntry));
  if (!entries.empty()) {
    std::memcpy(entries.data(), packed.data(), packed.size());
  }

  BATT_REQUIRE_OK(RelocationTable::validate_order(entries));

  SEGSTORE_VLOG(1) << "Loaded packed relocation table;" << BATT_INSPECT(entries.size());

  return std::shared_ptr<const RelocationTable>{new RelocationTable{std::move(entries)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status RelocationTable::validate_order(const std::vector<PackedRelocationEntry>& entries)
{
  for (usize i = 1; i < entries.size(); ++i) {
    const CanonicalRecordId prev_key = entries[i - 1].key();
    const CanonicalRecordId next_key = entries[i].key();

    if (prev_key == next_key) {
      return make_status(StatusCode::kRelocationTableDuplicateKey);
    }
    if (next_key < prev_key) {
      return make_status(StatusCode::kRelocationTableUnsorted);
    }
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ RelocationTable::RelocationTable(std::vector<PackedRelocationEntry>&& entries) noexcept
    : entries_{std::move(entries)}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<CanonicalRecordId> RelocationTable::lookup(const RecordId& record_id) const
{
  const CanonicalRecordId key = CanonicalRecordId::from(record_id);

  auto iter = std::lower_bound(this->entries_.begin(), this->entries_.end(), key,
                               [](const PackedRelocationEntry& entry, const CanonicalRecordId& k) {
                                 return entry.key() < k;
                               });

  if (iter == this->entries_.end() || iter->key() != key) {
    return make_status(StatusCode::kRelocationIndexMiss);
  }
  return iter->value();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const RelocationTable& t)
{
  return out << "RelocationTable{.size=" << t.size() << ",}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class RelocationTableBuilder
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
RelocationTableBuilder& RelocationTableBuilder::add(const RecordId& from,
                                                    const CanonicalRecordId& to)
{
  return this->add(CanonicalRecordId::from(from), to);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
RelocationTableBuilder& RelocationTableBuilder::add(const CanonicalRecordId& from,
                                                    const CanonicalRecordId& to)
{
  BATT_CHECK(!this->built_) << "RelocationTableBuilder::add called after build()";

  this->pending_.emplace_back(from, to);
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<const RelocationTable>> RelocationTableBuilder::build()
{
  BATT_CHECK(!this->built_) << "RelocationTableBuilder::build called twice";
  this->built_ = true;

  std::sort(this->pending_.begin(), this->pending_.end(), [](const auto& l, const auto& r) {
    return l.first < r.first;
  });

  std::vector<PackedRelocationEntry> entries;
  entries.reserve(this->pending_.size());

  for (const auto& [from, to] : this->pending_) {
    if (!entries.empty() && entries.back().key() == from) {
      SEGSTORE_LOG_WARNING_UNLESS_SUPPRESSED()
          << "Relocation table has conflicting entries;" << BATT_INSPECT(from)
          << BATT_INSPECT(entries.back().value()) << BATT_INSPECT(to);

      return make_status(StatusCode::kRelocationTableDuplicateKey);
    }
    entries.emplace_back(PackedRelocationEntry::from(from, to));
  }

  this->pending_.clear();

  return std::shared_ptr<const RelocationTable>{new RelocationTable{std::move(entries)}};
}

}  // namespace segstore
