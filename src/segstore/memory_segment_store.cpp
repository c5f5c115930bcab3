//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/memory_segment_store.hpp>
//

#include <segstore/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

namespace segstore {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MemorySegmentStore::MemorySegmentStore(const SegmentStoreOptions& options) noexcept
    : options_{options}
{
  initialize_status_codes();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<const Segment>> MemorySegmentStore::add_segment(std::vector<u8>&& bytes)
{
  if (bytes.size() > static_cast<usize>(this->options_.max_segment_size())) {
    return make_status(StatusCode::kSegmentTooLarge);
  }

  const SegmentId* segment_id = this->tracker_.new_data_segment_id();

  return this->add_segment(segment_id->uuid(), std::move(bytes));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<const Segment>> MemorySegmentStore::add_segment(
    const boost::uuids::uuid& uuid, std::vector<u8>&& bytes)
{
  if (bytes.size() > static_cast<usize>(this->options_.max_segment_size())) {
    return make_status(StatusCode::kSegmentTooLarge);
  }

  const SegmentId* segment_id = this->tracker_.get_segment_id(uuid);

  auto locked = this->segments_.lock();

  std::shared_ptr<const Segment>& slot = (*locked)[segment_id];
  if (slot != nullptr) {
    return make_status(StatusCode::kDuplicateSegment);
  }
  slot = std::make_shared<const Segment>(*segment_id, std::move(bytes));

  SEGSTORE_VLOG(1) << "Added " << *slot;

  return slot;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize MemorySegmentStore::segment_count() const
{
  return this->segments_.lock()->size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MemorySegmentStore::install_relocation_index(std::shared_ptr<const RelocationIndex> index)
{
  BATT_CHECK(index != nullptr);

  const usize index_size = index->size();
  {
    auto locked = this->relocation_index_.lock();
    *locked = std::move(index);
  }

  if (this->options_.verbose_relocation_log) {
    SEGSTORE_LOG_INFO() << "Installed relocation index;" << BATT_INSPECT(index_size);
  } else {
    SEGSTORE_VLOG(1) << "Installed relocation index;" << BATT_INSPECT(index_size);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::shared_ptr<const RelocationIndex> MemorySegmentStore::clear_relocation_index()
{
  std::shared_ptr<const RelocationIndex> prev_index;
  {
    auto locked = this->relocation_index_.lock();
    prev_index = std::move(*locked);
    *locked = nullptr;
  }

  if (this->options_.verbose_relocation_log) {
    SEGSTORE_LOG_INFO() << "Cleared relocation index;" << BATT_INSPECT(prev_index != nullptr);
  } else {
    SEGSTORE_VLOG(1) << "Cleared relocation index;" << BATT_INSPECT(prev_index != nullptr);
  }

  return prev_index;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::shared_ptr<const RelocationIndex> MemorySegmentStore::relocation_index() const
{
  return *this->relocation_index_.lock();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<const Segment>> MemorySegmentStore::resolve_segment(
    const SegmentId& segment_id) const
{
  auto locked = this->segments_.lock();

  auto iter = locked->find(&segment_id);
  if (iter == locked->end()) {
    return make_status(StatusCode::kSegmentNotFound);
  }
  return iter->second;
}

}  // namespace segstore
