//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <segstore/record_id.hpp>
//

#include <segstore/segment_tracker.hpp>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <charconv>
#include <sstream>

namespace segstore {

namespace {

constexpr usize kUuidStringLength = 36;

// True iff `str` has the canonical 8-4-4-4-12 hex layout; boost's string_generator accepts (and
// throws on) a much looser grammar, so we check before handing the string over.
//
bool is_canonical_uuid_string(std::string_view str)
{
  if (str.size() != kUuidStringLength) {
    return false;
  }
  for (usize i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const RecordId& t)
{
  return out << t.segment_id() << ":" << t.offset();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string to_string(const RecordId& record_id)
{
  std::ostringstream oss;
  oss << record_id;
  return std::move(oss).str();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<RecordId> parse_record_id(SegmentTracker& tracker, std::string_view str)
{
  const usize colon = str.rfind(':');
  if (colon == std::string_view::npos) {
    return make_status(StatusCode::kInvalidRecordIdString);
  }

  const std::string_view uuid_part = str.substr(0, colon);
  const std::string_view offset_part = str.substr(colon + 1);

  if (!is_canonical_uuid_string(uuid_part) || offset_part.empty()) {
    return make_status(StatusCode::kInvalidRecordIdString);
  }

  i32 offset = 0;
  const char* const offset_end = offset_part.data() + offset_part.size();
  const auto [parse_end, parse_error] = std::from_chars(offset_part.data(), offset_end, offset);

  if (parse_error != std::errc{} || parse_end != offset_end || offset < 0 ||
      offset >= kMaxSegmentSize) {
    return make_status(StatusCode::kInvalidRecordIdString);
  }

  const boost::uuids::uuid uuid =
      boost::uuids::string_generator{}(uuid_part.begin(), uuid_part.end());

  return RecordId{tracker.get_segment_id(uuid), offset};
}

}  // namespace segstore
