//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_INT_TYPES_HPP
#define SEGSTORE_INT_TYPES_HPP

#include <batteries/int_types.hpp>

#include <boost/endian/arithmetic.hpp>

namespace segstore {

namespace int_types {

using namespace batt::int_types;

using big_u32 = boost::endian::big_uint32_t;
using big_u64 = boost::endian::big_uint64_t;

using big_i32 = boost::endian::big_int32_t;
using big_i64 = boost::endian::big_int64_t;

using little_u8 = boost::endian::little_uint8_t;
using little_u16 = boost::endian::little_uint16_t;
using little_u32 = boost::endian::little_uint32_t;
using little_u64 = boost::endian::little_uint64_t;

using little_i32 = boost::endian::little_int32_t;
using little_i64 = boost::endian::little_int64_t;

}  // namespace int_types

using namespace int_types;

}  // namespace segstore

#endif  // SEGSTORE_INT_TYPES_HPP
