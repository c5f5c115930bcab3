//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_UUID_HPP
#define SEGSTORE_UUID_HPP

#include <segstore/int_types.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstring>

namespace segstore {

inline decltype(auto) random_uuid()
{
  thread_local boost::uuids::random_generator g;
  return g();
}

// The high and low halves of a uuid, each read as a big-endian signed 64-bit integer.
//
inline i64 uuid_most_significant_bits(const boost::uuids::uuid& uuid)
{
  big_i64 bits;
  std::memcpy(&bits, uuid.begin(), sizeof(bits));
  return bits;
}

inline i64 uuid_least_significant_bits(const boost::uuids::uuid& uuid)
{
  big_i64 bits;
  std::memcpy(&bits, uuid.begin() + sizeof(bits), sizeof(bits));
  return bits;
}

inline boost::uuids::uuid uuid_from_bits(i64 msb, i64 lsb)
{
  const big_i64 hi = msb;
  const big_i64 lo = lsb;

  boost::uuids::uuid uuid;
  std::memcpy(uuid.begin(), &hi, sizeof(hi));
  std::memcpy(uuid.begin() + sizeof(hi), &lo, sizeof(lo));
  return uuid;
}

}  // namespace segstore

#endif  // SEGSTORE_UUID_HPP
