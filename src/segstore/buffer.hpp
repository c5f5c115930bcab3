//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_BUFFER_HPP
#define SEGSTORE_BUFFER_HPP

#include <segstore/int_types.hpp>

#include <batteries/buffer.hpp>

namespace segstore {

using batt::ConstBuffer;
using batt::MutableBuffer;

}  // namespace segstore

#endif  // SEGSTORE_BUFFER_HPP
