//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef SEGSTORE_STATUS_HPP
#define SEGSTORE_STATUS_HPP

#include <segstore/status_code.hpp>

#include <batteries/status.hpp>

namespace segstore {

using batt::OkStatus;
using batt::Status;
using batt::StatusOr;

}  // namespace segstore

#endif  // SEGSTORE_STATUS_HPP
