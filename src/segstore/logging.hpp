//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the SegStore Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef SEGSTORE_LOGGING_HPP
#define SEGSTORE_LOGGING_HPP

#include <segstore/config.hpp>

#include <glog/logging.h>

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

#define SEGSTORE_LOG_WARNING() LOG(WARNING)
#define SEGSTORE_LOG_INFO() LOG(INFO)
#define SEGSTORE_VLOG(verbosity) VLOG((verbosity))

//+++++++++++-+-+--+----- --- -- -  -  -   -

#define SEGSTORE_LOG_WARNING_IF(condition)                                                         \
  if (condition)                                                                                   \
  SEGSTORE_LOG_WARNING()

// Warnings about conditions that unit tests provoke on purpose; silenced by
// `suppress_log_output_for_test()`.
//
#define SEGSTORE_LOG_WARNING_UNLESS_SUPPRESSED()                                                   \
  SEGSTORE_LOG_WARNING_IF(!::segstore::suppress_log_output_for_test().load())

#endif  // SEGSTORE_LOGGING_HPP
