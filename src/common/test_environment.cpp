#include <segstore/config.hpp>
#include <segstore/status_code.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

class SegStoreTestEnv : public testing::Environment
{
 public:
  SegStoreTestEnv() noexcept
  {
  }

  ~SegStoreTestEnv() override
  {
  }

  // Override this to define how to set up the environment.
  void SetUp() override
  {
    batt::EscapedStringLiteral::max_show_length() = 32;

    segstore::initialize_status_codes();
  }

  // Override this to define how to tear down the environment.
  void TearDown() override
  {
    segstore::suppress_log_output_for_test() = false;
  }
};

testing::Environment* const segstore_env =
    testing::AddGlobalTestEnvironment(new SegStoreTestEnv);

}  // namespace
