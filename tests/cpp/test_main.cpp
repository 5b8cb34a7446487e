/*
  Test main: with NETDISPATCH_GRAPH_CONVERT=<backend> every replay test runs
  through that backend. The backend may mark tests as known failures before
  the run; those are filtered out. Calls that hit a backend gap at run time
  skip their test (NETDISPATCH_RUN_OR_SKIP).
*/
#include <gtest/gtest.h>
#include <iostream>
#include <stdexcept>
#include "netdispatch/core/logging.hpp"
#include "test_utils.hpp"

using namespace netdispatch::core;
using namespace netdispatch::core::test;

namespace {
NETDISPATCH_REGISTER_BACKEND(partial, "partial", &make_partial_backend);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  netdispatch::init_logging(std::nullopt);

  std::vector<TestItem> items = registered_tests();
  try {
    make_replay_dispatcher()->mark_tests(items);
  } catch (const std::runtime_error& e) {
    std::cerr << "cannot prepare the test run: " << e.what() << '\n';
    return 1;
  }
  for (const auto& item : items) {
    if (item.xfail_reason) {
      NETDISPATCH_LOG(INFO) << "expected failure, not run: " << item.name << " (" << *item.xfail_reason
                            << ")";
    }
  }
  GTEST_FLAG_SET(filter, exclude_from_filter(GTEST_FLAG_GET(filter), items));
  return RUN_ALL_TESTS();
}
