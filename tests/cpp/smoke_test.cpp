#include <gtest/gtest.h>
#include "netdispatch/core/algorithms.hpp"
#include "netdispatch/core/dispatcher.hpp"
#include "netdispatch/core/graph.hpp"

using namespace netdispatch::core;

TEST(DispatchSmoke, GlobalDispatcherReady) {
  Dispatcher& d = Dispatcher::global();
  EXPECT_EQ(&d, &Dispatcher::global());
  EXPECT_TRUE(d.algorithms().contains("shortest_path_lengths"));
  EXPECT_TRUE(d.plugins().has(kLoopbackBackend));

  std::vector<NodeId> src = {0, 1};
  std::vector<NodeId> dst = {1, 2};
  auto g = Graph::from_arrays(3, src, dst);
  Value out = d.call("edge_count", {Value(GraphPtr(g))});
  EXPECT_EQ(std::get<std::int64_t>(out), 2);
}
