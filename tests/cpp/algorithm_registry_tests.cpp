#include <gtest/gtest.h>
#include <sstream>
#include "test_utils.hpp"

using namespace netdispatch::core;
using namespace netdispatch::core::test;

TEST(AlgorithmRegistry, BuiltinsRegisteredInOrder) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  EXPECT_EQ(d->algorithms().names(),
            (std::vector<std::string>{"shortest_path_lengths", "intersection",
                                      "total_node_weight", "edge_count"}));
  EXPECT_EQ(d->algorithms().size(), 4u);
}

TEST(AlgorithmRegistry, DuplicateNameRejected) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  register_count_nodes(*d);
  try {
    register_count_nodes(*d);
    FAIL() << "expected RegistrationError";
  } catch (const RegistrationError& e) {
    EXPECT_STREQ(e.what(), "Algorithm already exists in dispatch registry: count_nodes");
  }
  EXPECT_EQ(d->algorithms().size(), 5u);
}

TEST(AlgorithmRegistry, NameRoundTrip) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  Dispatchable& w = register_count_nodes(*d);
  EXPECT_EQ(w.name(), "count_nodes");
  EXPECT_EQ(d->algorithms().find(w.name()), &w);
  EXPECT_EQ(d->algorithms().find("nope"), nullptr);
  EXPECT_FALSE(d->algorithms().contains("nope"));
  const AlgorithmEntry* entry = d->algorithms().entry("count_nodes");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->wrapper.get(), &w);
  EXPECT_TRUE(static_cast<bool>(entry->native));
  std::ostringstream os;
  os << w;
  EXPECT_EQ(os.str(), "<dispatchable count_nodes>");
}

TEST(AlgorithmRegistry, NameOverrideWins) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  DispatchOptions opts;
  opts.name = "node_total";
  Dispatchable& w = register_count_nodes(*d, opts);
  EXPECT_EQ(w.name(), "node_total");
  EXPECT_FALSE(d->algorithms().contains("count_nodes"));
  auto g = make_line_graph(6);
  EXPECT_EQ(std::get<std::int64_t>(d->call("node_total", {graph_value(g)})), 6);
}

TEST(AlgorithmRegistry, SpecsCheckedAgainstSignature) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  Signature sig{{"G"}, {"weight", Value()}};
  AlgorithmFn fn = [](const Args&, const Kwargs&) -> Value { return Value(); };

  DispatchOptions wrong_graph;
  wrong_graph.graphs = "H";
  EXPECT_THROW(d->register_algorithm("a", sig, fn, wrong_graph), RegistrationError);

  DispatchOptions wrong_position;
  wrong_position.graphs = GraphArgumentSpec{{"G", 1}};
  EXPECT_THROW(d->register_algorithm("b", sig, fn, wrong_position), RegistrationError);

  DispatchOptions wrong_attr;
  wrong_attr.edge_attrs = "cost";
  EXPECT_THROW(d->register_algorithm("c", sig, fn, wrong_attr), RegistrationError);

  DispatchOptions wrong_preserve;
  wrong_preserve.preserve_node_attrs = "keep";
  EXPECT_THROW(d->register_algorithm("d", sig, fn, wrong_preserve), RegistrationError);

  EXPECT_THROW(d->register_algorithm("e", sig, AlgorithmFn{}), RegistrationError);
  EXPECT_FALSE(d->algorithms().contains("a"));
}

TEST(AlgorithmRegistry, UnknownAlgorithmCall) {
  StaticPlugins plugins;
  auto d = make_dispatcher(plugins);
  EXPECT_THROW((void)d->call("nope", {}), RegistrationError);
}
