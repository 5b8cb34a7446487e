#include "netdispatch/core/algorithms.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "netdispatch/core/dispatcher.hpp"
#include "netdispatch/core/error.hpp"
#include "netdispatch/core/signature.hpp"

namespace netdispatch::core {

NativeGraphPtr intersection(const Graph& g, const Graph& h) {
  const std::int32_t n = std::max(g.num_nodes(), h.num_nodes());
  std::set<std::pair<NodeId, NodeId>> in_h;
  const auto hs = h.edge_src_view();
  const auto hd = h.edge_dst_view();
  for (std::size_t e = 0; e < hs.size(); ++e) in_h.emplace(hs[e], hd[e]);

  std::vector<NodeId> src;
  std::vector<NodeId> dst;
  const auto gs = g.edge_src_view();
  const auto gd = g.edge_dst_view();
  for (std::size_t e = 0; e < gs.size(); ++e) {
    // Each (u, v) pair appears once in the result.
    if (in_h.erase({gs[e], gd[e]}) > 0) {
      src.push_back(gs[e]);
      dst.push_back(gd[e]);
    }
  }
  return Graph::from_arrays(n, src, dst);
}

double total_node_weight(const Graph& g, const std::string& weight, double default_value) {
  double total = 0.0;
  for (NodeId v = 0; v < g.num_nodes(); ++v) {
    total += g.node_attr(v, weight).value_or(default_value);
  }
  return total;
}

std::int64_t edge_count(const Graph& g, const Graph* h) {
  std::int64_t n = g.num_edges();
  if (h != nullptr) n += h->num_edges();
  return n;
}

namespace {
// Native implementations accept only native graphs.
const Graph& native_graph(const BoundArguments& b, std::string_view name, std::string_view algo) {
  const auto& ptr = b.get<GraphPtr>(name);
  const auto* g = dynamic_cast<const Graph*>(ptr.get());
  if (g == nullptr) {
    throw ArgumentResolutionError(std::string(algo) + "() argument '" + std::string(name) +
                                  "' is not a native graph");
  }
  return *g;
}

std::optional<std::string> optional_name(const BoundArguments& b, std::string_view name) {
  const Value& v = b.at(name);
  if (is_none(v)) return std::nullopt;
  return b.get<std::string>(name);
}

double number(const BoundArguments& b, std::string_view name) {
  auto d = as_double(b.at(name));
  if (!d) {
    throw ArgumentResolutionError("argument '" + std::string(name) + "' must be a number, got " +
                                  repr(b.at(name)));
  }
  return *d;
}
} // namespace

void register_builtin_algorithms(Dispatcher& dispatcher) {
  {
    Signature sig{{"G"}, {"source"}, {"weight", Value(std::string("weight"))}};
    DispatchOptions opts;
    opts.edge_attrs = "weight";
    dispatcher.register_algorithm(
        "shortest_path_lengths", sig,
        make_algorithm("shortest_path_lengths", sig, [](const BoundArguments& b) -> Value {
          const Graph& g = native_graph(b, "G", "shortest_path_lengths");
          const std::int64_t src = b.get<std::int64_t>("source");
          if (src < 0 || src >= g.num_nodes()) {
            throw std::out_of_range("shortest_path_lengths: source out of range");
          }
          return shortest_path_lengths(g, static_cast<NodeId>(src), optional_name(b, "weight"));
        }),
        std::move(opts));
  }
  {
    Signature sig{{"G"}, {"H"}};
    DispatchOptions opts;
    opts.graphs = GraphArgumentSpec{{"G", 0}, {"H", 1}};
    opts.preserve_edge_attrs = true;
    opts.preserve_node_attrs = true;
    opts.returns_graph = true;
    dispatcher.register_algorithm(
        "intersection", sig,
        make_algorithm("intersection", sig, [](const BoundArguments& b) -> Value {
          return GraphPtr(intersection(native_graph(b, "G", "intersection"),
                                       native_graph(b, "H", "intersection")));
        }),
        std::move(opts));
  }
  {
    Signature sig{{"G"}, {"weight", Value(std::string("weight"))}, {"default", Value(0.0)}};
    DispatchOptions opts;
    opts.node_attrs = AttrSpec::mapping({{arg("weight"), arg("default")}});
    dispatcher.register_algorithm(
        "total_node_weight", sig,
        make_algorithm("total_node_weight", sig, [](const BoundArguments& b) -> Value {
          const Graph& g = native_graph(b, "G", "total_node_weight");
          auto weight = optional_name(b, "weight");
          if (!weight) return number(b, "default") * g.num_nodes();
          return total_node_weight(g, *weight, number(b, "default"));
        }),
        std::move(opts));
  }
  {
    Signature sig{{"G"}, {"H", Value()}};
    DispatchOptions opts;
    opts.graphs = GraphArgumentSpec{{"G", 0}, {"H?", 1}};
    dispatcher.register_algorithm(
        "edge_count", sig,
        make_algorithm("edge_count", sig, [](const BoundArguments& b) -> Value {
          const Graph& g = native_graph(b, "G", "edge_count");
          const Graph* h = is_none(b.at("H")) ? nullptr : &native_graph(b, "H", "edge_count");
          return edge_count(g, h);
        }),
        std::move(opts));
  }
}

} // namespace netdispatch::core
