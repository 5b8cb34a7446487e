/*
  shortest_paths: Dijkstra over a Graph with edge weights read from a named
  attribute column.

  Parallel edges are grouped by the CSR ordering; only the cheapest edge of
  each (u, v) group relaxes v.
*/
#include "netdispatch/core/algorithms.hpp"

#include <cstdint>
#include <limits>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace netdispatch::core {

std::vector<double> shortest_path_lengths(
    const Graph& g, NodeId src, const std::optional<std::string>& weight) {
  const auto N = g.num_nodes();
  if (src < 0 || src >= N) {
    throw std::out_of_range("shortest_path_lengths: source out of range");
  }
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aei = g.adj_edge_index_view();

  // Per-edge cost; missing weights count as 1.
  std::vector<double> cost(static_cast<std::size_t>(g.num_edges()), 1.0);
  if (weight) {
    auto it = g.edge_attrs().find(*weight);
    if (it != g.edge_attrs().end()) {
      for (std::size_t e = 0; e < cost.size(); ++e) {
        cost[e] = it->second[e].value_or(1.0);
        if (cost[e] < 0.0) {
          throw std::invalid_argument("shortest_path_lengths: negative edge weight");
        }
      }
    }
  }

  const double inf = std::numeric_limits<double>::infinity();
  std::vector<double> dist(static_cast<std::size_t>(N), inf);
  dist[static_cast<std::size_t>(src)] = 0.0;

  using QItem = std::pair<double, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  pq.emplace(0.0, src);

  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    if (d_u > dist[static_cast<std::size_t>(u)]) continue;
    auto start = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
    auto end   = static_cast<std::size_t>(row[static_cast<std::size_t>(u) + 1]);
    std::size_t i = start;
    while (i < end) {
      NodeId v = col[i];
      double min_edge_cost = inf;
      std::size_t j = i;
      for (; j < end && col[j] == v; ++j) {
        const double c = cost[static_cast<std::size_t>(aei[j])];
        if (c < min_edge_cost) min_edge_cost = c;
      }
      const double new_cost = d_u + min_edge_cost;
      auto v_idx = static_cast<std::size_t>(v);
      if (new_cost < dist[v_idx]) {
        dist[v_idx] = new_cost;
        pq.emplace(new_cost, v);
      }
      i = j;
    }
  }
  return dist;
}

} // namespace netdispatch::core
