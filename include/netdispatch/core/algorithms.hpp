/* Native algorithms shipped with the library, and their dispatch registration. */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "netdispatch/core/graph.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

class Dispatcher;

// Dijkstra distances from src using the edge attribute `weight` (missing
// values count as 1). With no weight every edge costs 1. Unreachable nodes
// are +inf. Negative weights are rejected.
[[nodiscard]] std::vector<double> shortest_path_lengths(
    const Graph& g, NodeId src, const std::optional<std::string>& weight);

// Graph on max(N_g, N_h) nodes holding each (u, v) pair present in both.
[[nodiscard]] NativeGraphPtr intersection(const Graph& g, const Graph& h);

// Sum of node attribute `weight`, counting missing values as `default_value`.
[[nodiscard]] double total_node_weight(const Graph& g, const std::string& weight,
                                       double default_value);

// Edges in g, plus edges in h when given.
[[nodiscard]] std::int64_t edge_count(const Graph& g, const Graph* h);

// Registers shortest_path_lengths, intersection, total_node_weight and
// edge_count with their graph and attribute specs.
void register_builtin_algorithms(Dispatcher& dispatcher);

} // namespace netdispatch::core
