/*
  Graph: directed multigraph with deterministic layout.

  Construction from arrays validates inputs and compacts data into CSR
  adjacency using a stable (src, dst) ordering. Attribute columns follow the
  same permutation so EdgeIds stay consistent across topology and attributes.
*/
#include "netdispatch/core/graph.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace netdispatch::core {

GraphPtr ConversionCache::cached_conversion(std::string_view backend, const std::string& key) const {
  auto it = conversions_.find(std::make_pair(std::string(backend), key));
  return it == conversions_.end() ? nullptr : it->second;
}

void ConversionCache::store_conversion(std::string backend, std::string key, GraphPtr converted) {
  conversions_.insert_or_assign(std::make_pair(std::move(backend), std::move(key)), std::move(converted));
}

std::shared_ptr<Graph> Graph::from_arrays(
    std::int32_t num_nodes,
    std::span<const NodeId> src,
    std::span<const NodeId> dst,
    const AttrColumns& edge_attrs,
    const AttrColumns& node_attrs) {

  if (num_nodes < 0) {
    throw std::invalid_argument("num_nodes must be >= 0");
  }
  if (src.size() != dst.size()) {
    throw std::invalid_argument("src and dst must have the same length");
  }
  const std::size_t m = src.size();
  for (std::size_t i = 0; i < m; ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw std::out_of_range("edge index out of range of num_nodes");
    }
  }
  for (const auto& [name, col] : edge_attrs) {
    if (col.size() != m) {
      throw std::invalid_argument("edge attribute '" + name + "' must have one value per edge");
    }
  }
  for (const auto& [name, col] : node_attrs) {
    if (col.size() != static_cast<std::size_t>(num_nodes)) {
      throw std::invalid_argument("node attribute '" + name + "' must have one value per node");
    }
  }

  auto g = std::make_shared<Graph>(Token{});
  g->num_nodes_ = num_nodes;
  g->node_attrs_ = node_attrs;

  // Stable (src, dst) order keeps parallel edges in input order.
  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (src[a] != src[b]) return src[a] < src[b];
    return dst[a] < dst[b];
  });
  g->src_.resize(m);
  g->dst_.resize(m);
  for (std::size_t i = 0; i < m; ++i) {
    g->src_[i] = src[idx[i]];
    g->dst_[i] = dst[idx[i]];
  }
  for (const auto& [name, col] : edge_attrs) {
    AttrColumn permuted(m);
    for (std::size_t i = 0; i < m; ++i) permuted[i] = col[idx[i]];
    g->edge_attrs_.emplace(name, std::move(permuted));
  }

  // Build CSR adjacency
  g->row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g->row_offsets_[static_cast<std::size_t>(g->src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g->row_offsets_.size(); ++i) {
    g->row_offsets_[i] += g->row_offsets_[i - 1];
  }
  g->col_indices_.resize(m);
  g->adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = g->row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g->src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g->col_indices_[pos] = g->dst_[e];
    g->adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }
  return g;
}

std::optional<double> Graph::edge_attr(EdgeId e, std::string_view name) const {
  if (e < 0 || e >= num_edges()) throw std::out_of_range("edge id out of range");
  auto it = edge_attrs_.find(name);
  if (it == edge_attrs_.end()) return std::nullopt;
  return it->second[static_cast<std::size_t>(e)];
}

std::optional<double> Graph::node_attr(NodeId v, std::string_view name) const {
  if (v < 0 || v >= num_nodes_) throw std::out_of_range("node id out of range");
  auto it = node_attrs_.find(name);
  if (it == node_attrs_.end()) return std::nullopt;
  return it->second[static_cast<std::size_t>(v)];
}

void Graph::set_edge_attr(EdgeId e, std::string_view name, double value) {
  if (e < 0 || e >= num_edges()) throw std::out_of_range("edge id out of range");
  auto it = edge_attrs_.find(name);
  if (it == edge_attrs_.end()) {
    it = edge_attrs_.emplace(std::string(name), AttrColumn(src_.size())).first;
  }
  it->second[static_cast<std::size_t>(e)] = value;
  clear_conversions();
}

void Graph::set_node_attr(NodeId v, std::string_view name, double value) {
  if (v < 0 || v >= num_nodes_) throw std::out_of_range("node id out of range");
  auto it = node_attrs_.find(name);
  if (it == node_attrs_.end()) {
    it = node_attrs_.emplace(std::string(name), AttrColumn(static_cast<std::size_t>(num_nodes_))).first;
  }
  it->second[static_cast<std::size_t>(v)] = value;
  clear_conversions();
}

bool Graph::has_edge(NodeId u, NodeId v) const noexcept {
  if (u < 0 || u >= num_nodes_) return false;
  auto start = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto end = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  for (std::size_t i = start; i < end; ++i) {
    if (col_indices_[i] == v) return true;
  }
  return false;
}

namespace {
Graph::AttrColumns select_columns(const Graph::AttrColumns& all, std::size_t n,
                                  const std::optional<AttrMap>& wanted, bool preserve) {
  if (preserve) return all;
  Graph::AttrColumns out;
  if (!wanted) return out;
  for (const auto& [name, dflt] : *wanted) {
    std::optional<double> fill;
    if (!is_none(dflt)) {
      fill = as_double(dflt);
      if (!fill) {
        throw std::invalid_argument("attribute '" + name + "' needs a numeric default, got " +
                                    repr(dflt));
      }
    }
    auto it = all.find(name);
    Graph::AttrColumn col = it == all.end() ? Graph::AttrColumn(n) : it->second;
    for (auto& x : col) {
      if (!x) x = fill;
    }
    out.insert_or_assign(name, std::move(col));
  }
  return out;
}
} // namespace

std::shared_ptr<Graph> Graph::with_attributes(
    const std::optional<AttrMap>& edge_attrs, bool preserve_edge_attrs,
    const std::optional<AttrMap>& node_attrs, bool preserve_node_attrs) const {
  auto g = std::make_shared<Graph>(Token{});
  g->num_nodes_ = num_nodes_;
  g->src_ = src_;
  g->dst_ = dst_;
  g->row_offsets_ = row_offsets_;
  g->col_indices_ = col_indices_;
  g->adj_edge_index_ = adj_edge_index_;
  g->edge_attrs_ = select_columns(edge_attrs_, src_.size(), edge_attrs, preserve_edge_attrs);
  g->node_attrs_ = select_columns(node_attrs_, static_cast<std::size_t>(num_nodes_), node_attrs,
                                  preserve_node_attrs);
  return g;
}

} // namespace netdispatch::core
