/* Native directed multigraph with CSR adjacency and named attribute columns. */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

// ConversionCache: capability of a graph that keeps converted copies of itself,
// keyed by backend name and conversion identity. Entries are owned by the
// source graph; a converted graph that referenced its source would keep both
// alive forever.
class ConversionCache {
public:
  virtual ~ConversionCache() noexcept = default;

  [[nodiscard]] GraphPtr cached_conversion(std::string_view backend, const std::string& key) const;
  void store_conversion(std::string backend, std::string key, GraphPtr converted);
  void clear_conversions() noexcept { conversions_.clear(); }
  [[nodiscard]] std::size_t num_conversions() const noexcept { return conversions_.size(); }

private:
  std::map<std::pair<std::string, std::string>, GraphPtr> conversions_;
};

// Notes on edge identifiers:
// - EdgeId refers to the index of an edge in the graph's compacted
//   representation. Edges are stably reordered by (src, dst) during
//   construction; attribute columns are permuted with them.
// - Attribute values may be missing (std::nullopt) per node/edge.
//
// Topology is immutable. Attributes may change; every change clears the
// conversion cache so stale backend copies are never reused.
class Graph final : public GraphBase, public ConversionCache {
  // Restricts construction to the factories below.
  struct Token {
    explicit Token() = default;
  };

public:
  explicit Graph(Token) {}

  using AttrColumn = std::vector<std::optional<double>>;
  using AttrColumns = std::map<std::string, AttrColumn, std::less<>>;

  [[nodiscard]] static std::shared_ptr<Graph> from_arrays(
      std::int32_t num_nodes,
      std::span<const NodeId> src,
      std::span<const NodeId> dst,
      const AttrColumns& edge_attrs = {},
      const AttrColumns& node_attrs = {});

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(src_.size()); }

  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }

  [[nodiscard]] const AttrColumns& edge_attrs() const noexcept { return edge_attrs_; }
  [[nodiscard]] const AttrColumns& node_attrs() const noexcept { return node_attrs_; }
  [[nodiscard]] std::optional<double> edge_attr(EdgeId e, std::string_view name) const;
  [[nodiscard]] std::optional<double> node_attr(NodeId v, std::string_view name) const;

  void set_edge_attr(EdgeId e, std::string_view name, double value);
  void set_node_attr(NodeId v, std::string_view name, double value);

  [[nodiscard]] bool has_edge(NodeId u, NodeId v) const noexcept;

  // Copy of the topology carrying only the selected attributes. With
  // preserve=true every attribute of that kind is kept; otherwise only the
  // listed ones, with missing values filled from their defaults (a None
  // default leaves them missing).
  [[nodiscard]] std::shared_ptr<Graph> with_attributes(
      const std::optional<AttrMap>& edge_attrs, bool preserve_edge_attrs,
      const std::optional<AttrMap>& node_attrs, bool preserve_node_attrs) const;

private:
  std::int32_t num_nodes_ {0};
  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  AttrColumns edge_attrs_ {};
  AttrColumns node_attrs_ {};

  // CSR adjacency for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {}; // map CSR entry -> EdgeId
};

using NativeGraphPtr = std::shared_ptr<Graph>;

} // namespace netdispatch::core
