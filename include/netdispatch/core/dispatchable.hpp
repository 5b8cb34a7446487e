/*
  Dispatchable: the dispatch wrapper around one native algorithm.

  Each call decides where the algorithm runs:
    1. forced backend in the config   -> conversion harness (convert in,
                                         run backend, convert result back)
    2. explicit `backend=` keyword    -> that backend (or native)
    3. backend-tagged graph arguments -> the owning backend, args unchanged
    4. backend priority list          -> first backend implementing it
    5. otherwise                      -> native implementation
*/
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "netdispatch/core/attr_spec.hpp"
#include "netdispatch/core/backend.hpp"
#include "netdispatch/core/graph_spec.hpp"
#include "netdispatch/core/signature.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

class PluginRegistry;
class DispatchConfig;

// Registration options. Defaults describe an algorithm whose first
// parameter `G` is its only graph.
struct DispatchOptions {
  std::optional<std::string> name {};  // override the function's own name
  GraphArgumentSpec graphs {"G"};
  AttrSpec edge_attrs {};
  AttrSpec node_attrs {};
  PreserveSpec preserve_edge_attrs {};
  PreserveSpec preserve_node_attrs {};
  bool returns_graph {false};          // selects the `generators` priority list
};

class Dispatchable {
public:
  // Fails with RegistrationError when a graph or attribute argument is not a
  // parameter of `sig`.
  Dispatchable(std::string name, Signature sig, AlgorithmFn native,
               DispatchOptions opts, PluginRegistry& plugins,
               const DispatchConfig& config);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const Signature& signature() const noexcept { return sig_; }
  [[nodiscard]] const GraphArgumentSpec& graphs() const noexcept { return opts_.graphs; }
  [[nodiscard]] const DispatchOptions& options() const noexcept { return opts_; }
  [[nodiscard]] const AlgorithmFn& native() const noexcept { return native_; }

  Value operator()(const Args& args, const Kwargs& kwargs = {}) const;

private:
  friend class AlgorithmRegistry;

  [[nodiscard]] Value call_backend(const std::string& backend_name,
                                   const Args& args, const Kwargs& kwargs) const;
  [[nodiscard]] Value call_converted(Backend& backend, const Args& args,
                                     const Kwargs& kwargs) const;
  [[nodiscard]] std::optional<Value> try_priority(const Args& args, const Kwargs& kwargs) const;

  // Forced-conversion mode; see conversion_harness.cpp.
  [[nodiscard]] Value run_conversion_harness(const std::string& backend_name,
                                             const Args& args, const Kwargs& kwargs) const;

  [[nodiscard]] ConversionSpec conversion_for(const BoundArguments& bound) const;
  [[nodiscard]] GraphPtr convert_graph(Backend& backend, const GraphPtr& graph,
                                       const ConversionSpec& spec, bool use_cache) const;
  [[nodiscard]] BackendPtr load_backend(std::string_view backend_name) const;
  [[nodiscard]] AlgorithmFn require_algorithm(const Backend& backend) const;

  std::string name_;
  Signature sig_;
  AlgorithmFn native_;
  DispatchOptions opts_;
  PluginRegistry* plugins_ {nullptr};
  const DispatchConfig* config_ {nullptr};
};

std::ostream& operator<<(std::ostream& os, const Dispatchable& d);

} // namespace netdispatch::core
