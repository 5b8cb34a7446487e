/*
  DispatchConfig: configuration consulted by every dispatch call.

  Keys:
    backend                 None, or an installed backend that every call is
                            forced through (conversion harness).
    backend_priority        BackendPriorities: `algos`, `generators`, and
                            optional per-algorithm lists of backend names.
    backends                per-backend configs, keyed by installed backend.
    cache_converted_graphs  keep converted graphs on the input graph.
    warnings                enabled warning categories (only "cache").

  `backend` is "hard": calls fail if the backend lacks an algorithm.
  `backend_priority` is "soft": backends that can't run an algorithm are
  skipped.
*/
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "netdispatch/core/config.hpp"

namespace netdispatch::core {

class PluginRegistry;
class AlgorithmRegistry;

class BackendPriorities final : public FlexibleConfig {
public:
  BackendPriorities(const PluginRegistry& plugins, const AlgorithmRegistry& algorithms);

  [[nodiscard]] std::unique_ptr<Config> reconstruct(const ConfigMap& values) const override;

protected:
  ConfigValue on_set(const std::string& key, ConfigValue value) const override;
  void on_erase(const std::string& key) override;

private:
  const PluginRegistry* plugins_;
  const AlgorithmRegistry* algorithms_;
};

class DispatchConfig final : public StrictConfig {
public:
  DispatchConfig(const PluginRegistry& plugins, const AlgorithmRegistry& algorithms);

  [[nodiscard]] std::optional<std::string> forced_backend() const;
  // Per-algorithm list if set, else `generators` for graph-returning
  // algorithms, else `algos`.
  [[nodiscard]] std::vector<std::string> priority_for(std::string_view algorithm,
                                                      bool returns_graph) const;
  [[nodiscard]] bool cache_converted_graphs() const;
  [[nodiscard]] bool warning_enabled(std::string_view category) const;
  [[nodiscard]] std::shared_ptr<Config> backend_priority() const;

  [[nodiscard]] std::unique_ptr<Config> reconstruct(const ConfigMap& values) const override;

protected:
  ConfigValue on_set(const std::string& key, ConfigValue value) const override;

private:
  const PluginRegistry* plugins_;
  const AlgorithmRegistry* algorithms_;
};

// Apply NETDISPATCH_GRAPH_CONVERT, NETDISPATCH_BACKEND_PRIORITY,
// NETDISPATCH_CACHE_CONVERTED_GRAPHS and NETDISPATCH_WARNINGS.
void load_config_from_environment(DispatchConfig& cfg);

} // namespace netdispatch::core
