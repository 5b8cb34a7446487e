/*
  Dispatcher: owns the registries and configuration of one dispatch domain
  and is the registration API for algorithm authors.

  Dispatcher::global() is the process-wide instance. Tests build their own
  instances to stay isolated. Not synchronized: register algorithms and
  backends during initialization, before concurrent calls begin.
*/
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "netdispatch/core/algorithm_registry.hpp"
#include "netdispatch/core/dispatch_config.hpp"
#include "netdispatch/core/dispatchable.hpp"
#include "netdispatch/core/plugin_registry.hpp"

namespace netdispatch::core {

class Dispatcher {
public:
  // Plugins come from the process-wide registration table.
  Dispatcher();
  explicit Dispatcher(PluginRegistry::Source source);
  ~Dispatcher() noexcept = default;

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  [[nodiscard]] PluginRegistry& plugins() noexcept { return plugins_; }
  [[nodiscard]] const AlgorithmRegistry& algorithms() const noexcept { return algorithms_; }
  [[nodiscard]] DispatchConfig& config() noexcept { return *config_; }

  // Wrap `native` and register it under opts.name, or `func_name` when no
  // override is given.
  Dispatchable& register_algorithm(std::string func_name, Signature sig,
                                   AlgorithmFn native, DispatchOptions opts = {});

  // Call a registered algorithm by name. Unknown names fail with
  // RegistrationError.
  Value call(std::string_view name, const Args& args, const Kwargs& kwargs = {}) const;

  // Give the forced backend (if any) a chance to mark test cases as expected
  // failures.
  void mark_tests(std::vector<TestItem>& items);

  // Builtin algorithms, loopback backend, and environment config applied.
  static Dispatcher& global();

private:
  PluginRegistry plugins_;
  AlgorithmRegistry algorithms_;
  std::unique_ptr<DispatchConfig> config_;
};

} // namespace netdispatch::core
