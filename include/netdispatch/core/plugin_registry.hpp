/*
  PluginRegistry: lazy, name-keyed discovery and loading of backends.

  Backends announce themselves at startup through the process-wide
  registration table:

    NETDISPATCH_REGISTER_BACKEND(sparse, "sparse", [] { return make_sparse_backend(); });

  A registry reads that table once, on first use, and loads a backend only
  when a call needs it. Loaded backends are cached for the registry's
  lifetime. Not synchronized; register during initialization.
*/
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "netdispatch/core/backend.hpp"

namespace netdispatch::core {

using BackendLoader = std::function<BackendPtr()>;

struct PluginDescriptor {
  std::string name;
  BackendLoader loader;
};

class PluginRegistry {
public:
  using Source = std::function<std::vector<PluginDescriptor>()>;

  // Reads the process-wide registration table.
  PluginRegistry();
  explicit PluginRegistry(Source source);

  [[nodiscard]] bool has(std::string_view name) const;
  // Fails with BackendUnavailableError for unknown names.
  [[nodiscard]] const PluginDescriptor& get(std::string_view name) const;
  [[nodiscard]] const std::vector<PluginDescriptor>& entries() const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] bool empty() const { return entries().empty(); }

  // Add one entry to this registry. Duplicate names fail with RegistrationError.
  void add(std::string name, BackendLoader loader);

  // Load (once) and return the backend. Failures raise BackendUnavailableError
  // and are not cached.
  BackendPtr load(std::string_view name);
  [[nodiscard]] bool is_loaded(std::string_view name) const noexcept;

private:
  Source source_;
  mutable std::optional<std::vector<PluginDescriptor>> entries_ {};
  std::map<std::string, BackendPtr, std::less<>> loaded_ {};
};

// Process-wide registration entry point used by backends.
void register_backend_plugin(std::string name, BackendLoader loader);
[[nodiscard]] std::vector<PluginDescriptor> registered_backend_plugins();

// Static registrar for use at namespace scope in a backend's source file.
struct BackendRegistrar {
  BackendRegistrar(std::string name, BackendLoader loader) {
    register_backend_plugin(std::move(name), std::move(loader));
  }
};

} // namespace netdispatch::core

#define NETDISPATCH_REGISTER_BACKEND(ident, name, loader) \
  static ::netdispatch::core::BackendRegistrar netdispatch_backend_registrar_##ident(name, loader)
