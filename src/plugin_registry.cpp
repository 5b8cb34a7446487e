#include "netdispatch/core/plugin_registry.hpp"

#include <algorithm>
#include <exception>

#include "netdispatch/core/error.hpp"
#include "netdispatch/core/logging.hpp"

namespace netdispatch::core {

namespace {
std::vector<PluginDescriptor>& plugin_table() {
  static std::vector<PluginDescriptor> table;
  return table;
}

bool has_name(const std::vector<PluginDescriptor>& v, std::string_view name) {
  return std::any_of(v.begin(), v.end(), [&](const auto& d) { return d.name == name; });
}
} // namespace

void register_backend_plugin(std::string name, BackendLoader loader) {
  auto& table = plugin_table();
  if (has_name(table, name)) {
    throw RegistrationError("backend plugin registered twice: '" + name + "'");
  }
  table.push_back(PluginDescriptor{std::move(name), std::move(loader)});
}

std::vector<PluginDescriptor> registered_backend_plugins() {
  return plugin_table();
}

PluginRegistry::PluginRegistry() : PluginRegistry(&registered_backend_plugins) {}

PluginRegistry::PluginRegistry(Source source) : source_(std::move(source)) {}

const std::vector<PluginDescriptor>& PluginRegistry::entries() const {
  if (!entries_) {
    entries_ = source_ ? source_() : std::vector<PluginDescriptor>{};
  }
  return *entries_;
}

bool PluginRegistry::has(std::string_view name) const {
  return has_name(entries(), name);
}

const PluginDescriptor& PluginRegistry::get(std::string_view name) const {
  const auto& all = entries();
  auto it = std::find_if(all.begin(), all.end(), [&](const auto& d) { return d.name == name; });
  if (it == all.end()) {
    throw BackendUnavailableError("'" + std::string(name) + "' backend is not installed");
  }
  return *it;
}

std::vector<std::string> PluginRegistry::names() const {
  std::vector<std::string> out;
  for (const auto& d : entries()) out.push_back(d.name);
  return out;
}

void PluginRegistry::add(std::string name, BackendLoader loader) {
  entries();
  if (has_name(*entries_, name)) {
    throw RegistrationError("backend plugin registered twice: '" + name + "'");
  }
  entries_->push_back(PluginDescriptor{std::move(name), std::move(loader)});
}

BackendPtr PluginRegistry::load(std::string_view name) {
  if (auto it = loaded_.find(name); it != loaded_.end()) return it->second;
  const PluginDescriptor& desc = get(name);
  const std::string key(name);
  BackendPtr backend;
  try {
    backend = desc.loader ? desc.loader() : nullptr;
  } catch (const std::exception& e) {
    NETDISPATCH_LOG(WARNING) << "failed to load backend '" << key << "': " << e.what();
    throw BackendUnavailableError("Unable to load backend '" + key + "': " + e.what());
  }
  if (!backend) {
    NETDISPATCH_LOG(WARNING) << "backend '" << key << "' loader returned no backend";
    throw BackendUnavailableError("Unable to load backend '" + key + "': loader returned null");
  }
  NETDISPATCH_LOG(INFO) << "loaded backend '" << key << "'";
  loaded_.emplace(key, backend);
  return backend;
}

bool PluginRegistry::is_loaded(std::string_view name) const noexcept {
  return loaded_.find(name) != loaded_.end();
}

} // namespace netdispatch::core
