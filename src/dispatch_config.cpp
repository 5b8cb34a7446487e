#include "netdispatch/core/dispatch_config.hpp"

#include <cstdlib>
#include <set>
#include <sstream>

#include "netdispatch/core/algorithm_registry.hpp"
#include "netdispatch/core/plugin_registry.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

namespace {
const std::set<std::string> kKnownWarnings = {"cache"};

std::string joined_repr(const std::set<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += "'" + n + "'";
  }
  return out;
}

// Validate a list of backend names; "native" is always accepted.
void check_backend_list(const std::string& key, const ConfigValue& value,
                        const PluginRegistry& plugins) {
  const auto* names = std::get_if<std::vector<std::string>>(&value);
  if (names == nullptr) {
    throw ConfigTypeError("'" + key + "' config must be a list of backend names; got " +
                          config_repr(value));
  }
  std::set<std::string> missing;
  for (const auto& n : *names) {
    if (n != kNativeBackend && !plugins.has(n)) missing.insert(n);
  }
  if (!missing.empty()) {
    throw ConfigValueError("Unknown backend when setting '" + key + "': " + joined_repr(missing));
  }
}

std::vector<std::string> split_list(const char* raw) {
  std::vector<std::string> out;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto b = item.find_first_not_of(" \t");
    if (b == std::string::npos) continue;
    auto e = item.find_last_not_of(" \t");
    out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}
} // namespace

BackendPriorities::BackendPriorities(const PluginRegistry& plugins,
                                     const AlgorithmRegistry& algorithms)
    : FlexibleConfig("BackendPriorities"), plugins_(&plugins), algorithms_(&algorithms) {
  declare("algos", std::vector<std::string>{});
  declare("generators", std::vector<std::string>{});
}

std::unique_ptr<Config> BackendPriorities::reconstruct(const ConfigMap& values) const {
  auto out = std::make_unique<BackendPriorities>(*plugins_, *algorithms_);
  for (const auto& [key, value] : values) out->set(key, value);
  return out;
}

ConfigValue BackendPriorities::on_set(const std::string& key, ConfigValue value) const {
  if (key != "algos" && key != "generators" && !algorithms_->contains(key)) {
    throw ConfigKeyError("Invalid config name: '" + key + "'");
  }
  check_backend_list(key, value, *plugins_);
  return value;
}

void BackendPriorities::on_erase(const std::string& key) {
  if (key == "algos" || key == "generators") {
    throw ConfigTypeError("'" + key + "' configuration item can't be deleted.");
  }
}

DispatchConfig::DispatchConfig(const PluginRegistry& plugins, const AlgorithmRegistry& algorithms)
    : StrictConfig("DispatchConfig"), plugins_(&plugins), algorithms_(&algorithms) {
  declare("backend", std::monostate{});
  declare("backend_priority", std::make_shared<BackendPriorities>(plugins, algorithms));
  declare("backends", std::make_shared<FlexibleConfig>("BackendConfigs"));
  declare("cache_converted_graphs", true);
  declare("warnings", std::set<std::string>{"cache"});
}

std::unique_ptr<Config> DispatchConfig::reconstruct(const ConfigMap& values) const {
  auto out = std::make_unique<DispatchConfig>(*plugins_, *algorithms_);
  for (const auto& [key, value] : values) out->set(key, value);
  return out;
}

ConfigValue DispatchConfig::on_set(const std::string& key, ConfigValue value) const {
  if (key == "backend") {
    if (std::holds_alternative<std::monostate>(value)) return value;
    const auto* name = std::get_if<std::string>(&value);
    if (name == nullptr) {
      throw ConfigTypeError("'backend' config must be a backend name or None; got " +
                            config_repr(value));
    }
    if (!plugins_->has(*name)) {
      throw ConfigValueError("Unknown backend when setting 'backend': " + *name);
    }
    return value;
  }
  if (key == "backend_priority") {
    // A plain list replaces `algos` on a copy, leaving the current object
    // intact for any snapshot that still refers to it.
    if (std::holds_alternative<std::vector<std::string>>(value)) {
      std::shared_ptr<Config> updated = backend_priority()->reconstruct(backend_priority()->to_map());
      updated->set("algos", value);
      return updated;
    }
    const auto* cfg = std::get_if<ConfigPtr>(&value);
    if (cfg == nullptr || !std::dynamic_pointer_cast<BackendPriorities>(*cfg)) {
      throw ConfigTypeError("'backend_priority' config must be a list of backend names; got " +
                            config_repr(value));
    }
    return value;
  }
  if (key == "backends") {
    const auto* cfg = std::get_if<ConfigPtr>(&value);
    if (cfg == nullptr || !*cfg) {
      throw ConfigTypeError("'backends' config must be a Config of backend configs; got " +
                            config_repr(value));
    }
    std::set<std::string> missing;
    for (const auto& [name, sub] : (*cfg)->items()) {
      if (!std::holds_alternative<ConfigPtr>(sub)) {
        throw ConfigTypeError("'backends' config must be a Config of backend configs; got " +
                              config_repr(value));
      }
      if (!plugins_->has(name)) missing.insert(name);
    }
    if (!missing.empty()) {
      throw ConfigValueError("Unknown backend when setting 'backends': " + joined_repr(missing));
    }
    return value;
  }
  if (key == "cache_converted_graphs") {
    if (!std::holds_alternative<bool>(value)) {
      throw ConfigTypeError("'cache_converted_graphs' config must be True or False; got " +
                            config_repr(value));
    }
    return value;
  }
  if (key == "warnings") {
    std::set<std::string> names;
    if (const auto* s = std::get_if<std::set<std::string>>(&value)) {
      names = *s;
    } else if (const auto* v = std::get_if<std::vector<std::string>>(&value)) {
      names.insert(v->begin(), v->end());
    } else {
      throw ConfigTypeError("'warnings' config must be a set of warning names; got " +
                            config_repr(value));
    }
    std::set<std::string> unknown;
    for (const auto& n : names) {
      if (kKnownWarnings.count(n) == 0) unknown.insert(n);
    }
    if (!unknown.empty()) {
      throw ConfigValueError("Unknown warning when setting 'warnings': " + joined_repr(unknown) +
                             ". Valid entries: cache");
    }
    return names;
  }
  return value;
}

std::optional<std::string> DispatchConfig::forced_backend() const {
  ConfigValue v = get("backend");
  if (const auto* s = std::get_if<std::string>(&v)) return *s;
  return std::nullopt;
}

std::shared_ptr<Config> DispatchConfig::backend_priority() const {
  return get_as<ConfigPtr>("backend_priority");
}

std::vector<std::string> DispatchConfig::priority_for(std::string_view algorithm,
                                                      bool returns_graph) const {
  auto bp = backend_priority();
  if (bp->contains(algorithm)) {
    return bp->get_as<std::vector<std::string>>(algorithm);
  }
  return bp->get_as<std::vector<std::string>>(returns_graph ? "generators" : "algos");
}

bool DispatchConfig::cache_converted_graphs() const {
  return get_as<bool>("cache_converted_graphs");
}

bool DispatchConfig::warning_enabled(std::string_view category) const {
  auto enabled = get_as<std::set<std::string>>("warnings");
  return enabled.count(std::string(category)) > 0;
}

void load_config_from_environment(DispatchConfig& cfg) {
  if (const char* forced = std::getenv("NETDISPATCH_GRAPH_CONVERT"); forced && *forced) {
    cfg.set("backend", std::string(forced));
  }
  if (const char* priority = std::getenv("NETDISPATCH_BACKEND_PRIORITY")) {
    cfg.set("backend_priority", split_list(priority));
  }
  if (const char* cache = std::getenv("NETDISPATCH_CACHE_CONVERTED_GRAPHS")) {
    cfg.set("cache_converted_graphs", *cache != '\0');
  }
  if (const char* warnings = std::getenv("NETDISPATCH_WARNINGS")) {
    auto names = split_list(warnings);
    cfg.set("warnings", std::set<std::string>(names.begin(), names.end()));
  }
}

} // namespace netdispatch::core
