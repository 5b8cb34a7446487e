#include "netdispatch/core/dispatchable.hpp"

#include <ostream>
#include <set>

#include "netdispatch/core/dispatch_config.hpp"
#include "netdispatch/core/error.hpp"
#include "netdispatch/core/graph.hpp"
#include "netdispatch/core/logging.hpp"
#include "netdispatch/core/plugin_registry.hpp"

namespace netdispatch::core {

namespace {
std::string tag_set_repr(const std::set<std::string>& tags) {
  std::string out = "{";
  for (const auto& t : tags) {
    if (out.size() > 1) out += ", ";
    out += "'" + t + "'";
  }
  return out + "}";
}

void require_parameter(const Signature& sig, const std::string& algorithm,
                       const std::string& what, const std::string& param) {
  if (!sig.contains(param)) {
    throw RegistrationError(algorithm + "(): " + what + " '" + param +
                            "' is not a parameter of the algorithm");
  }
}
} // namespace

Dispatchable::Dispatchable(std::string name, Signature sig, AlgorithmFn native,
                           DispatchOptions opts, PluginRegistry& plugins,
                           const DispatchConfig& config)
    : name_(std::move(name)), sig_(std::move(sig)), native_(std::move(native)),
      opts_(std::move(opts)), plugins_(&plugins), config_(&config) {
  if (!native_) {
    throw RegistrationError(name_ + "(): native implementation is empty");
  }
  for (const auto& g : opts_.graphs.entries()) {
    require_parameter(sig_, name_, "graph argument", g.name);
    if (*sig_.index_of(g.name) != g.position) {
      throw RegistrationError(name_ + "(): graph argument '" + g.name + "' is parameter " +
                              std::to_string(*sig_.index_of(g.name)) + ", not " +
                              std::to_string(g.position));
    }
  }
  for (const AttrSpec* spec : {&opts_.edge_attrs, &opts_.node_attrs}) {
    for (const auto& a : spec->required_arguments()) {
      require_parameter(sig_, name_, "attribute argument", a);
    }
  }
  for (const PreserveSpec* spec : {&opts_.preserve_edge_attrs, &opts_.preserve_node_attrs}) {
    if (auto a = spec->argument()) require_parameter(sig_, name_, "preserve argument", *a);
  }
}

Value Dispatchable::operator()(const Args& args, const Kwargs& kwargs) const {
  if (auto forced = config_->forced_backend()) {
    return run_conversion_harness(*forced, args, kwargs);
  }

  // `backend=` selects an implementation unless the algorithm itself takes
  // a parameter of that name.
  Kwargs kw = kwargs;
  std::optional<std::string> requested;
  if (!sig_.contains("backend")) {
    if (auto it = kw.find("backend"); it != kw.end()) {
      if (const auto* s = std::get_if<std::string>(&it->second)) {
        requested = *s;
      } else if (!is_none(it->second)) {
        throw ArgumentResolutionError(name_ + "() backend must be a backend name, got " +
                                      repr(it->second));
      }
      kw.erase(it);
    }
  }

  std::set<std::string> tags;
  for (const auto& g : opts_.graphs.resolve(name_, args, kw)) {
    if (auto tag = backend_tag(*g.graph)) tags.insert(*tag);
  }
  if (tags.size() > 1) {
    throw BackendMismatchError(name_ + "() graphs must all be from the same backend, found " +
                               tag_set_repr(tags));
  }

  if (requested) {
    if (*requested == kNativeBackend) {
      if (!tags.empty()) {
        throw BackendMismatchError(name_ + "() 'native' backend requested, but graph belongs to '" +
                                   *tags.begin() + "' backend");
      }
      return native_(args, kw);
    }
    if (!tags.empty() && *tags.begin() != *requested) {
      throw BackendMismatchError(name_ + "() '" + *requested +
                                 "' backend requested, but graph belongs to '" +
                                 *tags.begin() + "' backend");
    }
    BackendPtr backend = load_backend(*requested);
    return call_converted(*backend, args, kw);
  }

  if (tags.size() == 1) {
    return call_backend(*tags.begin(), args, kw);
  }
  if (auto result = try_priority(args, kw)) {
    return std::move(*result);
  }
  return native_(args, kw);
}

Value Dispatchable::call_backend(const std::string& backend_name,
                                 const Args& args, const Kwargs& kwargs) const {
  BackendPtr backend = load_backend(backend_name);
  AlgorithmFn fn = require_algorithm(*backend);
  return fn(args, kwargs);
}

Value Dispatchable::call_converted(Backend& backend, const Args& args,
                                   const Kwargs& kwargs) const {
  AlgorithmFn fn = require_algorithm(backend);
  BoundArguments bound = sig_.bind(args, kwargs, name_);
  const ConversionSpec spec = conversion_for(bound);
  const bool use_cache = config_->cache_converted_graphs();
  for (const auto& g : opts_.graphs.entries()) {
    Value& v = bound.at(g.name);
    const auto* graph = std::get_if<GraphPtr>(&v);
    if (graph == nullptr || !*graph || backend_tag(**graph)) continue;
    v = convert_graph(backend, *graph, spec, use_cache);
  }
  return fn({}, bound.as_kwargs());
}

std::optional<Value> Dispatchable::try_priority(const Args& args, const Kwargs& kwargs) const {
  for (const auto& name : config_->priority_for(name_, opts_.returns_graph)) {
    if (name == kNativeBackend) return std::nullopt;
    if (!plugins_->has(name)) continue;
    BackendPtr backend = load_backend(name);
    if (!backend->implements(name_)) {
      NETDISPATCH_VLOG(1) << name_ << ": backend '" << name << "' skipped, not implemented";
      continue;
    }
    return call_converted(*backend, args, kwargs);
  }
  return std::nullopt;
}

ConversionSpec Dispatchable::conversion_for(const BoundArguments& bound) const {
  return resolve_conversion(name_, opts_.edge_attrs, opts_.preserve_edge_attrs,
                            opts_.node_attrs, opts_.preserve_node_attrs, bound);
}

GraphPtr Dispatchable::convert_graph(Backend& backend, const GraphPtr& graph,
                                     const ConversionSpec& spec, bool use_cache) const {
  auto* cache = use_cache ? dynamic_cast<ConversionCache*>(graph.get()) : nullptr;
  const std::string key = spec.cache_key();
  if (cache != nullptr) {
    if (GraphPtr hit = cache->cached_conversion(backend.name(), key)) {
      if (config_->warning_enabled("cache")) {
        NETDISPATCH_LOG(WARNING) << "Using cached graph for '" << backend.name()
                                 << "' backend in call to " << name_
                                 << ". Disable the 'cache' warning to silence this message.";
      }
      return hit;
    }
  }
  GraphPtr converted = backend.convert_from_native(graph, spec);
  if (!converted) {
    throw DispatchError(name_ + "(): backend '" + std::string(backend.name()) +
                        "' returned no graph from conversion");
  }
  if (cache != nullptr) {
    cache->store_conversion(std::string(backend.name()), key, converted);
  }
  return converted;
}

BackendPtr Dispatchable::load_backend(std::string_view backend_name) const {
  return plugins_->load(backend_name);
}

AlgorithmFn Dispatchable::require_algorithm(const Backend& backend) const {
  AlgorithmFn fn = backend.find_algorithm(name_);
  if (!fn) {
    throw NotImplementedByBackendError("'" + name_ + "' not implemented by '" +
                                       std::string(backend.name()) + "' backend");
  }
  return fn;
}

std::ostream& operator<<(std::ostream& os, const Dispatchable& d) {
  return os << "<dispatchable " << d.name() << ">";
}

} // namespace netdispatch::core
