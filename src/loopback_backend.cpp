/*
  Loopback backend: thin adapter that delegates to the native algorithms
  through tagged copies of native graphs.
*/
#include "netdispatch/core/loopback_backend.hpp"

#include "netdispatch/core/algorithm_registry.hpp"
#include "netdispatch/core/dispatcher.hpp"
#include "netdispatch/core/error.hpp"

namespace netdispatch::core {

namespace {
// LoopbackGraph -> the native graph it wraps; anything else unchanged.
Value unwrap(const Value& v) {
  if (const auto* g = std::get_if<GraphPtr>(&v)) {
    if (const auto* lg = dynamic_cast<const LoopbackGraph*>(g->get())) {
      return GraphPtr(lg->native());
    }
  }
  return v;
}

// Native graph results are handed back tagged.
Value wrap(Value v) {
  if (const auto* g = std::get_if<GraphPtr>(&v)) {
    if (auto native = std::dynamic_pointer_cast<Graph>(*g)) {
      return GraphPtr(std::make_shared<LoopbackGraph>(std::move(native)));
    }
  }
  return v;
}

class LoopbackBackend final : public Backend {
public:
  explicit LoopbackBackend(const AlgorithmRegistry& algorithms) : algorithms_(algorithms) {}

  std::string_view name() const noexcept override { return kLoopbackBackend; }

  AlgorithmFn find_algorithm(std::string_view algorithm) const override {
    const AlgorithmEntry* entry = algorithms_.entry(algorithm);
    if (entry == nullptr) return {};
    return [native = entry->native](const Args& args, const Kwargs& kwargs) {
      Args a;
      a.reserve(args.size());
      for (const auto& v : args) a.push_back(unwrap(v));
      Kwargs k;
      for (const auto& [key, v] : kwargs) k.emplace(key, unwrap(v));
      return wrap(native(a, k));
    };
  }

  GraphPtr convert_from_native(const GraphPtr& graph, const ConversionSpec& spec) override {
    if (dynamic_cast<const LoopbackGraph*>(graph.get()) != nullptr) return graph;
    auto native = std::dynamic_pointer_cast<Graph>(graph);
    if (!native) {
      throw DispatchError(spec.name + "(): loopback backend can only convert native graphs");
    }
    auto copy = native->with_attributes(spec.edge_attrs, spec.preserve_edge_attrs,
                                        spec.node_attrs, spec.preserve_node_attrs);
    return std::make_shared<LoopbackGraph>(std::move(copy));
  }

  Value convert_to_native(Value result, std::string_view name) override {
    (void)name;
    return unwrap(result);
  }

private:
  const AlgorithmRegistry& algorithms_;
};
} // namespace

BackendPtr make_loopback_backend(const AlgorithmRegistry& algorithms) {
  return std::make_shared<LoopbackBackend>(algorithms);
}

void install_loopback_backend(Dispatcher& dispatcher) {
  const AlgorithmRegistry& algorithms = dispatcher.algorithms();
  dispatcher.plugins().add(std::string(kLoopbackBackend),
                           [&algorithms] { return make_loopback_backend(algorithms); });
}

} // namespace netdispatch::core
