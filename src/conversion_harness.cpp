/*
  Conversion harness: with a forced backend configured, every call converts
  its graph arguments into that backend, runs the backend implementation and
  converts the result back. Running the native test suite this way checks a
  backend against the native behavior.
*/
#include "netdispatch/core/dispatch_config.hpp"
#include "netdispatch/core/dispatchable.hpp"
#include "netdispatch/core/error.hpp"
#include "netdispatch/core/logging.hpp"

namespace netdispatch::core {

Value Dispatchable::run_conversion_harness(const std::string& backend_name,
                                           const Args& args, const Kwargs& kwargs) const {
  BackendPtr backend = load_backend(backend_name);
  AlgorithmFn fn = backend->find_algorithm(name_);
  if (!fn) {
    // The reference backend must cover everything; other backends may have gaps.
    if (backend_name == kLoopbackBackend) {
      throw NotImplementedByBackendError("'" + name_ + "' not found in " + backend_name);
    }
    throw ExpectedFailure("'" + name_ + "' not implemented by " + backend_name);
  }

  Kwargs kw = kwargs;
  if (!sig_.contains("backend")) kw.erase("backend");

  // Same argument errors as a native call.
  for (const auto& g : opts_.graphs.resolve(name_, args, kw)) {
    if (auto tag = backend_tag(*g.graph); tag && *tag != backend_name) {
      throw BackendMismatchError(name_ + "() graph '" + g.name + "' belongs to '" + *tag +
                                 "' backend, not '" + backend_name + "'");
    }
  }

  BoundArguments bound = sig_.bind(args, kw, name_);
  const ConversionSpec spec = conversion_for(bound);
  for (const auto& g : opts_.graphs.entries()) {
    Value& v = bound.at(g.name);
    const auto* graph = std::get_if<GraphPtr>(&v);
    if (graph == nullptr || !*graph || backend_tag(**graph)) continue;
    NETDISPATCH_VLOG(1) << name_ << ": converting '" << g.name << "' to " << backend_name
                        << " [" << spec.cache_key() << "]";
    v = backend->convert_from_native(*graph, spec);
  }
  Value result = fn({}, bound.as_kwargs());
  return backend->convert_to_native(std::move(result), name_);
}

} // namespace netdispatch::core
