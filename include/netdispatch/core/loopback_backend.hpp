/*
  Loopback backend: reference backend that implements every registered
  algorithm by converting to a tagged copy of the native graph and running
  the native implementation on it.

  Forcing all calls through "loopback" replays the native test suite across
  the conversion boundary, so it must never be missing an algorithm.
*/
#pragma once

#include <memory>

#include "netdispatch/core/backend.hpp"
#include "netdispatch/core/graph.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

class AlgorithmRegistry;
class Dispatcher;

class LoopbackGraph final : public GraphBase, public BackendTagged {
public:
  explicit LoopbackGraph(NativeGraphPtr inner) : inner_(std::move(inner)) {}

  [[nodiscard]] std::string_view backend_name() const noexcept override { return kLoopbackBackend; }
  [[nodiscard]] const NativeGraphPtr& native() const noexcept { return inner_; }

private:
  NativeGraphPtr inner_;
};

// The backend resolves algorithms from `algorithms` lazily, so algorithms
// registered after the backend is created are covered too.
[[nodiscard]] BackendPtr make_loopback_backend(const AlgorithmRegistry& algorithms);

// Adds the loopback backend to the dispatcher's plugin registry.
void install_loopback_backend(Dispatcher& dispatcher);

} // namespace netdispatch::core
