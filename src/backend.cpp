#include "netdispatch/core/backend.hpp"

namespace netdispatch::core {

AlgorithmFn Backend::find_algorithm(std::string_view algorithm) const {
  auto it = algorithms_.find(algorithm);
  if (it == algorithms_.end()) return {};
  return it->second;
}

void Backend::implement(std::string algorithm, AlgorithmFn fn) {
  algorithms_.insert_or_assign(std::move(algorithm), std::move(fn));
}

} // namespace netdispatch::core
