/*
  Backend interface: an alternate implementation of some algorithms that
  works on its own graph representation.

  A backend provides:
    - implementations keyed by canonical algorithm name;
    - convert_from_native: native graph -> backend graph;
    - convert_to_native: backend result -> native result;
    - optionally on_start_tests, to mark known-failing test cases.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "netdispatch/core/attr_spec.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

// One discovered test case; a backend may mark it as expected to fail.
struct TestItem {
  std::string name;
  std::optional<std::string> xfail_reason {};

  void mark_expected_failure(std::string reason) { xfail_reason = std::move(reason); }
};

class Backend {
public:
  virtual ~Backend() noexcept = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  // Implementation of `algorithm`, or an empty function when the backend does
  // not implement it. The default looks up functions added with implement().
  [[nodiscard]] virtual AlgorithmFn find_algorithm(std::string_view algorithm) const;

  [[nodiscard]] bool implements(std::string_view algorithm) const {
    return static_cast<bool>(find_algorithm(algorithm));
  }

  // The result may be cached on `graph` itself, so it must not hold a
  // strong reference back to `graph`; copy what it needs instead.
  [[nodiscard]] virtual GraphPtr convert_from_native(const GraphPtr& graph,
                                                     const ConversionSpec& spec) = 0;

  [[nodiscard]] virtual Value convert_to_native(Value result, std::string_view name) = 0;

  virtual void on_start_tests(std::vector<TestItem>& items) { (void)items; }

protected:
  void implement(std::string algorithm, AlgorithmFn fn);

private:
  std::map<std::string, AlgorithmFn, std::less<>> algorithms_;
};

using BackendPtr = std::shared_ptr<Backend>;

} // namespace netdispatch::core
