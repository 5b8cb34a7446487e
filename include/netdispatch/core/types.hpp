/* Core type aliases, the boxed call value, and graph capabilities.
 *
 * For Python developers:
 * - Value: one argument or result of an algorithm call (like a Python object
 *   restricted to None/bool/int/float/str/list/graph)
 * - std::monostate: the None value
 * - Args/Kwargs: positional and keyword arguments (like *args/**kwargs)
 * - GraphPtr: shared reference to any graph object, native or backend-owned
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace netdispatch::core {

using NodeId = std::int32_t;
using EdgeId = std::int32_t;

// Name under which the native (non-backend) implementation is addressed by
// explicit requests and priority lists.
inline constexpr std::string_view kNativeBackend = "native";

// Name of the reference backend that must implement every algorithm.
inline constexpr std::string_view kLoopbackBackend = "loopback";

// GraphBase: root of every graph object that can be passed to a dispatchable
// algorithm. Carries no behavior; capabilities are separate interfaces.
class GraphBase {
public:
  virtual ~GraphBase() noexcept = default;
};

using GraphPtr = std::shared_ptr<GraphBase>;

// BackendTagged: capability of a graph that is owned by a backend. A graph
// without this capability uses the native representation.
class BackendTagged {
public:
  virtual ~BackendTagged() noexcept = default;
  [[nodiscard]] virtual std::string_view backend_name() const noexcept = 0;
};

using Value = std::variant<std::monostate,
                           bool,
                           std::int64_t,
                           double,
                           std::string,
                           std::vector<std::string>,
                           std::vector<double>,
                           GraphPtr>;

using Args = std::vector<Value>;
using Kwargs = std::map<std::string, Value, std::less<>>;

// Ordered attribute name -> default value mapping used by conversions.
using AttrMap = std::vector<std::pair<std::string, Value>>;

// AlgorithmFn: type-erased implementation of one algorithm, native or backend.
using AlgorithmFn = std::function<Value(const Args&, const Kwargs&)>;

[[nodiscard]] inline bool is_none(const Value& v) noexcept {
  if (std::holds_alternative<std::monostate>(v)) return true;
  if (const auto* g = std::get_if<GraphPtr>(&v)) return *g == nullptr;
  return false;
}

// Returns the backend that owns the graph, or nullopt for native graphs.
[[nodiscard]] std::optional<std::string> backend_tag(const GraphBase& g);

// Numeric view of a Value (bool/int/double); nullopt for anything else.
[[nodiscard]] std::optional<double> as_double(const Value& v) noexcept;

// Short printable form used in error messages and reprs.
[[nodiscard]] std::string repr(const Value& v);

} // namespace netdispatch::core
