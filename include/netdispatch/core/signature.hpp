/* Algorithm signatures and argument binding. */
#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "netdispatch/core/error.hpp"
#include "netdispatch/core/types.hpp"

namespace netdispatch::core {

// One declared parameter. Parameters without a default are required.
struct Parameter {
  std::string name;
  std::optional<Value> default_value {};
};

// BoundArguments: complete, ordered name -> value map for one call, in
// declaration order, with defaults applied.
class BoundArguments {
public:
  BoundArguments() = default;
  explicit BoundArguments(std::vector<std::pair<std::string, Value>> items)
      : items_(std::move(items)) {}

  [[nodiscard]] bool contains(std::string_view name) const noexcept;
  [[nodiscard]] const Value& at(std::string_view name) const;
  [[nodiscard]] Value& at(std::string_view name);

  // Typed access; fails with ArgumentResolutionError on a type mismatch.
  template <typename T>
  [[nodiscard]] const T& get(std::string_view name) const {
    const Value& v = at(name);
    if (const auto* p = std::get_if<T>(&v)) return *p;
    throw ArgumentResolutionError("argument '" + std::string(name) +
                                  "' has unexpected type: " + repr(v));
  }

  [[nodiscard]] const std::vector<std::pair<std::string, Value>>& items() const noexcept { return items_; }
  [[nodiscard]] Kwargs as_kwargs() const;

private:
  std::vector<std::pair<std::string, Value>> items_;
};

class Signature {
public:
  Signature() = default;
  Signature(std::initializer_list<Parameter> params);
  explicit Signature(std::vector<Parameter> params);

  [[nodiscard]] const std::vector<Parameter>& parameters() const noexcept { return params_; }
  [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept { return index_of(name).has_value(); }

  // Bind a call against this signature, Python-style: positionals fill
  // parameters in order, keywords fill by name, defaults fill the rest.
  // `func` names the callee in error messages.
  [[nodiscard]] BoundArguments bind(const Args& args, const Kwargs& kwargs,
                                    std::string_view func) const;

private:
  std::vector<Parameter> params_;
};

// Wrap an implementation that reads bound arguments into an AlgorithmFn that
// binds raw (args, kwargs) against `sig` first.
[[nodiscard]] AlgorithmFn make_algorithm(std::string name, Signature sig,
                                         std::function<Value(const BoundArguments&)> impl);

} // namespace netdispatch::core
