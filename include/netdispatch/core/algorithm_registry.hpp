/* Process-wide, append-only map from algorithm name to its dispatch wrapper. */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "netdispatch/core/dispatchable.hpp"

namespace netdispatch::core {

// AlgorithmEntry is created once at registration and never modified.
struct AlgorithmEntry {
  std::string name;
  AlgorithmFn native;
  std::unique_ptr<Dispatchable> wrapper;
};

// Registration is expected during initialization only; the registry is not
// synchronized and has no removal operation.
class AlgorithmRegistry {
public:
  // Fails with RegistrationError if `name` is already registered. Attaches
  // `name` to the wrapper and returns it.
  Dispatchable& add(std::string name, std::unique_ptr<Dispatchable> wrapper);

  // nullptr when not found.
  [[nodiscard]] const Dispatchable* find(std::string_view name) const;
  [[nodiscard]] const AlgorithmEntry* entry(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  // Registration order.
  [[nodiscard]] const std::vector<std::string>& names() const noexcept { return order_; }

private:
  std::map<std::string, AlgorithmEntry, std::less<>> entries_;
  std::vector<std::string> order_;
};

} // namespace netdispatch::core
