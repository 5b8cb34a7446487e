#include "netdispatch/core/algorithm_registry.hpp"

#include "netdispatch/core/error.hpp"

namespace netdispatch::core {

Dispatchable& AlgorithmRegistry::add(std::string name, std::unique_ptr<Dispatchable> wrapper) {
  if (!wrapper) {
    throw RegistrationError("cannot register a null dispatch wrapper for " + name);
  }
  if (entries_.find(name) != entries_.end()) {
    throw RegistrationError("Algorithm already exists in dispatch registry: " + name);
  }
  wrapper->name_ = name;
  AlgorithmEntry entry{name, wrapper->native(), std::move(wrapper)};
  auto [it, inserted] = entries_.emplace(name, std::move(entry));
  (void)inserted;
  order_.push_back(std::move(name));
  return *it->second.wrapper;
}

const Dispatchable* AlgorithmRegistry::find(std::string_view name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : it->second.wrapper.get();
}

const AlgorithmEntry* AlgorithmRegistry::entry(std::string_view name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

} // namespace netdispatch::core
