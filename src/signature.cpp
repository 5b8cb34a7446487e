/*
  Signature binding: matching of positional and keyword
  arguments to declared parameters.
*/
#include "netdispatch/core/signature.hpp"

#include <set>

namespace netdispatch::core {

bool BoundArguments::contains(std::string_view name) const noexcept {
  for (const auto& [k, v] : items_) {
    if (k == name) return true;
  }
  return false;
}

const Value& BoundArguments::at(std::string_view name) const {
  for (const auto& [k, v] : items_) {
    if (k == name) return v;
  }
  throw ArgumentResolutionError("no bound argument named '" + std::string(name) + "'");
}

Value& BoundArguments::at(std::string_view name) {
  for (auto& [k, v] : items_) {
    if (k == name) return v;
  }
  throw ArgumentResolutionError("no bound argument named '" + std::string(name) + "'");
}

Kwargs BoundArguments::as_kwargs() const {
  Kwargs out;
  for (const auto& [k, v] : items_) out.emplace(k, v);
  return out;
}

Signature::Signature(std::initializer_list<Parameter> params)
    : Signature(std::vector<Parameter>(params)) {}

Signature::Signature(std::vector<Parameter> params) : params_(std::move(params)) {
  std::set<std::string_view> seen;
  for (const auto& p : params_) {
    if (p.name.empty()) {
      throw std::invalid_argument("Signature: parameter names must be non-empty");
    }
    if (!seen.insert(p.name).second) {
      throw std::invalid_argument("Signature: duplicate parameter '" + p.name + "'");
    }
  }
}

std::optional<std::size_t> Signature::index_of(std::string_view name) const noexcept {
  for (std::size_t i = 0; i < params_.size(); ++i) {
    if (params_[i].name == name) return i;
  }
  return std::nullopt;
}

BoundArguments Signature::bind(const Args& args, const Kwargs& kwargs,
                               std::string_view func) const {
  const std::string fn(func);
  if (args.size() > params_.size()) {
    throw ArgumentResolutionError(fn + "() takes " + std::to_string(params_.size()) +
                                  " positional arguments but " + std::to_string(args.size()) +
                                  " were given");
  }
  for (const auto& [key, value] : kwargs) {
    auto idx = index_of(key);
    if (!idx) {
      throw ArgumentResolutionError(fn + "() got an unexpected keyword argument '" + key + "'");
    }
    if (*idx < args.size()) {
      throw ArgumentResolutionError(fn + "() got multiple values for argument '" + key + "'");
    }
  }
  std::vector<std::pair<std::string, Value>> items;
  items.reserve(params_.size());
  for (std::size_t i = 0; i < params_.size(); ++i) {
    const Parameter& p = params_[i];
    if (i < args.size()) {
      items.emplace_back(p.name, args[i]);
    } else if (auto it = kwargs.find(p.name); it != kwargs.end()) {
      items.emplace_back(p.name, it->second);
    } else if (p.default_value) {
      items.emplace_back(p.name, *p.default_value);
    } else {
      throw ArgumentResolutionError(fn + "() missing required argument: '" + p.name + "'");
    }
  }
  return BoundArguments(std::move(items));
}

AlgorithmFn make_algorithm(std::string name, Signature sig,
                           std::function<Value(const BoundArguments&)> impl) {
  return [name = std::move(name), sig = std::move(sig), impl = std::move(impl)](
             const Args& args, const Kwargs& kwargs) {
    return impl(sig.bind(args, kwargs, name));
  };
}

} // namespace netdispatch::core
