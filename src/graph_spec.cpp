#include "netdispatch/core/graph_spec.hpp"

#include <set>

#include "netdispatch/core/error.hpp"

namespace netdispatch::core {

namespace {
GraphArgument make_entry(std::string name, int position) {
  if (position < 0) {
    throw RegistrationError("graph argument '" + name + "' has negative position " +
                            std::to_string(position));
  }
  GraphArgument g;
  if (!name.empty() && name.back() == '?') {
    name.pop_back();
    g.optional = true;
  }
  if (name.empty()) {
    throw RegistrationError("graph argument names must be non-empty");
  }
  g.name = std::move(name);
  g.position = static_cast<std::size_t>(position);
  return g;
}

void check_unique(const std::vector<GraphArgument>& entries) {
  if (entries.empty()) {
    throw RegistrationError("graph argument spec must name at least one graph");
  }
  std::set<std::string_view> names;
  std::set<std::size_t> positions;
  for (const auto& e : entries) {
    if (!names.insert(e.name).second) {
      throw RegistrationError("duplicate graph argument '" + e.name + "'");
    }
    if (!positions.insert(e.position).second) {
      throw RegistrationError("graph argument '" + e.name + "' reuses position " +
                              std::to_string(e.position));
    }
  }
}
} // namespace

GraphArgumentSpec::GraphArgumentSpec(const char* name) : GraphArgumentSpec(std::string(name)) {}

GraphArgumentSpec::GraphArgumentSpec(std::string name) {
  entries_.push_back(make_entry(std::move(name), 0));
  check_unique(entries_);
}

GraphArgumentSpec::GraphArgumentSpec(std::initializer_list<std::pair<std::string, int>> entries)
    : GraphArgumentSpec(std::vector<std::pair<std::string, int>>(entries)) {}

GraphArgumentSpec::GraphArgumentSpec(const std::vector<std::pair<std::string, int>>& entries) {
  entries_.reserve(entries.size());
  for (const auto& [name, pos] : entries) entries_.push_back(make_entry(name, pos));
  check_unique(entries_);
}

std::vector<ResolvedGraph> GraphArgumentSpec::resolve(std::string_view algorithm,
                                                      const Args& args,
                                                      const Kwargs& kwargs) const {
  std::vector<ResolvedGraph> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    const Value* value = nullptr;
    auto kw = kwargs.find(e.name);
    if (e.position < args.size()) {
      if (kw != kwargs.end()) {
        throw ArgumentResolutionError(std::string(algorithm) + "() got multiple values for '" +
                                      e.name + "'");
      }
      value = &args[e.position];
    } else if (kw != kwargs.end()) {
      value = &kw->second;
    }
    if (value == nullptr) {
      if (e.optional) continue;
      throw ArgumentResolutionError(std::string(algorithm) + "() missing required graph argument: " +
                                    e.name);
    }
    if (is_none(*value)) {
      if (e.optional) continue;
      throw ArgumentResolutionError(std::string(algorithm) + "() required graph argument '" + e.name +
                                    "' is None; must be a graph");
    }
    const auto* g = std::get_if<GraphPtr>(value);
    if (g == nullptr) {
      throw ArgumentResolutionError(std::string(algorithm) + "() graph argument '" + e.name +
                                    "' is not a graph: " + repr(*value));
    }
    out.push_back(ResolvedGraph{e.name, *g});
  }
  return out;
}

} // namespace netdispatch::core
