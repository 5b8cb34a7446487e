#include "netdispatch/core/config.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace netdispatch::core {

namespace {
std::string quoted(std::string_view key) {
  return "'" + std::string(key) + "'";
}
} // namespace

bool config_value_equal(const ConfigValue& a, const ConfigValue& b) {
  if (a.index() != b.index()) return false;
  if (const auto* pa = std::get_if<ConfigPtr>(&a)) {
    const auto& pb = std::get<ConfigPtr>(b);
    if (!*pa || !pb) return *pa == pb;
    return **pa == *pb;
  }
  return a == b;
}

bool config_map_equal(const ConfigMap& a, const ConfigMap& b) {
  if (a.size() != b.size()) return false;
  for (const auto& [key, value] : a) {
    auto it = std::find_if(b.begin(), b.end(), [&](const auto& kv) { return kv.first == key; });
    if (it == b.end() || !config_value_equal(value, it->second)) return false;
  }
  return true;
}

std::string config_repr(const ConfigValue& v) {
  std::ostringstream os;
  std::visit([&os](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      os << "None";
    } else if constexpr (std::is_same_v<T, bool>) {
      os << (x ? "True" : "False");
    } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
      os << x;
    } else if constexpr (std::is_same_v<T, std::string>) {
      os << quoted(x);
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
      os << '[';
      for (std::size_t i = 0; i < x.size(); ++i) os << (i ? ", " : "") << quoted(x[i]);
      os << ']';
    } else if constexpr (std::is_same_v<T, std::set<std::string>>) {
      if (x.empty()) {
        os << "set()";
        return;
      }
      os << '{';
      bool first = true;
      for (const auto& s : x) {
        os << (first ? "" : ", ") << quoted(s);
        first = false;
      }
      os << '}';
    } else {
      os << (x ? x->repr() : std::string("None"));
    }
  }, v);
  return os.str();
}

Config::Config(std::string type_name, bool strict)
    : type_name_(std::move(type_name)), strict_(strict) {}

bool Config::contains(std::string_view key) const noexcept {
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const auto& kv) { return kv.first == key; });
}

std::vector<std::string> Config::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.push_back(kv.first);
  return out;
}

ConfigValue Config::get(std::string_view key) const {
  for (const auto& [k, v] : entries_) {
    if (k == key) return v;
  }
  if (strict_) throw ConfigKeyError("Invalid config name: " + quoted(key));
  return std::monostate{};
}

ConfigValue Config::get(std::string_view key, ConfigValue fallback) const {
  for (const auto& [k, v] : entries_) {
    if (k == key) return v;
  }
  return fallback;
}

ConfigValue Config::validate(std::string_view key, ConfigValue value) const {
  if (strict_ && !contains(key)) {
    throw ConfigKeyError("Invalid config name: " + quoted(key));
  }
  return on_set(std::string(key), std::move(value));
}

void Config::store(std::string_view key, ConfigValue value) {
  for (auto& [k, v] : entries_) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  entries_.emplace_back(std::string(key), std::move(value));
}

void Config::declare(std::string key, ConfigValue initial) {
  store(key, std::move(initial));
}

void Config::set(std::string_view key, ConfigValue value) {
  store(key, validate(key, std::move(value)));
  pending_.reset();
}

void Config::erase(std::string_view key) {
  if (strict_) {
    throw ConfigTypeError("Configuration items can't be deleted (can't delete " +
                          quoted(key) + ").");
  }
  const std::string k(key);
  on_erase(k);
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const auto& kv) { return kv.first == key; });
  if (it == entries_.end()) {
    throw ConfigKeyError(quoted(key));
  }
  entries_.erase(it);
  pending_.reset();
}

bool Config::operator==(const Config& other) const {
  return type_name_ == other.type_name_ && config_map_equal(entries_, other.entries_);
}

std::string Config::repr() const {
  std::string out = type_name_ + "(";
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (i) out += ", ";
    out += entries_[i].first + "=" + config_repr(entries_[i].second);
  }
  return out + ")";
}

Config& Config::stage(const ConfigMap& changes) {
  ConfigMap sanitized;
  sanitized.reserve(changes.size());
  for (const auto& [key, value] : changes) {
    sanitized.emplace_back(key, validate(key, value));
  }
  ConfigMap prev = entries_;
  for (auto& [key, value] : sanitized) store(key, std::move(value));
  pending_ = std::move(prev);
  return *this;
}

void Config::enter() {
  stack_.push_back(std::move(pending_));
  pending_.reset();
}

void Config::exit() {
  if (stack_.empty()) {
    throw ConfigValidationError(type_name_ + ": scope exit without a matching enter");
  }
  std::optional<ConfigMap> prev = std::move(stack_.back());
  stack_.pop_back();
  pending_.reset();
  if (!prev) return;
  entries_ = std::move(*prev);
}

OverrideScope Config::override(const ConfigMap& changes) {
  stage(changes);
  return OverrideScope(*this);
}

OverrideScope Config::scope() {
  return OverrideScope(*this);
}

StrictConfig::StrictConfig(const ConfigMap& schema, std::string type_name)
    : Config(std::move(type_name), true) {
  for (const auto& [key, value] : schema) declare(key, value);
}

std::unique_ptr<Config> StrictConfig::reconstruct(const ConfigMap& values) const {
  return std::make_unique<StrictConfig>(values, type_name());
}

FlexibleConfig::FlexibleConfig(const ConfigMap& values, std::string type_name)
    : Config(std::move(type_name), false) {
  for (const auto& [key, value] : values) declare(key, value);
}

std::unique_ptr<Config> FlexibleConfig::reconstruct(const ConfigMap& values) const {
  return std::make_unique<FlexibleConfig>(values, type_name());
}

OverrideScope::OverrideScope(Config& cfg) : cfg_(&cfg) {
  cfg.enter();
}

OverrideScope::~OverrideScope() noexcept {
  // The scope may already have been exited by hand.
  if (cfg_ && cfg_->scope_depth() > 0) cfg_->exit();
}

} // namespace netdispatch::core
