/*
  Config: schema-checked key/value store with scoped, rollback-safe overrides.

  Two concrete flavors share one interface:
    - StrictConfig: keys are fixed when the instance is defined. Reading or
      writing an undeclared key fails; keys can't be deleted.
    - FlexibleConfig: keys may be added and deleted freely.

  Subclasses validate values by overriding on_set (return the sanitized value
  or throw ConfigTypeError / ConfigValueError) and may veto deletions in
  on_erase.

  Scoped overrides:

    {
      auto scope = cfg.override({{"spam", std::int64_t{3}}});
      ...  // cfg["spam"] == 3, even if this block throws
    }      // previous values restored verbatim

  The scope stack is owned by the instance. Configs are not synchronized:
  concurrent writers (including concurrent overrides of one instance) are the
  caller's responsibility.
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "netdispatch/core/error.hpp"

namespace netdispatch::core {

class Config;
class OverrideScope;

using ConfigPtr = std::shared_ptr<Config>;

using ConfigValue = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 std::vector<std::string>,
                                 std::set<std::string>,
                                 ConfigPtr>;

// Plain exported form: key -> value in declaration/insertion order.
using ConfigMap = std::vector<std::pair<std::string, ConfigValue>>;

// Structural equality; nested configs compare by content.
[[nodiscard]] bool config_value_equal(const ConfigValue& a, const ConfigValue& b);
[[nodiscard]] bool config_map_equal(const ConfigMap& a, const ConfigMap& b);
[[nodiscard]] std::string config_repr(const ConfigValue& v);

class Config {
public:
  virtual ~Config() noexcept = default;
  Config(const Config&) = delete;
  Config& operator=(const Config&) = delete;

  [[nodiscard]] bool strict() const noexcept { return strict_; }
  // Name of the defining type; part of equality.
  [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

  [[nodiscard]] bool contains(std::string_view key) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] const ConfigMap& items() const noexcept { return entries_; }

  // Strict: unknown key -> ConfigKeyError. Flexible: unknown key -> None.
  [[nodiscard]] ConfigValue get(std::string_view key) const;
  [[nodiscard]] ConfigValue get(std::string_view key, ConfigValue fallback) const;

  template <typename T>
  [[nodiscard]] T get_as(std::string_view key) const {
    ConfigValue v = get(key);
    if (auto* p = std::get_if<T>(&v)) return *p;
    throw ConfigTypeError("config '" + std::string(key) + "' has unexpected type: " +
                          config_repr(v));
  }

  void set(std::string_view key, ConfigValue value);
  void erase(std::string_view key);

  // Export / reconstruct. reconstruct(to_map()) == *this.
  [[nodiscard]] ConfigMap to_map() const { return entries_; }
  [[nodiscard]] virtual std::unique_ptr<Config> reconstruct(const ConfigMap& values) const = 0;

  [[nodiscard]] bool operator==(const Config& other) const;
  [[nodiscard]] std::string repr() const;

  // Validate all changes (all-or-nothing), snapshot the current state, apply
  // the changes, and keep the snapshot pending for the next enter().
  Config& stage(const ConfigMap& changes);
  // Push the pending snapshot (or nothing, if none is pending).
  void enter();
  // Pop the top snapshot and restore it verbatim.
  void exit();
  [[nodiscard]] std::size_t scope_depth() const noexcept { return stack_.size(); }

  // stage(changes) + enter(), exited when the returned scope is destroyed.
  [[nodiscard]] OverrideScope override(const ConfigMap& changes);
  // enter() for whatever is staged; with nothing staged, exiting restores nothing.
  [[nodiscard]] OverrideScope scope();

protected:
  Config(std::string type_name, bool strict);

  // Add a key with its initial value, without running on_set.
  void declare(std::string key, ConfigValue initial);

  virtual ConfigValue on_set(const std::string& key, ConfigValue value) const { return value; }
  virtual void on_erase(const std::string& key) { (void)key; }

private:
  [[nodiscard]] ConfigValue validate(std::string_view key, ConfigValue value) const;
  void store(std::string_view key, ConfigValue value);

  std::string type_name_;
  bool strict_ {true};
  ConfigMap entries_ {};
  std::optional<ConfigMap> pending_ {};
  std::vector<std::optional<ConfigMap>> stack_ {};
};

class StrictConfig : public Config {
public:
  explicit StrictConfig(const ConfigMap& schema, std::string type_name = "Config");

  [[nodiscard]] std::unique_ptr<Config> reconstruct(const ConfigMap& values) const override;

protected:
  explicit StrictConfig(std::string type_name) : Config(std::move(type_name), true) {}
};

class FlexibleConfig : public Config {
public:
  explicit FlexibleConfig(std::string type_name = "Config") : Config(std::move(type_name), false) {}
  explicit FlexibleConfig(const ConfigMap& values, std::string type_name = "Config");

  [[nodiscard]] std::unique_ptr<Config> reconstruct(const ConfigMap& values) const override;
};

// RAII guard: exits the config scope on every path out of the enclosing block.
class OverrideScope {
public:
  explicit OverrideScope(Config& cfg);
  ~OverrideScope() noexcept;
  OverrideScope(OverrideScope&& other) noexcept : cfg_(other.cfg_) { other.cfg_ = nullptr; }
  OverrideScope(const OverrideScope&) = delete;
  OverrideScope& operator=(const OverrideScope&) = delete;
  OverrideScope& operator=(OverrideScope&&) = delete;

private:
  Config* cfg_ {nullptr};
};

} // namespace netdispatch::core
