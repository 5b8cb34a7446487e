#include <gtest/gtest.h>
#include <cstdlib>
#include "test_utils.hpp"

using namespace netdispatch::core;
using namespace netdispatch::core::test;

namespace {
std::unique_ptr<Dispatcher> demo_dispatcher() {
  StaticPlugins plugins;
  plugins.backends.emplace_back("demo", std::make_shared<DemoBackend>());
  return make_dispatcher(plugins);
}
}

TEST(DispatchConfig, Defaults) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  EXPECT_TRUE(cfg.strict());
  EXPECT_FALSE(cfg.forced_backend().has_value());
  EXPECT_TRUE(cfg.cache_converted_graphs());
  EXPECT_TRUE(cfg.warning_enabled("cache"));
  EXPECT_TRUE(cfg.priority_for("shortest_path_lengths", false).empty());
  EXPECT_EQ(cfg.keys(), (std::vector<std::string>{
      "backend", "backend_priority", "backends", "cache_converted_graphs", "warnings"}));
}

TEST(DispatchConfig, BackendMustBeInstalled) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  cfg.set("backend", std::string("demo"));
  EXPECT_EQ(cfg.forced_backend(), std::optional<std::string>("demo"));
  cfg.set("backend", std::monostate{});
  EXPECT_FALSE(cfg.forced_backend().has_value());
  EXPECT_THROW(cfg.set("backend", std::string("missing")), ConfigValueError);
  EXPECT_THROW(cfg.set("backend", std::int64_t{1}), ConfigTypeError);
  EXPECT_THROW(cfg.set("no_such_key", true), ConfigKeyError);
}

TEST(DispatchConfig, TypedItemsValidated) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  EXPECT_THROW(cfg.set("cache_converted_graphs", std::int64_t{1}), ConfigTypeError);
  cfg.set("cache_converted_graphs", false);
  EXPECT_FALSE(cfg.cache_converted_graphs());
  EXPECT_THROW(cfg.set("warnings", std::set<std::string>{"nope"}), ConfigValueError);
  EXPECT_THROW(cfg.set("warnings", std::string("cache")), ConfigTypeError);
  cfg.set("warnings", std::set<std::string>{});
  EXPECT_FALSE(cfg.warning_enabled("cache"));
  EXPECT_THROW(cfg.erase("warnings"), ConfigTypeError);
}

TEST(DispatchConfig, BackendsConfigKeyedByInstalledBackends) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  auto per_backend = std::make_shared<FlexibleConfig>(
      ConfigMap{{"demo", std::make_shared<FlexibleConfig>()}}, "BackendConfigs");
  cfg.set("backends", per_backend);
  auto unknown = std::make_shared<FlexibleConfig>(
      ConfigMap{{"other", std::make_shared<FlexibleConfig>()}}, "BackendConfigs");
  EXPECT_THROW(cfg.set("backends", unknown), ConfigValueError);
  auto not_configs = std::make_shared<FlexibleConfig>(ConfigMap{{"demo", true}});
  EXPECT_THROW(cfg.set("backends", not_configs), ConfigTypeError);
}

TEST(BackendPriorities, ListsOfInstalledBackends) {
  auto d = demo_dispatcher();
  auto bp = d->config().backend_priority();
  bp->set("algos", std::vector<std::string>{"demo", "native"});
  EXPECT_EQ(d->config().priority_for("edge_count", false),
            (std::vector<std::string>{"demo", "native"}));
  try {
    bp->set("algos", std::vector<std::string>{"zeta", "alpha", "demo"});
    FAIL() << "expected ConfigValueError";
  } catch (const ConfigValueError& e) {
    EXPECT_STREQ(e.what(), "Unknown backend when setting 'algos': 'alpha', 'zeta'");
  }
  EXPECT_THROW(bp->set("generators", std::string("demo")), ConfigTypeError);
  EXPECT_THROW(bp->erase("algos"), ConfigTypeError);
}

TEST(BackendPriorities, PerAlgorithmKeysOnlyForRegisteredAlgorithms) {
  auto d = demo_dispatcher();
  auto bp = d->config().backend_priority();
  bp->set("generators", std::vector<std::string>{"loopback"});
  bp->set("edge_count", std::vector<std::string>{"demo"});
  EXPECT_EQ(d->config().priority_for("edge_count", false), std::vector<std::string>{"demo"});
  EXPECT_EQ(d->config().priority_for("intersection", true), std::vector<std::string>{"loopback"});
  EXPECT_TRUE(d->config().priority_for("shortest_path_lengths", false).empty());
  try {
    bp->set("not_an_algorithm", std::vector<std::string>{"demo"});
    FAIL() << "expected ConfigKeyError";
  } catch (const ConfigKeyError& e) {
    EXPECT_STREQ(e.what(), "Invalid config name: 'not_an_algorithm'");
  }
  bp->erase("edge_count");
  EXPECT_TRUE(d->config().priority_for("edge_count", false).empty());
}

TEST(DispatchConfig, BackendPriorityAcceptsPlainList) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  auto original = cfg.backend_priority();
  {
    auto scope = cfg.override({{"backend_priority", std::vector<std::string>{"demo"}}});
    EXPECT_EQ(cfg.priority_for("edge_count", false), std::vector<std::string>{"demo"});
  }
  EXPECT_EQ(cfg.backend_priority(), original);
  EXPECT_TRUE(cfg.priority_for("edge_count", false).empty());
  EXPECT_THROW(cfg.set("backend_priority", std::int64_t{3}), ConfigTypeError);
}

TEST(DispatchConfig, ReconstructProducesEqualConfig) {
  auto d = demo_dispatcher();
  auto& cfg = d->config();
  cfg.set("backend", std::string("loopback"));
  cfg.set("warnings", std::set<std::string>{});
  auto copy = cfg.reconstruct(cfg.to_map());
  EXPECT_TRUE(*copy == cfg);
  EXPECT_EQ(copy->type_name(), "DispatchConfig");
}

TEST(DispatchConfig, LoadsEnvironment) {
  auto d = demo_dispatcher();
  EnvGuard convert("NETDISPATCH_GRAPH_CONVERT", "loopback");
  EnvGuard priority("NETDISPATCH_BACKEND_PRIORITY", " demo , loopback,");
  EnvGuard cache("NETDISPATCH_CACHE_CONVERTED_GRAPHS", "");
  EnvGuard warnings("NETDISPATCH_WARNINGS", "");
  load_config_from_environment(d->config());
  EXPECT_EQ(d->config().forced_backend(), std::optional<std::string>("loopback"));
  EXPECT_EQ(d->config().priority_for("edge_count", false),
            (std::vector<std::string>{"demo", "loopback"}));
  EXPECT_FALSE(d->config().cache_converted_graphs());
  EXPECT_FALSE(d->config().warning_enabled("cache"));
}

TEST(DispatchConfig, EnvironmentRejectsUnknownBackend) {
  auto d = demo_dispatcher();
  EnvGuard convert("NETDISPATCH_GRAPH_CONVERT", "not-installed");
  EXPECT_THROW(load_config_from_environment(d->config()), ConfigValueError);
}
