#include <gtest/gtest.h>
#include <stdexcept>
#include "test_utils.hpp"

using namespace netdispatch::core;
using namespace netdispatch::core::test;

namespace {
// Process-wide registration through the static registrar.
BackendPtr make_static_demo() { return std::make_shared<DemoBackend>("static_demo"); }
NETDISPATCH_REGISTER_BACKEND(static_demo, "static_demo", &make_static_demo);
}

TEST(PluginRegistry, ReadsProcessWideTable) {
  PluginRegistry registry;
  EXPECT_TRUE(registry.has("static_demo"));
  auto backend = registry.load("static_demo");
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->name(), "static_demo");
  EXPECT_THROW(register_backend_plugin("static_demo", &make_static_demo), RegistrationError);
}

TEST(PluginRegistry, SourceReadLazilyOnce) {
  int reads = 0;
  PluginRegistry registry([&reads] {
    ++reads;
    return std::vector<PluginDescriptor>{{"demo", [] { return BackendPtr(std::make_shared<DemoBackend>()); }}};
  });
  EXPECT_EQ(reads, 0);
  EXPECT_TRUE(registry.has("demo"));
  EXPECT_FALSE(registry.has("other"));
  EXPECT_EQ(registry.names(), std::vector<std::string>{"demo"});
  EXPECT_EQ(reads, 1);
}

TEST(PluginRegistry, LoadsOnceAndCaches) {
  StaticPlugins plugins;
  plugins.backends.emplace_back("demo", std::make_shared<DemoBackend>());
  PluginRegistry registry(plugins.source());
  EXPECT_FALSE(registry.is_loaded("demo"));
  auto first = registry.load("demo");
  auto second = registry.load("demo");
  EXPECT_EQ(first, second);
  EXPECT_EQ(*plugins.loads, 1);
  EXPECT_TRUE(registry.is_loaded("demo"));
}

TEST(PluginRegistry, UnknownBackendUnavailable) {
  PluginRegistry registry([] { return std::vector<PluginDescriptor>{}; });
  EXPECT_TRUE(registry.empty());
  try {
    (void)registry.load("x");
    FAIL() << "expected BackendUnavailableError";
  } catch (const BackendUnavailableError& e) {
    EXPECT_STREQ(e.what(), "'x' backend is not installed");
  }
  EXPECT_THROW((void)registry.get("x"), BackendUnavailableError);
}

TEST(PluginRegistry, FailedLoadIsNotCached) {
  int attempts = 0;
  PluginRegistry registry([&attempts] {
    return std::vector<PluginDescriptor>{{"flaky", [&attempts]() -> BackendPtr {
      if (++attempts == 1) throw std::runtime_error("missing shared library");
      return std::make_shared<DemoBackend>("flaky");
    }}};
  });
  try {
    (void)registry.load("flaky");
    FAIL() << "expected BackendUnavailableError";
  } catch (const BackendUnavailableError& e) {
    EXPECT_STREQ(e.what(), "Unable to load backend 'flaky': missing shared library");
  }
  EXPECT_FALSE(registry.is_loaded("flaky"));
  EXPECT_NE(registry.load("flaky"), nullptr);
  EXPECT_EQ(attempts, 2);
}

TEST(PluginRegistry, NullLoaderResultIsUnavailable) {
  PluginRegistry registry([] {
    return std::vector<PluginDescriptor>{{"empty", [] { return BackendPtr(); }}};
  });
  EXPECT_THROW((void)registry.load("empty"), BackendUnavailableError);
}

TEST(PluginRegistry, AddRejectsDuplicates) {
  StaticPlugins plugins;
  plugins.backends.emplace_back("demo", std::make_shared<DemoBackend>());
  PluginRegistry registry(plugins.source());
  registry.add("second", [] { return BackendPtr(std::make_shared<DemoBackend>("second")); });
  EXPECT_TRUE(registry.has("second"));
  EXPECT_EQ(registry.names(), (std::vector<std::string>{"demo", "second"}));
  EXPECT_THROW(registry.add("demo", [] { return BackendPtr(); }), RegistrationError);
}
