#include "netdispatch/core/dispatcher.hpp"

#include "netdispatch/core/algorithms.hpp"
#include "netdispatch/core/error.hpp"
#include "netdispatch/core/loopback_backend.hpp"

namespace netdispatch::core {

Dispatcher::Dispatcher() : Dispatcher(&registered_backend_plugins) {}

Dispatcher::Dispatcher(PluginRegistry::Source source)
    : plugins_(std::move(source)),
      config_(std::make_unique<DispatchConfig>(plugins_, algorithms_)) {}

Dispatchable& Dispatcher::register_algorithm(std::string func_name, Signature sig,
                                             AlgorithmFn native, DispatchOptions opts) {
  std::string name = opts.name.value_or(std::move(func_name));
  auto wrapper = std::make_unique<Dispatchable>(name, std::move(sig), std::move(native),
                                                std::move(opts), plugins_, *config_);
  return algorithms_.add(std::move(name), std::move(wrapper));
}

Value Dispatcher::call(std::string_view name, const Args& args, const Kwargs& kwargs) const {
  const Dispatchable* d = algorithms_.find(name);
  if (d == nullptr) {
    throw RegistrationError("'" + std::string(name) + "' is not a registered algorithm");
  }
  return (*d)(args, kwargs);
}

void Dispatcher::mark_tests(std::vector<TestItem>& items) {
  auto forced = config_->forced_backend();
  if (!forced) return;
  plugins_.load(*forced)->on_start_tests(items);
}

Dispatcher& Dispatcher::global() {
  static Dispatcher instance;
  static const bool initialized = [] {
    register_builtin_algorithms(instance);
    install_loopback_backend(instance);
    load_config_from_environment(instance.config());
    return true;
  }();
  (void)initialized;
  return instance;
}

} // namespace netdispatch::core
