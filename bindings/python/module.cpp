/*
  Pybind11 module exposing NetDispatch-Core to Python.

  Notes:
    - Algorithms are called by name through the process-wide dispatcher;
      arguments are converted to and from the boxed Value type.
    - Graph construction accepts C-contiguous int32 NumPy arrays.
    - config_override() returns a context manager that restores the previous
      configuration on exit, including when the block raises.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <memory>

#include "netdispatch/core/dispatcher.hpp"
#include "netdispatch/core/error.hpp"
#include "netdispatch/core/graph.hpp"
#include "netdispatch/core/logging.hpp"
#include "netdispatch/core/loopback_backend.hpp"
#include "netdispatch/core/types.hpp"

namespace py = pybind11;
using namespace netdispatch::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

static Value to_value(py::handle h) {
  if (h.is_none()) return std::monostate{};
  if (py::isinstance<GraphBase>(h)) return h.cast<GraphPtr>();
  // bool before int: Python bools are ints.
  if (py::isinstance<py::bool_>(h)) return h.cast<bool>();
  if (py::isinstance<py::int_>(h)) return h.cast<std::int64_t>();
  if (py::isinstance<py::float_>(h)) return h.cast<double>();
  if (py::isinstance<py::str>(h)) return h.cast<std::string>();
  if (py::isinstance<py::list>(h) || py::isinstance<py::tuple>(h)) {
    auto seq = py::reinterpret_borrow<py::sequence>(h);
    bool all_str = true;
    for (auto item : seq) all_str = all_str && py::isinstance<py::str>(item);
    if (all_str) return seq.cast<std::vector<std::string>>();
    return seq.cast<std::vector<double>>();
  }
  throw py::type_error("unsupported argument type: " + std::string(py::str(h.get_type())));
}

static py::object from_value(const Value& v) {
  return std::visit([](const auto& x) -> py::object {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return py::none();
    } else {
      return py::cast(x);
    }
  }, v);
}

static ConfigValue to_config_value(py::handle h) {
  if (h.is_none()) return std::monostate{};
  if (py::isinstance<py::bool_>(h)) return h.cast<bool>();
  if (py::isinstance<py::int_>(h)) return h.cast<std::int64_t>();
  if (py::isinstance<py::float_>(h)) return h.cast<double>();
  if (py::isinstance<py::str>(h)) return h.cast<std::string>();
  if (py::isinstance<py::set>(h) || py::isinstance<py::frozenset>(h)) {
    return h.cast<std::set<std::string>>();
  }
  if (py::isinstance<py::list>(h) || py::isinstance<py::tuple>(h)) {
    return h.cast<std::vector<std::string>>();
  }
  throw py::type_error("unsupported config value type: " + std::string(py::str(h.get_type())));
}

static py::object from_config_value(const ConfigValue& v) {
  return std::visit([](const auto& x) -> py::object {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return py::none();
    } else if constexpr (std::is_same_v<T, ConfigPtr>) {
      if (!x) return py::none();
      py::dict d;
      for (const auto& [key, value] : x->items()) d[py::str(key)] = from_config_value(value);
      return std::move(d);
    } else {
      return py::cast(x);
    }
  }, v);
}

namespace {
// Context manager over Config::override.
class PyConfigOverride {
public:
  PyConfigOverride(Config& cfg, ConfigMap changes) : cfg_(cfg), changes_(std::move(changes)) {}

  void enter() {
    if (scope_) throw py::value_error("config override is already active");
    scope_ = std::make_unique<OverrideScope>(cfg_.override(changes_));
  }
  void exit() { scope_.reset(); }

private:
  Config& cfg_;
  ConfigMap changes_;
  std::unique_ptr<OverrideScope> scope_;
};
} // namespace

PYBIND11_MODULE(_netdispatch_core, m) {
  m.doc() = "NetDispatch-Core C++ bindings";

  auto dispatch_error = py::register_exception<DispatchError>(m, "DispatchError");
  py::register_exception<RegistrationError>(m, "RegistrationError", dispatch_error.ptr());
  py::register_exception<ArgumentResolutionError>(m, "ArgumentResolutionError", dispatch_error.ptr());
  py::register_exception<BackendMismatchError>(m, "BackendMismatchError", dispatch_error.ptr());
  py::register_exception<BackendUnavailableError>(m, "BackendUnavailableError", dispatch_error.ptr());
  auto not_impl = py::register_exception<NotImplementedByBackendError>(
      m, "NotImplementedByBackendError", dispatch_error.ptr());
  py::register_exception<ExpectedFailure>(m, "ExpectedFailure", not_impl.ptr());
  auto config_error = py::register_exception<ConfigValidationError>(m, "ConfigValidationError");
  py::register_exception<ConfigKeyError>(m, "ConfigKeyError", config_error.ptr());
  py::register_exception<ConfigTypeError>(m, "ConfigTypeError", config_error.ptr());
  py::register_exception<ConfigValueError>(m, "ConfigValueError", config_error.ptr());

  py::class_<GraphBase, std::shared_ptr<GraphBase>>(m, "GraphBase")
      .def_property_readonly("backend", [](const GraphBase& g) { return backend_tag(g); });

  py::class_<Graph, GraphBase, std::shared_ptr<Graph>>(m, "Graph")
      .def_static(
          "from_arrays",
          [](std::int32_t num_nodes, py::array src, py::array dst,
             const Graph::AttrColumns& edge_attrs, const Graph::AttrColumns& node_attrs) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            if (src_s.size() != dst_s.size()) throw py::type_error("src and dst must have the same length");
            return Graph::from_arrays(num_nodes, src_s, dst_s, edge_attrs, node_attrs);
          },
          py::arg("num_nodes"), py::arg("src"), py::arg("dst"),
          py::kw_only(), py::arg("edge_attrs") = Graph::AttrColumns{},
          py::arg("node_attrs") = Graph::AttrColumns{})
      .def("num_nodes", &Graph::num_nodes)
      .def("num_edges", &Graph::num_edges)
      .def("edge_src_view", [](const Graph& g){
        auto s = g.edge_src_view();
        py::array_t<std::int32_t> arr(s.size());
        std::memcpy(arr.mutable_data(), s.data(), s.size()*sizeof(std::int32_t));
        return arr;
      })
      .def("edge_dst_view", [](const Graph& g){
        auto s = g.edge_dst_view();
        py::array_t<std::int32_t> arr(s.size());
        std::memcpy(arr.mutable_data(), s.data(), s.size()*sizeof(std::int32_t));
        return arr;
      })
      .def("edge_attr", &Graph::edge_attr, py::arg("edge"), py::arg("name"))
      .def("node_attr", &Graph::node_attr, py::arg("node"), py::arg("name"))
      .def("set_edge_attr", &Graph::set_edge_attr, py::arg("edge"), py::arg("name"), py::arg("value"))
      .def("set_node_attr", &Graph::set_node_attr, py::arg("node"), py::arg("name"), py::arg("value"))
      .def("has_edge", &Graph::has_edge, py::arg("u"), py::arg("v"))
      .def("num_conversions", &Graph::num_conversions);

  py::class_<LoopbackGraph, GraphBase, std::shared_ptr<LoopbackGraph>>(m, "LoopbackGraph")
      .def_property_readonly("native", &LoopbackGraph::native);

  m.def("call",
        [](const std::string& name, py::args args, py::kwargs kwargs) {
          Args a;
          for (auto item : args) a.push_back(to_value(item));
          Kwargs k;
          for (auto [key, value] : kwargs) k.emplace(py::cast<std::string>(key), to_value(value));
          return from_value(Dispatcher::global().call(name, a, k));
        }, py::arg("name"));

  m.def("algorithms", [](){ return Dispatcher::global().algorithms().names(); });
  m.def("backends", [](){ return Dispatcher::global().plugins().names(); });

  m.def("config_get", [](const std::string& key) {
          return from_config_value(Dispatcher::global().config().get(key));
        }, py::arg("key"));
  m.def("config_set", [](const std::string& key, py::object value) {
          Dispatcher::global().config().set(key, to_config_value(value));
        }, py::arg("key"), py::arg("value"));
  m.def("config_repr", [](){ return Dispatcher::global().config().repr(); });

  py::class_<PyConfigOverride>(m, "ConfigOverride")
      .def("__enter__", [](PyConfigOverride& self) -> PyConfigOverride& { self.enter(); return self; },
           py::return_value_policy::reference_internal)
      .def("__exit__", [](PyConfigOverride& self, py::object, py::object, py::object) {
        self.exit();
        return false;
      });

  m.def("config_override", [](py::kwargs kwargs) {
          ConfigMap changes;
          for (auto [key, value] : kwargs) {
            changes.emplace_back(py::cast<std::string>(key), to_config_value(value));
          }
          return PyConfigOverride(Dispatcher::global().config(), std::move(changes));
        });

  m.def("init_logging", &netdispatch::init_logging, py::arg("min_level") = py::none());
}
