#include "netdispatch/core/types.hpp"

#include <sstream>
#include <type_traits>

namespace netdispatch::core {

std::optional<std::string> backend_tag(const GraphBase& g) {
  if (const auto* tagged = dynamic_cast<const BackendTagged*>(&g)) {
    return std::string(tagged->backend_name());
  }
  return std::nullopt;
}

std::optional<double> as_double(const Value& v) noexcept {
  if (const auto* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
  if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&v)) return *d;
  return std::nullopt;
}

std::string repr(const Value& v) {
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
      os << '\'' << x << '\'';
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
      os << '[';
      for (std::size_t i = 0; i < x.size(); ++i) os << (i ? ", '" : "'") << x[i] << '\'';
      os << ']';
    } else if constexpr (std::is_same_v<T, std::vector<double>>) {
      os << '[';
      for (std::size_t i = 0; i < x.size(); ++i) os << (i ? ", " : "") << x[i];
      os << ']';
    } else {
      if (!x) {
        os << "None";
      } else if (auto tag = backend_tag(*x)) {
        os << "<graph backend='" << *tag << "'>";
      } else {
        os << "<graph>";
      }
    }
  }, v);
  return os.str();
}

} // namespace netdispatch::core
