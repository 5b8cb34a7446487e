#include "netdispatch/core/logging.hpp"

#include <mutex>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>

namespace netdispatch {

void init_logging(std::optional<int> min_level) {
  static std::once_flag once;
  std::call_once(once, [] { absl::InitializeLog(); });
  if (min_level) {
    // Out-of-range levels clamp to the nearest severity.
    absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
        absl::NormalizeLogSeverity(*min_level)));
  }
}

} // namespace netdispatch
