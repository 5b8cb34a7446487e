#pragma once

#include <optional>
#include <absl/log/log.h>

namespace netdispatch {
// Initialize Abseil logging once; optionally set min log level.
void init_logging(std::optional<int> min_level);
}

#define NETDISPATCH_LOG(level) LOG(level)
#define NETDISPATCH_VLOG(verbosity) VLOG(verbosity)
