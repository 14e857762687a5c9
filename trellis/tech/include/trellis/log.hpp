#pragma once

// Logging goes through spdlog. Sinks, levels and patterns are configured by the embedding application.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace trellis {

namespace log = spdlog;

}  // namespace trellis
