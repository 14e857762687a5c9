#pragma once

#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Logs one line per request once the downstream chain returned:
//   [<request id>] <method> <path> <status> <duration>us
// Faults are not logged here, they propagate to the enclosing fault boundary.
class RequestLoggerMiddleware {
 public:
  explicit RequestLoggerMiddleware(log::level::level_enum level = log::level::info) noexcept : _level(level) {}

  http::HttpResponse operator()(RequestState& state, const Next& next) const;

 private:
  log::level::level_enum _level;
};

}  // namespace trellis
