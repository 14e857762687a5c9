#pragma once

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Reports the time spent downstream in an X-Runtime-Microseconds response header.
class TimerMiddleware {
 public:
  http::HttpResponse operator()(RequestState& state, const Next& next) const;
};

}  // namespace trellis
