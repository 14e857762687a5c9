#include "trellis/timer-middleware.hpp"

#include <chrono>
#include <string>

#include "trellis/http-constants.hpp"
#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

http::HttpResponse TimerMiddleware::operator()(RequestState& state, const Next& next) const {
  const auto start = std::chrono::steady_clock::now();
  http::HttpResponse response = next(state);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
  response.header(http::XRuntimeMicroseconds, std::to_string(elapsed.count()));
  return response;
}

}  // namespace trellis
