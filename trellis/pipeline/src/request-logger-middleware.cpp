#include "trellis/request-logger-middleware.hpp"

#include <chrono>
#include <string_view>

#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/next.hpp"
#include "trellis/request-id.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

http::HttpResponse RequestLoggerMiddleware::operator()(RequestState& state, const Next& next) const {
  const auto start = std::chrono::steady_clock::now();
  http::HttpResponse response = next(state);
  if (log::should_log(_level)) {
    const auto elapsedUs =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count();
    std::string_view method = "-";
    std::string_view path;
    if (const auto* req = state.tryBorrow<http::HttpRequest>()) {
      method = http::MethodToStr(req->method());
      path = req->path();
    }
    log::log(_level, "[{}] {} {} {} {}us", RequestIdForLog(state), method, path, response.status(), elapsedUs);
  }
  return response;
}

}  // namespace trellis
