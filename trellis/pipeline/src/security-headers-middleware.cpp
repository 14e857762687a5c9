#include "trellis/security-headers-middleware.hpp"

#include <string_view>

#include "trellis/http-constants.hpp"
#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

namespace {

void SetIfAbsent(http::HttpResponse& response, std::string_view key, std::string_view value) {
  if (!response.headerValue(key)) {
    response.header(key, value);
  }
}

}  // namespace

http::HttpResponse SecurityHeadersMiddleware::operator()(RequestState& state, const Next& next) const {
  http::HttpResponse response = next(state);
  SetIfAbsent(response, http::XContentTypeOptions, "nosniff");
  SetIfAbsent(response, http::XFrameOptions, "DENY");
  SetIfAbsent(response, http::XXssProtection, "1; mode=block");
  return response;
}

}  // namespace trellis
