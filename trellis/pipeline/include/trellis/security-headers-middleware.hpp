#pragma once

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Adds conservative security headers to every outgoing response, unless already set downstream:
//   X-Content-Type-Options: nosniff
//   X-Frame-Options: DENY
//   X-XSS-Protection: 1; mode=block
class SecurityHeadersMiddleware {
 public:
  http::HttpResponse operator()(RequestState& state, const Next& next) const;
};

}  // namespace trellis
