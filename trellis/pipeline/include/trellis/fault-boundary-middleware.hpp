#pragma once

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Inline fault boundary: converts a fault escaping the downstream chain into a response (see FaultToResponse), so that
// the outbound phase of the enclosing middleware still runs. Cancellation is never converted.
class FaultBoundaryMiddleware {
 public:
  explicit FaultBoundaryMiddleware(bool exposeDetails = false) noexcept : _exposeDetails(exposeDetails) {}

  http::HttpResponse operator()(RequestState& state, const Next& next) const;

 private:
  bool _exposeDetails;
};

}  // namespace trellis
