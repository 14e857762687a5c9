#pragma once

#include <string>
#include <string_view>

#include "trellis/http-request.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Identifier of the request, stored in the request state by the dispatcher.
struct RequestId {
  std::string value;
};

// Random (version 4) UUID in its canonical 36 characters form.
std::string GenerateUuidV4();

// Stores the request id in 'state': the X-Request-ID header of 'request' when 'trustHeader' is set and the header is
// not empty, a freshly generated UUID v4 otherwise.
std::string_view SetRequestId(RequestState& state, const http::HttpRequest& request, bool trustHeader = true);

// Throws StateDataAbsent if no request id has been set.
std::string_view RequestIdOf(const RequestState& state);

// Request id for log lines, "-" when none has been set.
std::string_view RequestIdForLog(const RequestState& state);

}  // namespace trellis
