#pragma once

#include <string_view>

#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis::http {

// Plain text error response: "<code> <reason>" followed by an optional detail line.
HttpResponse MakeErrorResponse(StatusCode status, std::string_view detail = {});

}  // namespace trellis::http
