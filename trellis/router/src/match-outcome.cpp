#include "trellis/match-outcome.hpp"

#include <stdexcept>

#include "trellis/http-constants.hpp"
#include "trellis/http-error-build.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-response.hpp"

namespace trellis {

http::HttpResponse MakeNonMatchResponse(const MatchOutcome& outcome) {
  if (outcome.matched()) {
    throw std::logic_error("No error response for a matched route");
  }
  http::HttpResponse response = http::MakeErrorResponse(outcome.status());
  if (outcome.kind() == MatchOutcome::Kind::PathMatchedNoVerb) {
    response.header(http::Allow, http::AllowHeaderValue(outcome.allowedMethods()));
  }
  return response;
}

}  // namespace trellis
