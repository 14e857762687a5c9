#include "trellis/delegating-route.hpp"

#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/params.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route-matcher.hpp"
#include "trellis/route.hpp"
#include "trellis/router.hpp"

namespace trellis {

DelegatingRoute::DelegatingRoute(std::shared_ptr<const Router> router)
    : Route(RouteMatcher(http::kAllMethods)), _router(std::move(router)) {
  if (!_router) {
    throw std::invalid_argument("Cannot delegate to a null router");
  }
}

http::HttpResponse DelegatingRoute::dispatchBelow(RequestState& state) const {
  const http::HttpRequest& request = state.borrow<http::HttpRequest>();
  RoutedPath& routedPath = state.borrowMut<RoutedPath>();

  const MatchOutcome outcome = _router->matchSegments(
      request.method(), std::span<const std::string>(routedPath.segments.data(), routedPath.segments.size()),
      routedPath.consumed, &request.headers());
  if (!outcome.matched()) {
    log::debug("No route below {} for {} {}", pattern(), http::MethodToStr(request.method()), request.path());
    return MakeNonMatchResponse(outcome);
  }

  if (PathParams* params = state.tryBorrowMut<PathParams>()) {
    params->append(outcome.pathParams());
  } else {
    state.put(outcome.pathParams());
  }
  routedPath.consumed = outcome.routedPath().consumed;

  return outcome.route()->dispatch(state);
}

}  // namespace trellis
