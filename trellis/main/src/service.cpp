#include "trellis/service.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "trellis/cancellation.hpp"
#include "trellis/dispatcher.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/router.hpp"

namespace trellis {

Service::Service(std::shared_ptr<const Router> router, Dispatcher dispatcher)
    : _router(std::move(router)), _dispatcher(std::move(dispatcher)) {
  if (!_router) {
    throw std::invalid_argument("Service requires a router");
  }
}

http::HttpResponse Service::handle(http::HttpRequest request, CancellationToken token) const {
  const MatchOutcome outcome = _router->match(request);
  return _dispatcher.dispatch(std::move(request), outcome, std::move(token));
}

std::shared_ptr<const Service> MakeService(std::shared_ptr<const Router> router, Dispatcher dispatcher) {
  return std::make_shared<const Service>(std::move(router), std::move(dispatcher));
}

}  // namespace trellis
