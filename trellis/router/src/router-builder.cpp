#include "trellis/router-builder.hpp"

#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "trellis/delegating-route.hpp"
#include "trellis/log.hpp"
#include "trellis/route.hpp"
#include "trellis/router-config.hpp"
#include "trellis/router.hpp"

namespace trellis {

RouterBuilder::RouterBuilder(RouterConfig config) : _router(new Router(std::move(config))) {}

Router& RouterBuilder::router() const {
  if (!_router) {
    throw std::logic_error("RouterBuilder used after build()");
  }
  return *_router;
}

Route& RouterBuilder::addRoute(std::string_view pattern, std::unique_ptr<Route> route) {
  return router().insert(pattern, std::move(route));
}

Route& RouterBuilder::delegate(std::string_view pattern, std::shared_ptr<const Router> subRouter) {
  return addRoute(pattern, std::make_unique<DelegatingRoute>(std::move(subRouter)));
}

const RouterConfig& RouterBuilder::config() const { return router().config(); }

std::shared_ptr<const Router> RouterBuilder::build() && {
  std::shared_ptr<const Router> built(std::move(_router));
  if (!built) {
    throw std::logic_error("RouterBuilder used after build()");
  }
  log::debug("Router built with {} route(s)", built->nbRoutes());
  return built;
}

}  // namespace trellis
