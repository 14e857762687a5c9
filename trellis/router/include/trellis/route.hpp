#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-response.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route-matcher.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Terminal stage of a route, running once every pipeline of its chain let the request through.
using RequestHandler = std::function<http::HttpResponse(RequestState&)>;

// Raw segments of the request path and the number of them consumed by the routers so far.
// Put in the request state by the dispatcher, advanced by delegating routes.
struct RoutedPath {
  vector<std::string> segments;
  std::size_t consumed{};
};

// A registered route: the request conditions it accepts and how it answers a matched request.
// Routes are owned by the Router they are registered in and are immutable once the router is built.
class Route {
 public:
  explicit Route(RouteMatcher matcher) : _matcher(std::move(matcher)) {}

  Route(const Route&) = delete;
  Route(Route&&) = delete;
  Route& operator=(const Route&) = delete;
  Route& operator=(Route&&) = delete;

  virtual ~Route() = default;

  [[nodiscard]] const RouteMatcher& matcher() const noexcept { return _matcher; }

  // Canonical form of the pattern the route was registered with, empty before registration.
  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  // A delegating route answers every path below its pattern; no other route nor child can be registered there.
  [[nodiscard]] virtual bool delegates() const noexcept { return false; }

  // Produces the response of a request this route matched. The state holds at least the HttpRequest, the PathParams
  // and the QueryParams. Faults escape to the caller.
  [[nodiscard]] virtual http::HttpResponse dispatch(RequestState& state) const = 0;

 private:
  friend class Router;

  RouteMatcher _matcher;
  std::string _pattern;
};

}  // namespace trellis
