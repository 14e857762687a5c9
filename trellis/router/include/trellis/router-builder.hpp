#pragma once

#include <memory>
#include <string_view>

#include "trellis/route.hpp"
#include "trellis/router-config.hpp"
#include "trellis/router.hpp"

namespace trellis {

// Mutable build phase of a Router. Routes are registered one by one, then build() freezes the router into an
// immutable, freely shareable instance. The builder cannot be used afterwards.
class RouterBuilder {
 public:
  explicit RouterBuilder(RouterConfig config = {});

  RouterBuilder(const RouterBuilder&) = delete;
  RouterBuilder(RouterBuilder&&) noexcept = default;
  RouterBuilder& operator=(const RouterBuilder&) = delete;
  RouterBuilder& operator=(RouterBuilder&&) noexcept = default;

  ~RouterBuilder() = default;

  // Registers 'route' for 'pattern' and returns it.
  // Throws std::invalid_argument for a malformed or conflicting pattern, std::logic_error after build().
  Route& addRoute(std::string_view pattern, std::unique_ptr<Route> route);

  // Mounts 'subRouter' under 'pattern': every path below it is matched by 'subRouter' with the remaining segments.
  Route& delegate(std::string_view pattern, std::shared_ptr<const Router> subRouter);

  [[nodiscard]] const RouterConfig& config() const;

  [[nodiscard]] std::shared_ptr<const Router> build() &&;

 private:
  Router& router() const;

  std::unique_ptr<Router> _router;
};

}  // namespace trellis
