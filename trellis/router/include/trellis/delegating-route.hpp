#pragma once

#include <memory>
#include <utility>

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/pipeline-chain.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route.hpp"
#include "trellis/router.hpp"

namespace trellis {

// Route mounting a separately built router under a prefix. The remaining path segments are matched against it, its
// own 404 / 405 / 406 / 415 answers apply, and the parameters it captures are appended to the PathParams of the state.
// This one runs no middleware around the mounted router.
class DelegatingRoute : public Route {
 public:
  explicit DelegatingRoute(std::shared_ptr<const Router> router);

  [[nodiscard]] bool delegates() const noexcept override { return true; }

  [[nodiscard]] const Router& router() const noexcept { return *_router; }

  // Requires the HttpRequest and the RoutedPath in the state, throws StateDataAbsent otherwise.
  [[nodiscard]] http::HttpResponse dispatch(RequestState& state) const override { return dispatchBelow(state); }

 protected:
  // Matches the remaining segments against the mounted router and dispatches the route found there.
  http::HttpResponse dispatchBelow(RequestState& state) const;

 private:
  std::shared_ptr<const Router> _router;
};

// DelegatingRoute running the pipeline chain of the scope it is mounted from around the mounted router, whose own
// routes' chains are nested inside.
template <class SetT, class ChainT>
  requires ChainResolvableIn<SetT, ChainT>
class PipelinedDelegatingRoute final : public DelegatingRoute {
 public:
  PipelinedDelegatingRoute(std::shared_ptr<const Router> router, SetT pipelines, ChainT chain)
      : DelegatingRoute(std::move(router)), _pipelines(std::move(pipelines)), _chain(std::move(chain)) {}

  [[nodiscard]] http::HttpResponse dispatch(RequestState& state) const override {
    const auto below = [this](RequestState& st) { return dispatchBelow(st); };
    return CallChain(_pipelines, _chain, state, Next(below));
  }

 private:
  SetT _pipelines;
  ChainT _chain;
};

}  // namespace trellis
