#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "trellis/extraction-error.hpp"
#include "trellis/extractor.hpp"
#include "trellis/http-error-build.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/next.hpp"
#include "trellis/params.hpp"
#include "trellis/pipeline-chain.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route-matcher.hpp"
#include "trellis/route.hpp"

namespace trellis {

namespace detail {

template <class E>
http::HttpResponse ExtractionFailure(RequestState& state, const ExtractionError& error) {
  log::debug("Extraction of parameter '{}' failed: {}", error.param(), error.what());
  http::HttpResponse response = http::MakeErrorResponse(http::StatusCodeBadRequest, error.what());
  if constexpr (ExtractionErrorHook<E>) {
    E::OnExtractionError(state, response);
  }
  return response;
}

// Builds the extractors of a route into the state. Returns the 400 response if one of them fails.
template <class PathE, class QueryE>
std::optional<http::HttpResponse> RunExtractors(RequestState& state) {
  if constexpr (!std::is_same_v<PathE, NoopPathExtractor>) {
    try {
      state.put<PathE>(PathE::FromPathParams(state.borrow<PathParams>()));
    } catch (const ExtractionError& ex) {
      return ExtractionFailure<PathE>(state, ex);
    }
  }
  if constexpr (!std::is_same_v<QueryE, NoopQueryStringExtractor>) {
    try {
      state.put<QueryE>(QueryE::FromQueryParams(state.borrow<QueryParams>()));
    } catch (const ExtractionError& ex) {
      return ExtractionFailure<QueryE>(state, ex);
    }
  }
  return std::nullopt;
}

}  // namespace detail

// Route running its extractors, then its pipeline chain resolved against a frozen pipeline set, around its handler.
// An extraction failure is answered with 400 before any middleware runs.
template <class SetT, class ChainT, PathExtractor PathE = NoopPathExtractor,
          QueryStringExtractor QueryE = NoopQueryStringExtractor>
  requires ChainResolvableIn<SetT, ChainT>
class RouteImpl final : public Route {
 public:
  RouteImpl(RouteMatcher matcher, SetT pipelines, ChainT chain, RequestHandler handler)
      : Route(std::move(matcher)),
        _pipelines(std::move(pipelines)),
        _chain(std::move(chain)),
        _handler(std::move(handler)) {
    if (!_handler) {
      throw std::invalid_argument("Cannot set empty RequestHandler");
    }
  }

  [[nodiscard]] http::HttpResponse dispatch(RequestState& state) const override {
    if (auto rejection = detail::RunExtractors<PathE, QueryE>(state)) {
      return std::move(*rejection);
    }
    const auto terminal = [this](RequestState& st) { return _handler(st); };
    return CallChain(_pipelines, _chain, state, Next(terminal));
  }

 private:
  SetT _pipelines;
  ChainT _chain;
  RequestHandler _handler;
};

}  // namespace trellis
