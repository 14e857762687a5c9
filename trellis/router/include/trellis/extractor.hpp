#pragma once

#include <concepts>

#include "trellis/http-response.hpp"
#include "trellis/params.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Type built from the path parameters of a matched route, put into the request state before the chain runs.
template <class T>
concept PathExtractor = std::move_constructible<T> && requires(const PathParams& params) {
  { T::FromPathParams(params) } -> std::convertible_to<T>;
};

// Type built from the query string parameters, put into the request state before the chain runs.
template <class T>
concept QueryStringExtractor = std::move_constructible<T> && requires(const QueryParams& params) {
  { T::FromQueryParams(params) } -> std::convertible_to<T>;
};

// Optional hook of an extractor customizing the 400 response produced when its extraction fails.
template <class T>
concept ExtractionErrorHook = requires(RequestState& state, http::HttpResponse& response) {
  T::OnExtractionError(state, response);
};

// Default extractors, nothing is extracted nor put into the state.
struct NoopPathExtractor {
  static NoopPathExtractor FromPathParams([[maybe_unused]] const PathParams& params) noexcept { return {}; }
};

struct NoopQueryStringExtractor {
  static NoopQueryStringExtractor FromQueryParams([[maybe_unused]] const QueryParams& params) noexcept { return {}; }
};

}  // namespace trellis
