#pragma once

#include <concepts>

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// A middleware wraps the remainder of the chain:
//
//   http::HttpResponse operator()(RequestState& state, const Next& next) const;
//
// It may work on the state before invoking 'next' (inbound), transform the returned response (outbound, LIFO relative
// to the inbound order), or return its own response without invoking 'next' (short-circuit).
// Middleware instances are shared by all requests and are invoked concurrently, hence the const call operator.
template <class M>
concept Middleware = std::move_constructible<M> && requires(const M& mw, RequestState& state, const Next& next) {
  { mw(state, next) } -> std::same_as<http::HttpResponse>;
};

}  // namespace trellis
