#pragma once

#include <memory>
#include <utility>

#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Puts a copy of a value shared by all requests into each request state before running the rest of the chain.
// T is typically a handle on an application resource (a pool, a cache client) that is cheap to copy.
template <class T>
class StateMiddleware {
 public:
  explicit StateMiddleware(T value) : _value(std::make_shared<const T>(std::move(value))) {}

  http::HttpResponse operator()(RequestState& state, const Next& next) const {
    state.put<T>(*_value);
    return next(state);
  }

 private:
  std::shared_ptr<const T> _value;
};

}  // namespace trellis
