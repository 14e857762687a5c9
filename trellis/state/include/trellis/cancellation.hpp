#pragma once

#include <stdexcept>
#include <stop_token>

#include "trellis/request-state.hpp"

namespace trellis {

// Cancellation signal of a request, owned by the surrounding runtime.
using CancellationToken = std::stop_token;

// Thrown at a stage transition once the request has been cancelled by the surrounding runtime.
// Stages never resume after it has been observed.
class RequestCancelled : public std::runtime_error {
 public:
  RequestCancelled() : std::runtime_error("request cancelled") {}
};

// Throws RequestCancelled if the CancellationToken stored in 'state' has been requested to stop.
// A state without stop token is never cancelled.
inline void ThrowIfCancelled(const RequestState& state) {
  const CancellationToken* token = state.tryBorrow<CancellationToken>();
  if (token != nullptr && token->stop_requested()) {
    throw RequestCancelled();
  }
}

}  // namespace trellis
