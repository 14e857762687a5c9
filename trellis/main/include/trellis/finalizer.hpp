#pragma once

#include <exception>
#include <functional>

#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Outcome of a request once its chain has completed, normally, by short-circuit, by fault or by cancellation.
struct Completion {
  http::HttpResponse response;
  // Fault escaped from the chain, if any. 'response' is then the error response built for it.
  std::exception_ptr fault;
  // The request was cancelled, 'response' is a 503.
  bool cancelled{false};
};

// Hook run after the chain of every request, including routing failures and cancelled requests.
// It may observe or replace the response, but cannot resume any aborted stage.
using Finalizer = std::function<void(RequestState&, Completion&)>;

// Finalizer running 'extender' only on responses whose status is 'status'.
Finalizer StatusFinalizer(http::StatusCode status, std::function<void(RequestState&, http::HttpResponse&)> extender);

}  // namespace trellis
