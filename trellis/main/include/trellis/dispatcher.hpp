#pragma once

#include <cstddef>

#include "trellis/cancellation.hpp"
#include "trellis/finalizer.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route.hpp"
#include "trellis/service-config.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Runs a routed request to completion and always produces a response.
//
// The request state is initialized with the HttpRequest, its RequestId and its CancellationToken and, when a route
// matched, with the PathParams, the QueryParams and the RoutedPath. The route then runs its extractors and its pipeline
// chain around its handler. Faults escaping the chain are turned into responses here, the outermost fault boundary:
//   - HandlerError (ExtractionError included) -> its status and message
//   - RequestCancelled                        -> 503, no further stage is invoked
//   - any other exception                     -> 500
// Routing failures are answered with 404 / 405 / 406 / 415 without entering any pipeline.
// Finalizers then run in reverse registration order for every request.
//
// Finalizers are registered before the dispatcher is shared; dispatch is const and safe for concurrent callers.
class Dispatcher {
 public:
  explicit Dispatcher(ServiceConfig config = {});

  // Throws std::invalid_argument for an empty finalizer.
  Dispatcher& addFinalizer(Finalizer finalizer) &;

  Dispatcher&& addFinalizer(Finalizer finalizer) &&;

  [[nodiscard]] http::HttpResponse dispatch(http::HttpRequest request, const MatchOutcome& outcome,
                                            CancellationToken token = {}) const;

  [[nodiscard]] const ServiceConfig& config() const noexcept { return _config; }

  [[nodiscard]] std::size_t nbFinalizers() const noexcept { return _finalizers.size(); }

 private:
  void runRoute(RequestState& state, const Route& route, Completion& completion) const;

  void runFinalizers(RequestState& state, Completion& completion) const;

  ServiceConfig _config;
  vector<Finalizer> _finalizers;
};

}  // namespace trellis
