#pragma once

#include <memory>

#include "trellis/cancellation.hpp"
#include "trellis/dispatcher.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/router.hpp"

namespace trellis {

// Immutable pairing of a frozen router and a dispatcher: the entry point of the embedding runtime, which calls
// handle() once per request, possibly from many threads at once.
class Service {
 public:
  // Throws std::invalid_argument if 'router' is null.
  Service(std::shared_ptr<const Router> router, Dispatcher dispatcher);

  // Routes then dispatches 'request'. The call returns once the response is complete.
  [[nodiscard]] http::HttpResponse handle(http::HttpRequest request, CancellationToken token = {}) const;

  [[nodiscard]] const Router& router() const noexcept { return *_router; }

  [[nodiscard]] const Dispatcher& dispatcher() const noexcept { return _dispatcher; }

 private:
  std::shared_ptr<const Router> _router;
  Dispatcher _dispatcher;
};

// Builds the process wide service instance, shared read-only by all request tasks.
[[nodiscard]] std::shared_ptr<const Service> MakeService(std::shared_ptr<const Router> router,
                                                         Dispatcher dispatcher = Dispatcher{});

}  // namespace trellis
