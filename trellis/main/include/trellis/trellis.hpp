// trellis umbrella header
//
// Pulls in the public API needed to assemble and run a service:
//   - heterogeneous store, pipelines and pipeline sets
//   - router, route drawing DSL, extractors and parameters
//   - dispatcher, finalizers and service
//   - HTTP request / response primitives
//
// Include the individual headers instead to keep compile times down.
//
// Usage Example:
//    #include <trellis/trellis.hpp>
//    using namespace trellis;
//    auto router = BuildSimpleRouter([](auto& route) {
//      route.get("/hello").to([](RequestState&) { return http::HttpResponse(http::StatusCodeOK, "hi\n"); });
//    });
//    auto service = MakeService(router);
//    http::HttpResponse response = service->handle(http::HttpRequest(http::Method::GET, "/hello"));

#pragma once

// Service
#include "trellis/dispatcher.hpp"      // IWYU pragma: export
#include "trellis/finalizer.hpp"       // IWYU pragma: export
#include "trellis/service-config.hpp"  // IWYU pragma: export
#include "trellis/service.hpp"         // IWYU pragma: export

// Routing
#include "trellis/delegating-route.hpp"  // IWYU pragma: export
#include "trellis/extraction-error.hpp"  // IWYU pragma: export
#include "trellis/extractor.hpp"         // IWYU pragma: export
#include "trellis/match-outcome.hpp"     // IWYU pragma: export
#include "trellis/params.hpp"            // IWYU pragma: export
#include "trellis/route-drawing.hpp"     // IWYU pragma: export
#include "trellis/router-builder.hpp"    // IWYU pragma: export
#include "trellis/router-config.hpp"     // IWYU pragma: export
#include "trellis/router.hpp"            // IWYU pragma: export

// Pipelines
#include "trellis/fault-boundary-middleware.hpp"    // IWYU pragma: export
#include "trellis/handler-error.hpp"                // IWYU pragma: export
#include "trellis/middleware.hpp"                   // IWYU pragma: export
#include "trellis/next.hpp"                         // IWYU pragma: export
#include "trellis/pipeline-chain.hpp"               // IWYU pragma: export
#include "trellis/pipeline-set.hpp"                 // IWYU pragma: export
#include "trellis/pipeline.hpp"                     // IWYU pragma: export
#include "trellis/request-logger-middleware.hpp"    // IWYU pragma: export
#include "trellis/security-headers-middleware.hpp"  // IWYU pragma: export
#include "trellis/state-middleware.hpp"             // IWYU pragma: export
#include "trellis/timer-middleware.hpp"             // IWYU pragma: export

// Store and request state
#include "trellis/cancellation.hpp"   // IWYU pragma: export
#include "trellis/request-id.hpp"     // IWYU pragma: export
#include "trellis/request-state.hpp"  // IWYU pragma: export
#include "trellis/store.hpp"          // IWYU pragma: export

// HTTP primitives
#include "trellis/http-constants.hpp"    // IWYU pragma: export
#include "trellis/http-error-build.hpp"  // IWYU pragma: export
#include "trellis/http-headers.hpp"      // IWYU pragma: export
#include "trellis/http-method.hpp"       // IWYU pragma: export
#include "trellis/http-request.hpp"      // IWYU pragma: export
#include "trellis/http-response.hpp"     // IWYU pragma: export
#include "trellis/http-status-code.hpp"  // IWYU pragma: export
#include "trellis/request-body.hpp"      // IWYU pragma: export
