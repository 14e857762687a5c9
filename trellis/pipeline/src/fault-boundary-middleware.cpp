#include "trellis/fault-boundary-middleware.hpp"

#include <exception>

#include "trellis/cancellation.hpp"
#include "trellis/handler-error.hpp"
#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/next.hpp"
#include "trellis/request-id.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

http::HttpResponse FaultBoundaryMiddleware::operator()(RequestState& state, const Next& next) const {
  try {
    return next(state);
  } catch (const RequestCancelled&) {
    throw;
  } catch (const HandlerError& ex) {
    log::debug("[{}] Handler error {} caught by fault boundary: {}", RequestIdForLog(state), ex.status(), ex.what());
    return FaultToResponse(std::current_exception(), _exposeDetails);
  } catch (const std::exception& ex) {
    log::error("[{}] Fault caught by fault boundary: {}", RequestIdForLog(state), ex.what());
    return FaultToResponse(std::current_exception(), _exposeDetails);
  } catch (...) {
    log::error("[{}] Fault of unknown type caught by fault boundary", RequestIdForLog(state));
    return FaultToResponse(std::current_exception(), _exposeDetails);
  }
}

}  // namespace trellis
