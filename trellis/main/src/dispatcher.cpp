#include "trellis/dispatcher.hpp"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <stop_token>
#include <string_view>
#include <utility>

#include "trellis/cancellation.hpp"
#include "trellis/finalizer.hpp"
#include "trellis/handler-error.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-error-build.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/match-outcome.hpp"
#include "trellis/params.hpp"
#include "trellis/request-id.hpp"
#include "trellis/request-state.hpp"
#include "trellis/route.hpp"
#include "trellis/service-config.hpp"

namespace trellis {

Dispatcher::Dispatcher(ServiceConfig config) : _config(std::move(config)) { _config.validate(); }

Dispatcher& Dispatcher::addFinalizer(Finalizer finalizer) & {
  if (!finalizer) {
    throw std::invalid_argument("Cannot set empty Finalizer");
  }
  _finalizers.push_back(std::move(finalizer));
  return *this;
}

Dispatcher&& Dispatcher::addFinalizer(Finalizer finalizer) && {
  addFinalizer(std::move(finalizer));
  return std::move(*this);
}

http::HttpResponse Dispatcher::dispatch(http::HttpRequest request, const MatchOutcome& outcome,
                                        CancellationToken token) const {
  RequestState state;
  const std::string_view requestId = SetRequestId(state, request, _config.trustRequestIdHeader);
  state.put(std::move(request));
  state.put(std::move(token));

  const http::HttpRequest& req = state.borrow<http::HttpRequest>();

  Completion completion;
  if (outcome.matched()) {
    log::debug("[{}] {} {} routed to {}", requestId, http::MethodToStr(req.method()), req.path(),
               outcome.route()->pattern());
    state.put(outcome.pathParams());
    state.put(ParseQueryString(req.query()));
    state.put(outcome.routedPath());
    runRoute(state, *outcome.route(), completion);
  } else {
    log::debug("[{}] {} {} not routed, answering {}", requestId, http::MethodToStr(req.method()), req.path(),
               outcome.status());
    completion.response = MakeNonMatchResponse(outcome);
  }

  if (const RequestId* id = state.tryBorrow<RequestId>(); _config.echoRequestId && id != nullptr) {
    completion.response.header(http::XRequestId, id->value);
  }

  runFinalizers(state, completion);

  return std::move(completion.response);
}

void Dispatcher::runRoute(RequestState& state, const Route& route, Completion& completion) const {
  try {
    ThrowIfCancelled(state);
    completion.response = route.dispatch(state);
  } catch (const RequestCancelled&) {
    log::info("[{}] Request cancelled", RequestIdForLog(state));
    completion.cancelled = true;
    completion.response = http::MakeErrorResponse(http::StatusCodeServiceUnavailable);
  } catch (const HandlerError& ex) {
    log::debug("[{}] Handler error {}: {}", RequestIdForLog(state), ex.status(), ex.what());
    completion.fault = std::current_exception();
    completion.response = FaultToResponse(completion.fault, _config.exposeFaultDetails);
  } catch (const std::exception& ex) {
    log::error("[{}] Unhandled fault in {}: {}", RequestIdForLog(state), route.pattern(), ex.what());
    completion.fault = std::current_exception();
    completion.response = FaultToResponse(completion.fault, _config.exposeFaultDetails);
  } catch (...) {
    log::error("[{}] Unhandled fault of unknown type in {}", RequestIdForLog(state), route.pattern());
    completion.fault = std::current_exception();
    completion.response = FaultToResponse(completion.fault, _config.exposeFaultDetails);
  }
}

void Dispatcher::runFinalizers(RequestState& state, Completion& completion) const {
  for (std::size_t pos = _finalizers.size(); pos > 0; --pos) {
    try {
      _finalizers[pos - 1U](state, completion);
    } catch (const std::exception& ex) {
      log::error("[{}] Finalizer #{} failed: {}", RequestIdForLog(state), pos - 1U, ex.what());
    } catch (...) {
      log::error("[{}] Finalizer #{} failed with an exception of unknown type", RequestIdForLog(state), pos - 1U);
    }
  }
}

}  // namespace trellis
