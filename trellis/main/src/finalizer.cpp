#include "trellis/finalizer.hpp"

#include <functional>
#include <stdexcept>
#include <utility>

#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

Finalizer StatusFinalizer(http::StatusCode status, std::function<void(RequestState&, http::HttpResponse&)> extender) {
  if (!extender) {
    throw std::invalid_argument("Cannot set empty status finalizer");
  }
  return [status, extender = std::move(extender)](RequestState& state, Completion& completion) {
    if (completion.response.status() == status) {
      extender(state, completion.response);
    }
  };
}

}  // namespace trellis
