#include "trellis/handler-error.hpp"

#include <exception>
#include <string_view>

#include "trellis/http-error-build.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

http::HttpResponse FaultToResponse(const std::exception_ptr& fault, bool exposeDetails) {
  try {
    std::rethrow_exception(fault);
  } catch (const HandlerError& ex) {
    return http::MakeErrorResponse(ex.status(), ex.what());
  } catch (const std::exception& ex) {
    return http::MakeErrorResponse(http::StatusCodeInternalServerError,
                                   exposeDetails ? std::string_view(ex.what()) : std::string_view{});
  } catch (...) {
    // Non standard exception types carry no message, the fault itself stays with the caller.
    return http::MakeErrorResponse(http::StatusCodeInternalServerError);
  }
}

}  // namespace trellis
