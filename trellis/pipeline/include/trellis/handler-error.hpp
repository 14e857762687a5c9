#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

// Deliberate failure of a handler or a middleware, reported to the client with the given status.
class HandlerError : public std::runtime_error {
 public:
  HandlerError(http::StatusCode status, const std::string& message) : std::runtime_error(message), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  http::StatusCode _status;
};

// Converts a fault escaped from a chain into a response.
// HandlerError keeps its status and message. Any other exception becomes a 500, with its message only if
// 'exposeDetails' is set.
http::HttpResponse FaultToResponse(const std::exception_ptr& fault, bool exposeDetails);

}  // namespace trellis
