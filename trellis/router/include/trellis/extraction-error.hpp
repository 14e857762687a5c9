#pragma once

#include <string>
#include <string_view>

#include "trellis/handler-error.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

// A path or query parameter is missing or cannot be parsed into its declared type. Answered with 400 Bad Request.
class ExtractionError : public HandlerError {
 public:
  ExtractionError(std::string_view param, const std::string& message)
      : HandlerError(http::StatusCodeBadRequest, message), _param(param) {}

  [[nodiscard]] const std::string& param() const noexcept { return _param; }

 private:
  std::string _param;
};

}  // namespace trellis
