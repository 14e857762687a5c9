#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/http-headers.hpp"
#include "trellis/http-method.hpp"
#include "trellis/request-body.hpp"

namespace trellis::http {

// Parsed request as handed over by the transport layer.
class HttpRequest {
 public:
  // 'target' is the origin-form request target ("/path?query"). A fragment, if any, is dropped.
  HttpRequest(Method method, std::string_view target, HttpHeaders headers = {},
              std::shared_ptr<RequestBody> body = {});

  [[nodiscard]] Method method() const noexcept { return _method; }

  // Full request target without fragment.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Raw (still percent-encoded) path component.
  [[nodiscard]] std::string_view path() const noexcept { return std::string_view(_target).substr(0, _pathLen); }

  // Raw query string without the leading '?', empty if none.
  [[nodiscard]] std::string_view query() const noexcept;

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.value(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.valueOrEmpty(name);
  }

  // Body handle, nullptr when the request has no body.
  [[nodiscard]] RequestBody* body() const noexcept { return _body.get(); }

  [[nodiscard]] const std::shared_ptr<RequestBody>& bodyHandle() const noexcept { return _body; }

 private:
  std::string _target;
  HttpHeaders _headers;
  std::shared_ptr<RequestBody> _body;
  uint32_t _pathLen{};
  Method _method;
};

}  // namespace trellis::http
