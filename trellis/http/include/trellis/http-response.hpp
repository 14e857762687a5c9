#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-constants.hpp"
#include "trellis/http-headers.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis::http {

// Response value produced by a handler, transformed by middleware on the way out and finally serialized by the
// transport layer. Content-Length is computed by the transport from the body.
class HttpResponse {
 public:
  explicit HttpResponse(StatusCode code = StatusCodeOK) noexcept : _status(code) {}

  HttpResponse(StatusCode code, std::string body, std::string_view contentType = ContentTypeTextPlain);

  [[nodiscard]] StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return ReasonPhraseFor(_status); }

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _headers.value(key);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return _headers.valueOrEmpty(key);
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Moves the body out, leaving it empty.
  [[nodiscard]] std::string takeBody() noexcept { return std::exchange(_body, {}); }

  HttpResponse& status(StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse&& status(StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  // Sets a header, replacing any previous value for this key.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    _headers.set(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    _headers.set(key, value);
    return std::move(*this);
  }

  // Adds a header without checking for duplicates.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.append(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _headers.append(key, value);
    return std::move(*this);
  }

  std::size_t eraseHeader(std::string_view key) { return _headers.erase(key); }

  // Replaces the body and its content type. An empty content type removes the Content-Type header.
  HttpResponse& body(std::string body, std::string_view contentType = ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  HttpResponse& appendBody(std::string_view data) & {
    _body.append(data);
    return *this;
  }

 private:
  void setBody(std::string body, std::string_view contentType);

  HttpHeaders _headers;
  std::string _body;
  StatusCode _status;
};

}  // namespace trellis::http
