#include "trellis/http-response.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-constants.hpp"

namespace trellis::http {

HttpResponse::HttpResponse(StatusCode code, std::string body, std::string_view contentType) : _status(code) {
  setBody(std::move(body), contentType);
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (contentType.empty()) {
    _headers.erase(ContentType);
  } else {
    _headers.set(ContentType, contentType);
  }
}

}  // namespace trellis::http
