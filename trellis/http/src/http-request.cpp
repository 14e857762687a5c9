#include "trellis/http-request.hpp"

#include <memory>
#include <string_view>
#include <utility>

namespace trellis::http {

HttpRequest::HttpRequest(Method method, std::string_view target, HttpHeaders headers,
                         std::shared_ptr<RequestBody> body)
    : _target(target.substr(0, target.find('#'))),
      _headers(std::move(headers)),
      _body(std::move(body)),
      _method(method) {
  _pathLen = static_cast<uint32_t>(std::string_view(_target).find('?'));
  if (_pathLen > _target.size()) {
    _pathLen = static_cast<uint32_t>(_target.size());
  }
}

std::string_view HttpRequest::query() const noexcept {
  if (_pathLen == _target.size()) {
    return {};
  }
  return std::string_view(_target).substr(_pathLen + 1U);
}

}  // namespace trellis::http
