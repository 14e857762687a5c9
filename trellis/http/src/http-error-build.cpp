#include "trellis/http-error-build.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-constants.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis::http {

HttpResponse MakeErrorResponse(StatusCode status, std::string_view detail) {
  const std::string_view reason = ReasonPhraseFor(status);

  std::string body;
  body.reserve(4U + reason.size() + 1U + detail.size() + 1U);

  char codeBuf[8];
  const auto [ptr, ec] = std::to_chars(codeBuf, codeBuf + sizeof(codeBuf), status);
  body.append(codeBuf, ptr);
  if (!reason.empty()) {
    body.push_back(' ');
    body.append(reason);
  }
  if (!detail.empty()) {
    body.push_back('\n');
    body.append(detail);
  }
  body.push_back('\n');
  return HttpResponse(status, std::move(body), ContentTypeTextPlain);
}

}  // namespace trellis::http
