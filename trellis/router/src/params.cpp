#include "trellis/params.hpp"

#include <string>
#include <string_view>

#include "trellis/extraction-error.hpp"
#include "trellis/url-decode.hpp"

namespace trellis {

namespace detail {

void ThrowInvalidParam(std::string_view name, std::string_view text) {
  std::string msg("invalid value '");
  msg.append(text);
  msg.append("' for parameter '");
  msg.append(name);
  msg.push_back('\'');
  throw ExtractionError(name, msg);
}

void ThrowMissingParam(std::string_view name) {
  std::string msg("missing parameter '");
  msg.append(name);
  msg.push_back('\'');
  throw ExtractionError(name, msg);
}

}  // namespace detail

QueryParams ParseQueryString(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    const std::size_t ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    query = ampPos == std::string_view::npos ? std::string_view{} : query.substr(ampPos + 1);
    if (pair.empty()) {
      continue;
    }
    const std::size_t eqPos = pair.find('=');
    const std::string key = url::DecodeQueryComponent(pair.substr(0, eqPos));
    if (eqPos == std::string_view::npos) {
      params.add(key, {});
    } else {
      params.add(key, url::DecodeQueryComponent(pair.substr(eqPos + 1)));
    }
  }
  return params;
}

}  // namespace trellis
