#include "trellis/http-method.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace trellis::http {

std::optional<Method> MethodFromStr(std::string_view str) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

std::string AllowHeaderValue(MethodBmp methods) {
  std::string out;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    if (!IsMethodSet(methods, method)) {
      continue;
    }
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(MethodToStr(method));
  }
  return out;
}

}  // namespace trellis::http
