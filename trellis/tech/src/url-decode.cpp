#include "trellis/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "trellis/char-hexadecimal-converter.hpp"

namespace trellis::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          // copy the truncated tail verbatim
          for (; first < last; ++first) {
            *out++ = *first;
          }
          return out;
        }
        const char c1 = first[1];
        const char c2 = first[2];
        const int v1 = FromHexDigit(c1);
        const int v2 = FromHexDigit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::optional<std::string> DecodePathSegment(std::string_view encoded) {
  std::string decoded(encoded);
  char* end = DecodeInPlace(decoded.data(), decoded.data() + decoded.size(), '+', true);
  if (end == nullptr) {
    return std::nullopt;
  }
  decoded.resize(static_cast<std::string::size_type>(end - decoded.data()));
  return decoded;
}

std::string DecodeQueryComponent(std::string_view encoded) {
  std::string decoded(encoded);
  char* end = DecodeInPlace(decoded.data(), decoded.data() + decoded.size(), ' ', false);
  decoded.resize(static_cast<std::string::size_type>(end - decoded.data()));
  return decoded;
}

}  // namespace trellis::url
