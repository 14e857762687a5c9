#pragma once

namespace trellis {

/// Decodes a single hexadecimal digit, either case. Returns -1 if 'ch' is not one.
constexpr int FromHexDigit(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace trellis
