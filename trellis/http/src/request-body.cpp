#include "trellis/request-body.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>

namespace trellis::http {

std::size_t StringRequestBody::read(std::span<char> out) {
  const std::size_t nbBytes = std::min(out.size(), _data.size() - _pos);
  std::copy_n(_data.data() + _pos, nbBytes, out.data());
  _pos += nbBytes;
  return nbBytes;
}

std::string ReadAll(RequestBody& body, std::size_t maxBytes) {
  static constexpr std::size_t kChunkSize = 4096;

  std::string out;
  std::array<char, kChunkSize> chunk;
  while (!body.exhausted()) {
    const std::size_t nbRead = body.read(chunk);
    if (nbRead == 0) {
      break;
    }
    if (out.size() + nbRead > maxBytes) {
      throw std::length_error("request body exceeds the allowed size");
    }
    out.append(chunk.data(), nbRead);
  }
  return out;
}

}  // namespace trellis::http
