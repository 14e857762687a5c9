#include "trellis/request-id.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/log.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

namespace {

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

}  // namespace

std::string GenerateUuidV4() {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  auto& rng = ThreadRng();
  uint64_t hi = rng();
  uint64_t lo = rng();

  // version 4 and variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string out(36, '-');
  std::size_t pos = 0;
  for (int nibbleIdx = 0; nibbleIdx < 32; ++nibbleIdx) {
    if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
      ++pos;
    }
    const uint64_t word = nibbleIdx < 16 ? hi : lo;
    const int shift = 60 - 4 * (nibbleIdx % 16);
    out[pos++] = kHexDigits[(word >> shift) & 0xFU];
  }
  return out;
}

std::string_view SetRequestId(RequestState& state, const http::HttpRequest& request, bool trustHeader) {
  std::string_view incoming;
  if (trustHeader) {
    incoming = request.headerValueOrEmpty(http::XRequestId);
  }
  if (incoming.empty()) {
    state.put(RequestId{GenerateUuidV4()});
  } else {
    state.put(RequestId{std::string(incoming)});
  }
  const std::string_view requestId = state.borrow<RequestId>().value;
  log::trace("[{}] Request id assigned", requestId);
  return requestId;
}

std::string_view RequestIdOf(const RequestState& state) { return state.borrow<RequestId>().value; }

std::string_view RequestIdForLog(const RequestState& state) {
  const RequestId* requestId = state.tryBorrow<RequestId>();
  return requestId == nullptr ? std::string_view("-") : std::string_view(requestId->value);
}

}  // namespace trellis
