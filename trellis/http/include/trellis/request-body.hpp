#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace trellis::http {

// Handle on the body of an incoming request. The transport layer owns the decoding; the core only forwards the handle
// to the handler through the request state.
class RequestBody {
 public:
  RequestBody() noexcept = default;

  RequestBody(const RequestBody&) = delete;
  RequestBody& operator=(const RequestBody&) = delete;

  virtual ~RequestBody() = default;

  // Reads at most out.size() bytes into 'out' and returns the number of bytes read, 0 once exhausted.
  virtual std::size_t read(std::span<char> out) = 0;

  [[nodiscard]] virtual bool exhausted() const noexcept = 0;
};

// Body fully available in memory.
class StringRequestBody final : public RequestBody {
 public:
  explicit StringRequestBody(std::string data) noexcept : _data(std::move(data)) {}

  std::size_t read(std::span<char> out) override;

  [[nodiscard]] bool exhausted() const noexcept override { return _pos == _data.size(); }

 private:
  std::string _data;
  std::size_t _pos{};
};

// Drains 'body'. Throws std::length_error if more than 'maxBytes' bytes are available.
std::string ReadAll(RequestBody& body, std::size_t maxBytes);

}  // namespace trellis::http
