#pragma once

#include <memory>
#include <stdexcept>
#include <type_traits>

#include "trellis/http-response.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Continuation handed to a middleware: the rest of the chain, down to the handler.
// It is a non-owning reference to a callable living in the caller's frame; it must not be stored beyond the call.
// It can be invoked at most once. A middleware that does not invoke it short-circuits the chain.
class Next {
 public:
  template <class F>
    requires(std::is_object_v<F> && !std::is_same_v<std::remove_cvref_t<F>, Next> &&
             std::is_invocable_r_v<http::HttpResponse, const F&, RequestState&>)
  explicit Next(const F& continuation) noexcept
      : _continuation(std::addressof(continuation)), _invoke([](const void* cont, RequestState& state) {
          return static_cast<http::HttpResponse>((*static_cast<const F*>(cont))(state));
        }) {}

  Next(const Next&) = delete;
  Next(Next&&) = delete;
  Next& operator=(const Next&) = delete;
  Next& operator=(Next&&) = delete;

  ~Next() = default;

  // Runs the remainder of the chain. Throws std::logic_error if invoked a second time.
  http::HttpResponse operator()(RequestState& state) const {
    if (_invoked) {
      throw std::logic_error("chain continuation invoked more than once");
    }
    _invoked = true;
    return _invoke(_continuation, state);
  }

  [[nodiscard]] bool invoked() const noexcept { return _invoked; }

 private:
  const void* _continuation;
  http::HttpResponse (*_invoke)(const void*, RequestState&);
  mutable bool _invoked{false};
};

}  // namespace trellis
