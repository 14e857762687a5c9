#pragma once

#include <cstddef>
#include <tuple>
#include <utility>

#include "trellis/cancellation.hpp"
#include "trellis/handle.hpp"
#include "trellis/http-response.hpp"
#include "trellis/middleware.hpp"
#include "trellis/next.hpp"
#include "trellis/request-state.hpp"
#include "trellis/store.hpp"

namespace trellis {

// Frozen ordered sequence of middleware. Execution order is insertion order.
template <Middleware... Ms>
class Pipeline {
 public:
  static constexpr std::size_t kNbMiddleware = sizeof...(Ms);

  explicit Pipeline(std::tuple<Ms...> middleware) : _middleware(std::move(middleware)) {}

  // Runs the middleware in order around 'inner' (the next pipeline of the chain, or the handler).
  // Cancellation is checked before entering each middleware and after each of them got its response back from
  // downstream, so that no stage is resumed once cancellation has been observed.
  http::HttpResponse call(RequestState& state, const Next& inner) const { return callFrom<0>(state, inner); }

 private:
  template <std::size_t I>
  http::HttpResponse callFrom(RequestState& state, const Next& inner) const {
    if constexpr (I == sizeof...(Ms)) {
      return inner(state);
    } else {
      ThrowIfCancelled(state);
      const auto rest = [this, &inner](RequestState& st) {
        http::HttpResponse response = this->template callFrom<I + 1>(st, inner);
        ThrowIfCancelled(st);
        return response;
      };
      return std::get<I>(_middleware)(state, Next(rest));
    }
  }

  std::tuple<Ms...> _middleware;
};

// Accumulates middleware by value: NewPipeline().add(a).add(b).build()
template <class... Ms>
class PipelineBuilder {
 public:
  PipelineBuilder()
    requires(sizeof...(Ms) == 0)
  = default;

  template <Middleware M>
  [[nodiscard]] PipelineBuilder<Ms..., M> add(M middleware) && {
    return PipelineBuilder<Ms..., M>(std::tuple_cat(std::move(_middleware), std::tuple<M>(std::move(middleware))));
  }

  [[nodiscard]] Pipeline<Ms...> build() && { return Pipeline<Ms...>(std::move(_middleware)); }

 private:
  template <class...>
  friend class PipelineBuilder;

  explicit PipelineBuilder(std::tuple<Ms...> middleware) : _middleware(std::move(middleware)) {}

  std::tuple<Ms...> _middleware;
};

[[nodiscard]] inline PipelineBuilder<> NewPipeline() { return {}; }

// Builds a pipeline from middleware previously added to 'store', in the order of the given handles.
// The middleware are copied out of the store, which can be discarded afterwards.
template <class Tag, class... Ts, Middleware... Ms, std::size_t... Is>
  requires(BorrowableFrom<Store<Tag, Ts...>, Handle<Ms, Is, Tag>> && ...)
[[nodiscard]] Pipeline<Ms...> BuildPipeline(const Store<Tag, Ts...>& store, Handle<Ms, Is, Tag>... handles) {
  return Pipeline<Ms...>(std::tuple<Ms...>(store.borrow(handles)...));
}

}  // namespace trellis
