#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>

#include "trellis/cancellation.hpp"
#include "trellis/http-response.hpp"
#include "trellis/next.hpp"
#include "trellis/pipeline-set.hpp"
#include "trellis/request-state.hpp"

namespace trellis {

// Ordered pipeline handles of a route. Pipelines run in declaration order, the first one being the outermost.
template <class... Hs>
struct PipelineChain {
  static constexpr std::size_t kNbPipelines = sizeof...(Hs);

  std::tuple<Hs...> handles;
};

using EmptyChain = PipelineChain<>;

template <class... Hs>
[[nodiscard]] constexpr PipelineChain<Hs...> MakeChain(Hs... handles) {
  return PipelineChain<Hs...>{std::tuple<Hs...>(handles...)};
}

// Appends 'handles' after the handles of 'chain'.
template <class... Hs, class... Extra>
[[nodiscard]] constexpr PipelineChain<Hs..., Extra...> ExtendChain(const PipelineChain<Hs...>& chain, Extra... handles) {
  return PipelineChain<Hs..., Extra...>{std::tuple_cat(chain.handles, std::tuple<Extra...>(handles...))};
}

namespace detail {

template <class SetT, class ChainT>
struct ChainResolvable : std::false_type {};

template <class SetT, class... Hs>
struct ChainResolvable<SetT, PipelineChain<Hs...>> : std::bool_constant<(PipelineOf<SetT, Hs> && ...)> {};

template <std::size_t I, class SetT, class... Hs>
http::HttpResponse CallChainFrom(const SetT& set, const PipelineChain<Hs...>& chain, RequestState& state,
                                 const Next& terminal) {
  if constexpr (I == sizeof...(Hs)) {
    ThrowIfCancelled(state);
    return terminal(state);
  } else {
    const auto rest = [&set, &chain, &terminal](RequestState& st) {
      return CallChainFrom<I + 1>(set, chain, st, terminal);
    };
    return set.pipeline(std::get<I>(chain.handles)).call(state, Next(rest));
  }
}

}  // namespace detail

// Satisfied when every handle of the chain designates a pipeline of the set. A chain built from the handles of another
// pipeline set is rejected at compile time.
template <class SetT, class ChainT>
concept ChainResolvableIn = detail::ChainResolvable<SetT, ChainT>::value;

// Resolves the chain against 'set' and runs the pipelines in chain order around 'terminal'.
template <class SetT, class... Hs>
  requires ChainResolvableIn<SetT, PipelineChain<Hs...>>
http::HttpResponse CallChain(const SetT& set, const PipelineChain<Hs...>& chain, RequestState& state,
                             const Next& terminal) {
  return detail::CallChainFrom<0>(set, chain, state, terminal);
}

}  // namespace trellis
