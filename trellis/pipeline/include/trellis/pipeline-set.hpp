#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "trellis/handle.hpp"
#include "trellis/store.hpp"

namespace trellis {

// Handle of a pipeline inside a pipeline set.
template <class P, std::size_t Index, class Tag>
using ChainHandle = Handle<P, Index, Tag>;

template <class Tag, class... Ps>
class FrozenPipelineSet;

// Registry of pipelines under construction. Adding consumes the set and returns the grown one with the handle of the
// new pipeline, like Store.
template <class Tag, class... Ps>
class PipelineSet {
 public:
  PipelineSet()
    requires(sizeof...(Ps) == 0)
  = default;

  template <class P>
  [[nodiscard]] std::pair<PipelineSet<Tag, Ps..., P>, ChainHandle<P, sizeof...(Ps), Tag>> add(P pipeline) && {
    auto [store, handle] = std::move(_store).add(std::move(pipeline));
    return {PipelineSet<Tag, Ps..., P>(std::move(store)), handle};
  }

  // Irrevocable transition to the read-only set. No pipeline can be added afterwards.
  [[nodiscard]] FrozenPipelineSet<Tag, Ps...> finalize() && {
    return FrozenPipelineSet<Tag, Ps...>(Freeze(std::move(_store)));
  }

 private:
  template <class, class...>
  friend class PipelineSet;

  explicit PipelineSet(Store<Tag, Ps...> store) : _store(std::move(store)) {}

  Store<Tag, Ps...> _store;
};

// Read-only pipeline set. Copies share the same frozen storage and can be used concurrently without synchronization.
template <class Tag, class... Ps>
class FrozenPipelineSet {
 public:
  using tag_type = Tag;

  template <class P, std::size_t I>
    requires BorrowableFrom<Store<Tag, Ps...>, ChainHandle<P, I, Tag>>
  [[nodiscard]] const P& pipeline(ChainHandle<P, I, Tag> handle) const noexcept {
    return _store->borrow(handle);
  }

 private:
  template <class, class...>
  friend class PipelineSet;

  explicit FrozenPipelineSet(std::shared_ptr<const Store<Tag, Ps...>> store) noexcept : _store(std::move(store)) {}

  std::shared_ptr<const Store<Tag, Ps...>> _store;
};

template <class Tag>
[[nodiscard]] PipelineSet<Tag> NewPipelineSet() {
  return PipelineSet<Tag>{};
}

// Satisfied when 'handle' designates a pipeline of 'set'.
template <class SetT, class HandleT>
concept PipelineOf = requires(const SetT& set, HandleT handle) { set.pipeline(handle); };

}  // namespace trellis
