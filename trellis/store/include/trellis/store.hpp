#pragma once

#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

#include "trellis/handle.hpp"

namespace trellis {

namespace detail {

// true when the I-th type of Ts... is exactly T. False (not ill-formed) when I is out of range.
template <std::size_t I, class T, class... Ts>
struct SlotHolds : std::false_type {};

template <class T, class U, class... Ts>
struct SlotHolds<0, T, U, Ts...> : std::is_same<T, U> {};

template <std::size_t I, class T, class U, class... Ts>
  requires(I > 0)
struct SlotHolds<I, T, U, Ts...> : SlotHolds<I - 1, T, Ts...> {};

}  // namespace detail

// Add-only heterogeneous store.
//
// 'Tag' names the lineage of the store: every store derived from NewStore<Tag>() by successive additions shares it,
// and a handle produced by one lineage cannot be used against another one (it does not compile).
// Lineages are told apart by their Tag only: two stores built independently from NewStore<Tag>() with the same Tag
// accept each other's handles whenever the slot types line up. Give each independently built store its own Tag type.
// Adding consumes the store (rvalue-qualified) and returns the grown store together with the handle of the new slot,
// so a handle can never exist before its backing slot.
// Once built, a store is read-only: borrow() is the only operation, safe for any number of concurrent readers.
template <class Tag, class... Ts>
class Store {
 public:
  using tag_type = Tag;

  static constexpr std::size_t kNbSlots = sizeof...(Ts);

  // Only the empty store of a lineage can be created directly, the others derive from it.
  Store()
    requires(kNbSlots == 0)
  = default;

  template <class T>
  [[nodiscard]] std::pair<Store<Tag, Ts..., T>, Handle<T, kNbSlots, Tag>> add(T value) && {
    return {Store<Tag, Ts..., T>(std::tuple_cat(std::move(_slots), std::tuple<T>(std::move(value)))),
            Handle<T, kNbSlots, Tag>{}};
  }

  template <class T, std::size_t I>
    requires detail::SlotHolds<I, T, Ts...>::value
  [[nodiscard]] const T& borrow(Handle<T, I, Tag>) const noexcept {
    return std::get<I>(_slots);
  }

 private:
  template <class, class...>
  friend class Store;

  explicit Store(std::tuple<Ts...> slots) : _slots(std::move(slots)) {}

  std::tuple<Ts...> _slots;
};

// Starts a new lineage. 'Tag' must not be shared with any other store built independently.
template <class Tag>
[[nodiscard]] Store<Tag> NewStore() {
  return Store<Tag>{};
}

// Ends the build phase: the returned snapshot is immutable and can be shared by concurrent readers.
template <class Tag, class... Ts>
[[nodiscard]] std::shared_ptr<const Store<Tag, Ts...>> Freeze(Store<Tag, Ts...>&& store) {
  return std::make_shared<const Store<Tag, Ts...>>(std::move(store));
}

// Satisfied when 'handle' can be presented to 'store'.
template <class StoreT, class HandleT>
concept BorrowableFrom = requires(const StoreT& store, HandleT handle) { store.borrow(handle); };

}  // namespace trellis
