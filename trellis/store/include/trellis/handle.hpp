#pragma once

#include <cstddef>

namespace trellis {

template <class Tag, class... Ts>
class Store;

// Compile-time witness of a value of type T stored at position Index of a Store of lineage Tag.
// It carries no runtime data. Only a Store can create one, so a handle always refers to a slot that exists in the store
// that produced it and in every store derived from it by further additions.
template <class T, std::size_t Index, class Tag>
class Handle {
 public:
  using value_type = T;
  using tag_type = Tag;

  static constexpr std::size_t kIndex = Index;

 private:
  template <class, class...>
  friend class Store;

  constexpr Handle() noexcept = default;
};

}  // namespace trellis
