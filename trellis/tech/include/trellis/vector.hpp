#pragma once

#include <amc/smallvector.hpp>
#include <amc/vector.hpp>
#include <cstddef>

namespace trellis {

template <class T>
using vector = amc::vector<T>;

// Inline storage for the common small case (segments of a path, captures of a route).
template <class T, std::size_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace trellis
