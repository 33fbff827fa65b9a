#pragma once

#include "horn/memory.hpp"

#include <vector>


namespace horn::stl {

/**
 * Vector whose storage is visible to the garbage collector
 *
 * Use it whenever the elements reference terms.
 */
template <typename T>
using vector = std::vector<T, root_allocator<T>>;

} // namespace horn::stl
