#pragma once

#include "horn/memory.hpp"

#include <unordered_map>

namespace horn::stl {

template <
  typename Key,
  typename T,
  typename Hash = std::hash<Key>,
  typename KeyEqual = std::equal_to<Key>
>
using unordered_map = std::unordered_map<Key, T, Hash, KeyEqual,
                                         root_allocator<std::pair<const Key, T>>>;

} // namespace horn::stl
