/*
 * horn - Logic programming with Horn clauses
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include <gc/gc.h>

#include <concepts>
#include <cstddef>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Memory management for terms and search structures
 *
 * Terms, bindings, goals and stream nodes are allocated on the Boehm GC heap
 * and never freed explicitly. Objects owned by ordinary C++ code (containers
 * living on the malloc heap, query state) must be visible to the collector,
 * so they are allocated as *uncollectable* blocks: scanned for pointers like
 * any other GC memory, but only released by an explicit `GC_free()`.
 *
 * \ingroup memory
 */

/**
 * \namespace horn
 * The main namespace of the horn library
 */
namespace horn {

/**
 * Create a garbage-collected object
 *
 * \note Destructor of the object is never run.
 *
 * \tparam T The type of object to create
 * \tparam Args Types of constructor arguments
 * \param args Constructor arguments
 * \return Pointer to the newly created object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Create a garbage-collected object that holds no pointers
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc_atomic(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Allocate garbage-collected memory
 *
 * \ingroup memory
 */
inline void*
allocate(size_t size)
{
  void *ptr = GC_malloc(size);
  if (ptr == nullptr)
    throw std::bad_alloc {};
  return ptr;
}

/**
 * Allocate garbage-collected memory that is known not to contain pointers
 *
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{
  void *ptr = GC_malloc_atomic(size);
  if (ptr == nullptr)
    throw std::bad_alloc {};
  return ptr;
}

/**
 * Allocate memory that is scanned by the collector but never collected
 *
 * Such memory acts as a GC root until released with `GC_free()`.
 *
 * \ingroup memory
 */
inline void*
allocate_uncollectable(size_t size)
{
  void *ptr = GC_malloc_uncollectable(size);
  if (ptr == nullptr)
    throw std::bad_alloc {};
  return ptr;
}


/**
 * Concept for raw memory allocators
 *
 * \ingroup memory
 */
template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * STL-compatible allocator on top of a raw GC allocation function
 *
 * Memory is returned to the collector with `GC_free()` on deallocation.
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using pointer = T*;
  using const_pointer = const T*;
  using void_pointer = void*;
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator_base() noexcept = default;

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &) noexcept
  { }

  pointer
  allocate(size_type n)
  { return static_cast<T*>(RawAllocator {}(n * sizeof(T))); }

  void
  deallocate(pointer p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator_base<U, RawAllocator> &) const noexcept
  { return true; }

  template <typename U>
  bool
  operator != (const gc_allocator_base<U, RawAllocator> &) const noexcept
  { return false; }
}; // struct horn::gc_allocator_base

namespace detail {
struct allocate_uncollectable_wrapper {
  void* operator () (size_t nb) const { return horn::allocate_uncollectable(nb); }
}; // struct horn::detail::allocate_uncollectable_wrapper
} // namespace horn::detail

/**
 * Allocator for containers owned by ordinary C++ objects
 *
 * Storage is a GC root for as long as the container keeps it.
 *
 * \ingroup memory
 */
template <typename T>
using root_allocator =
    gc_allocator_base<T, detail::allocate_uncollectable_wrapper>;


/**
 * Owning pointer to an uncollectable object
 *
 * Keeps everything reachable from the object alive while the pointer exists;
 * destroys and releases the object afterwards.
 *
 * \ingroup memory
 */
template <typename T>
class root_ptr {
  public:
  root_ptr() noexcept: m_ptr {nullptr} { }

  template <typename ...Args>
  static root_ptr
  make(Args&& ...args)
  {
    root_ptr result;
    T *obj = static_cast<T*>(allocate_uncollectable(sizeof(T)));
    try
    {
      new (obj) T {std::forward<Args>(args)...};
    }
    catch (...)
    {
      GC_free(obj);
      throw;
    }
    result.m_ptr = obj;
    return result;
  }

  root_ptr(const root_ptr&) = delete;
  root_ptr& operator = (const root_ptr&) = delete;

  root_ptr(root_ptr &&other) noexcept
  : m_ptr {std::exchange(other.m_ptr, nullptr)}
  { }

  root_ptr&
  operator = (root_ptr &&other) noexcept
  {
    if (this != &other)
    {
      reset();
      m_ptr = std::exchange(other.m_ptr, nullptr);
    }
    return *this;
  }

  ~root_ptr()
  { reset(); }

  void
  reset() noexcept
  {
    if (m_ptr)
    {
      m_ptr->~T();
      GC_free(m_ptr);
      m_ptr = nullptr;
    }
  }

  T*
  operator -> () const noexcept
  { return m_ptr; }

  T&
  operator * () const noexcept
  { return *m_ptr; }

  explicit
  operator bool () const noexcept
  { return m_ptr != nullptr; }

  private:
  T *m_ptr;
}; // class horn::root_ptr

} // namespace horn
