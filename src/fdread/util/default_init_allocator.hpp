/* fdread: Asynchronous descriptor reader
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "fdread/util/util_fwd.hpp"
#include <memory>
#include <type_traits>

namespace fdread::util
{

/**
 * Allocator adaptor (useful for, e.g., `vector` that skips zero-filling) that turns a value-initialization
 * `T()` into a default-initialization for those types, namely PoDs, for which default-initialization is a no-op.
 *
 * We use it for util::Read_buffer: a reader allocates a buffer of (by default) tens of kilobytes per read session
 * and then lets `read()` fill it; zero-filling it first would be wasted work.
 *
 * The container, having raw-allocated a buffer for `T`s, requests to in-place-construct `T{}` in each slot;
 * e.g., `vector::resize(size_t)` does that.  For a PoD `T` that zeroes it; with this adaptor it instead does
 * `T t;` leaving the bytes as they are.  Non-PoD `T`s are default-constructed either way.
 *
 * ### Source ###
 * Adapted from
 *   https://stackoverflow.com/questions/21028299/is-this-behavior-of-vectorresizesize-type-n-under-c11-and-boost-container/21028912#21028912
 *
 * @tparam T
 *         The type managed by this instance of the allocator.
 * @tparam Allocator
 *         The `Allocator` being adapted; by default the heap-allocating `std::allocator`.
 */
template<typename T, typename Allocator>
class Default_init_allocator : public Allocator
{
public:
  // Types.

  /**
   * Rebinds to `U`, adapting the rebound adaptee allocator.  Needed, as otherwise the adaptee's own `rebind`
   * (`std::allocator` has one in C++17) would be found and would silently drop the adaptor.
   *
   * @tparam U
   *         Type to rebind to.
   */
  template<typename U>
  struct rebind
  {
    /// The rebound allocator type.
    using other = Default_init_allocator<U, typename std::allocator_traits<Allocator>::template rebind_alloc<U>>;
  };

  // Constructors/destructor.

  /// Inherit adaptee allocator's constructors.
  using Allocator::Allocator;

  // Methods.

  /**
   * Replaces value-initialization with default-initialization.  This overload is the reason
   * Default_init_allocator exists at all.
   *
   * @tparam U
   *         Type being constructed.
   * @param ptr
   *        Address at which to in-place-construct the `U`.
   */
  template<typename U>
  void construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>);

  /**
   * Behaves identically to the adaptee allocator (1+ args).
   *
   * @tparam U
   *         Type being constructed.
   * @tparam Args
   *         Constructor args.
   * @param ptr
   *        Address at which to in-place-construct the `U`.
   * @param args
   *        See `Args...`.
   */
  template<typename U, typename... Args>
  void construct(U* ptr, Args&&... args);
}; // class Default_init_allocator

// Template implementations.

template<typename T, typename Allocator>
template<typename U>
void Default_init_allocator<T, Allocator>::construct(U* ptr) noexcept(std::is_nothrow_default_constructible_v<U>)
{
  ::new(static_cast<void*>(ptr)) U;
}

template<typename T, typename Allocator>
template<typename U, typename... Args>
void Default_init_allocator<T, Allocator>::construct(U* ptr, Args&&... args)
{
  std::allocator_traits<Allocator>::construct(static_cast<Allocator&>(*this),
                                              ptr, std::forward<Args>(args)...);
}

} // namespace fdread::util
