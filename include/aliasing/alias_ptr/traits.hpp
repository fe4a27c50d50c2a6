// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef ALIASING_TRAITS_HPP
#define ALIASING_TRAITS_HPP

#include <concepts>
#include <memory>
#include <type_traits>

#include "alias_ptr.hpp"

namespace aliasing {

// ============================================================================
// POINTER TRAITS EXTENSION
// ============================================================================

// Concept to detect if a type has a use_count() method, or the
// local_use_count() spelling of boost::local_shared_ptr
template <typename T>
concept HasUseCount = requires(const T &t) {
  { t.use_count() } -> std::convertible_to<long>;
} || requires(const T &t) {
  { t.local_use_count() } -> std::convertible_to<long>;
};

/**
 * aliasing::pointer_traits
 * Extends std::pointer_traits with ownership facts a container needs to
 * pick its cleanup path:
 * - is_reference_counted: copies bump a shared count.
 * - is_owning: destroying the last handle frees the target.
 */
template <typename Ptr> struct pointer_traits : std::pointer_traits<Ptr> {
  static constexpr bool is_reference_counted = HasUseCount<Ptr>;
  static constexpr bool is_owning = true;
};

// alias_ptr frees only on an explicit destroy().
template <typename T>
struct pointer_traits<alias_ptr<T>> : std::pointer_traits<alias_ptr<T>> {
  static constexpr bool is_reference_counted = false;
  static constexpr bool is_owning = false;
};

template <typename T> struct pointer_traits<T *> : std::pointer_traits<T *> {
  static constexpr bool is_reference_counted = false;
  static constexpr bool is_owning = false;
};

// Non-owning handles that can free their target themselves. Raw pointers
// are non-owning but have no destroy() and are left to the caller.
template <typename Ptr>
concept ManualLifetime = !pointer_traits<Ptr>::is_owning && requires(Ptr p) {
  p.destroy();
};

} // namespace aliasing

#endif // ALIASING_TRAITS_HPP
