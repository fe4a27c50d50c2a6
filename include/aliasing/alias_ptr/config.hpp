// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef ALIASING_CONFIG_HPP
#define ALIASING_CONFIG_HPP

#include <cstdint>

// ALIASING_POISON_ON_DELETE
//
// Off by default. When defined, alias_ptr::destroy() overwrites the address
// held by the handle it was called through with a poison value, and the
// dereference operators assert that the handle has not been poisoned. Only
// that one handle changes; copies made earlier keep the freed address.
//
// The macro changes the definition of alias_ptr (is_poisoned() and the
// body of destroy()), so every translation unit in a program must agree on
// it. Set it through the ALIASING_POISON_ON_DELETE CMake option, which puts
// it on the aliasing::aliasing interface target for all consumers, rather
// than per source file.
#if defined(ALIASING_POISON_ON_DELETE)
#define ALIASING_POISON_ENABLED 1
#else
#define ALIASING_POISON_ENABLED 0
#endif

namespace aliasing::detail {

  inline constexpr bool poison_on_delete = ALIASING_POISON_ENABLED != 0;

  // Highest address aligned for T. Never returned by operator new.
  template <typename T>
  inline constexpr std::uintptr_t poison_address =
    ~std::uintptr_t{0} - (alignof(T) - 1);

  template <typename T> [[nodiscard]] inline T* poison_pointer() noexcept
  {
    return reinterpret_cast<T*>(poison_address<T>);
  }

} // namespace aliasing::detail

#endif // ALIASING_CONFIG_HPP
