// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef ALIASING_ALIAS_PTR_HPP
#define ALIASING_ALIAS_PTR_HPP

#include <cassert>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "config.hpp"

namespace aliasing {

  template <typename T> class alias_ptr;

  template <typename T, typename... Args>
    requires(!std::is_array_v<T>)
  [[nodiscard]] alias_ptr<T> make_alias(Args&&... args);

  /**
   * @brief A copyable handle to a heap-allocated T that never counts and
   * never frees on its own.
   *
   * Every copy of an alias_ptr holds the same address. Dereferencing any of
   * them yields a shared (const) view of the one value; mutation has to go
   * through T's own mutable state (see aliasing::cell). Exactly one handle
   * to a given allocation must eventually call destroy(), and no handle to
   * that allocation may be dereferenced or destroyed after that call. The
   * type cannot observe either rule.
   *
   * The handle is a single raw pointer: trivially copyable, trivially
   * destructible, and never null.
   *
   * @tparam T A non-array object type. T may be incomplete where the handle
   * is declared; it must be complete at make_alias() and destroy().
   */
  template <typename T> class alias_ptr {
    static_assert(std::is_object_v<T>, "alias_ptr requires an object type");
    static_assert(!std::is_array_v<T>, "alias_ptr does not manage arrays");

  public:
    using element_type = T;

    alias_ptr(const alias_ptr&) noexcept            = default;
    alias_ptr& operator=(const alias_ptr&) noexcept = default;
    ~alias_ptr()                                    = default;

    template <typename U>
      requires std::convertible_to<U*, T*>
    alias_ptr(const alias_ptr<U>& other) noexcept
        : ptr_(other.as_ptr())
    {}

    /**
     * @brief Adopts a pointer returned by `new T(...)`.
     *
     * The returned handle is the first alias of @p p; the caller takes on
     * the single destroy() for it.
     */
    [[nodiscard]] static alias_ptr from_raw(T* p) noexcept
    {
      assert(p != nullptr && "alias_ptr cannot adopt a null pointer");
      return alias_ptr(p);
    }

    [[nodiscard]] static alias_ptr from_unique(std::unique_ptr<T>&& p) noexcept
    {
      assert(p != nullptr && "alias_ptr cannot adopt an empty unique_ptr");
      return alias_ptr(p.release());
    }

    [[nodiscard]] const T& operator*() const noexcept
    {
      assert_live();
      return *ptr_;
    }

    [[nodiscard]] const T* operator->() const noexcept
    {
      assert_live();
      return ptr_;
    }

    [[nodiscard]] const T* get() const noexcept { return ptr_; }

    /**
     * @brief The stored address, without const.
     *
     * Writing through the result is only valid while no other alias of the
     * same allocation is dereferenced.
     */
    [[nodiscard]] T* as_ptr() const noexcept { return ptr_; }

    /**
     * @brief Destroys the target and releases its storage.
     *
     * Must be called exactly once per allocation, through any one of its
     * aliases, after every other use of every alias. Calling it a second
     * time, or dereferencing any alias afterwards, is undefined behaviour.
     */
    void destroy() noexcept
    {
      static_assert(sizeof(T) > 0, "cannot destroy an incomplete type");
      assert_live();
      delete ptr_;
      if constexpr (detail::poison_on_delete) {
        ptr_ = detail::poison_pointer<T>();
      }
    }

#if ALIASING_POISON_ENABLED
    [[nodiscard]] bool is_poisoned() const noexcept
    {
      return ptr_ == detail::poison_pointer<T>();
    }
#endif

    void swap(alias_ptr& other) noexcept { std::swap(ptr_, other.ptr_); }

  private:
    explicit alias_ptr(T* p) noexcept
        : ptr_(p)
    {}

    void assert_live() const noexcept
    {
#if ALIASING_POISON_ENABLED
      assert(!is_poisoned() && "alias_ptr used after destroy()");
#endif
    }

    T* ptr_;
  };

  // --- Factories ---

  template <typename T, typename... Args>
    requires(!std::is_array_v<T>)
  alias_ptr<T> make_alias(Args&&... args)
  {
    return alias_ptr<T>::from_raw(new T(std::forward<Args>(args)...));
  }

  // --- Non-members ---

  template <typename T, typename U>
  [[nodiscard]] bool operator==(
    const alias_ptr<T>& lhs, const alias_ptr<U>& rhs) noexcept
  {
    return lhs.get() == rhs.get();
  }

  template <typename T, typename U>
  [[nodiscard]] auto operator<=>(
    const alias_ptr<T>& lhs, const alias_ptr<U>& rhs) noexcept
  {
    return std::compare_three_way{}(lhs.get(), rhs.get());
  }

  template <typename T>
  void swap(alias_ptr<T>& lhs, alias_ptr<T>& rhs) noexcept
  {
    lhs.swap(rhs);
  }

} // namespace aliasing

namespace std {
  template <typename T> struct hash<aliasing::alias_ptr<T>> {
    size_t operator()(const aliasing::alias_ptr<T>& p) const noexcept
    {
      return hash<const T*>{}(p.get());
    }
  };
} // namespace std

#endif // ALIASING_ALIAS_PTR_HPP
