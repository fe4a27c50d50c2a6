// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef ALIASING_ALIAS_BOX_HPP
#define ALIASING_ALIAS_BOX_HPP

#include <cassert>
#include <memory>
#include <type_traits>
#include <utility>

#include "alias_ptr.hpp"

namespace aliasing {

  /**
   * @brief Unique owner of a heap-allocated T that hands out alias_ptr
   * aliases.
   *
   * alias_box frees its target like std::unique_ptr, but dereferences like
   * an alias_ptr: only a const view is produced and nothing assumes the
   * target is unaliased. It is the designated owner field of a data
   * structure whose other fields hold aliases.
   *
   * Aliases obtained from alias() must never be destroy()ed, and must not be
   * dereferenced once the box has been destroyed or reassigned.
   */
  template <typename T> class alias_box {
    static_assert(std::is_object_v<T>, "alias_box requires an object type");
    static_assert(!std::is_array_v<T>, "alias_box does not manage arrays");

  public:
    using element_type = T;

    template <typename... Args> [[nodiscard]] static alias_box make(Args&&... args)
    {
      return alias_box(new T(std::forward<Args>(args)...));
    }

    [[nodiscard]] static alias_box from_raw(T* p) noexcept
    {
      assert(p != nullptr && "alias_box cannot adopt a null pointer");
      return alias_box(p);
    }

    explicit alias_box(std::unique_ptr<T>&& p) noexcept
        : ptr_(p.release())
    {
      assert(ptr_ != nullptr && "alias_box cannot adopt an empty unique_ptr");
    }

    alias_box(const alias_box&)            = delete;
    alias_box& operator=(const alias_box&) = delete;

    alias_box(alias_box&& other) noexcept
        : ptr_(std::exchange(other.ptr_, nullptr))
    {}

    alias_box& operator=(alias_box&& r) noexcept
    {
      alias_box(std::move(r)).swap(*this);
      return *this;
    }

    ~alias_box()
    {
      static_assert(sizeof(T) > 0, "cannot destroy an incomplete type");
      delete ptr_;
    }

    /**
     * @brief A non-owning alias of the boxed value.
     *
     * The alias and every copy of it dangle once this box is destroyed.
     */
    [[nodiscard]] alias_ptr<T> alias() const noexcept
    {
      return alias_ptr<T>::from_raw(ptr_);
    }

    [[nodiscard]] const T& operator*() const noexcept
    {
      assert(ptr_ != nullptr);
      return *ptr_;
    }

    [[nodiscard]] const T* operator->() const noexcept
    {
      assert(ptr_ != nullptr);
      return ptr_;
    }

    [[nodiscard]] const T* get() const noexcept { return ptr_; }

    [[nodiscard]] T* as_ptr() const noexcept { return ptr_; }

    // Gives up ownership; the caller becomes responsible for the delete.
    [[nodiscard]] T* release() noexcept { return std::exchange(ptr_, nullptr); }

    [[nodiscard]] explicit operator bool() const noexcept
    {
      return ptr_ != nullptr;
    }

    void swap(alias_box& other) noexcept { std::swap(ptr_, other.ptr_); }

  private:
    explicit alias_box(T* p) noexcept
        : ptr_(p)
    {}

    T* ptr_;
  };

  template <typename T, typename... Args>
    requires(!std::is_array_v<T>)
  [[nodiscard]] alias_box<T> make_alias_box(Args&&... args)
  {
    return alias_box<T>::make(std::forward<Args>(args)...);
  }

  template <typename T>
  void swap(alias_box<T>& lhs, alias_box<T>& rhs) noexcept
  {
    lhs.swap(rhs);
  }

} // namespace aliasing

#endif // ALIASING_ALIAS_BOX_HPP
