// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef ALIASING_CELL_HPP
#define ALIASING_CELL_HPP

#include <concepts>
#include <type_traits>
#include <utility>

namespace aliasing {

  /**
   * @brief A value that can be replaced through a const reference.
   *
   * alias_ptr only ever hands out `const T&`. Putting a cell inside the
   * pointee is how shared handles mutate a value: every operation that
   * writes is const and works by copying or moving whole values in and out,
   * so no reference into the cell outlives the call that produced it.
   *
   * Not thread-safe.
   */
  template <typename T> class cell {
  public:
    using value_type = T;

    cell()
      requires std::default_initializable<T>
    = default;

    explicit cell(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(value))
    {}

    cell(const cell&)            = default;
    cell(cell&&)                 = default;
    cell& operator=(const cell&) = default;
    cell& operator=(cell&&)      = default;

    [[nodiscard]] T get() const
      requires std::copy_constructible<T>
    {
      return value_;
    }

    void set(T value) const { value_ = std::move(value); }

    [[nodiscard]] T replace(T value) const
    {
      return std::exchange(value_, std::move(value));
    }

    [[nodiscard]] T take() const
      requires std::default_initializable<T>
    {
      return std::exchange(value_, T{});
    }

    void swap(const cell& other) const
    {
      using std::swap;
      if (this != &other) {
        swap(value_, other.value_);
      }
    }

    // Exclusive access; only reachable through a non-const cell.
    [[nodiscard]] T& get_mut() noexcept { return value_; }

    [[nodiscard]] T into_inner() && { return std::move(value_); }

  private:
    mutable T value_{};
  };

} // namespace aliasing

#endif // ALIASING_CELL_HPP
