// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <aliasing/alias_ptr/alias_box.hpp>
#include <aliasing/alias_ptr/alias_ptr.hpp>
#include <aliasing/cell/cell.hpp>

using namespace aliasing;

namespace {

  struct BoxTracker {
    static int constructed;
    static int destroyed;
    int        value;

    explicit BoxTracker(int v = 0)
        : value(v)
    {
      ++constructed;
    }

    ~BoxTracker() { ++destroyed; }

    static void reset()
    {
      constructed = 0;
      destroyed   = 0;
    }
  };

  int BoxTracker::constructed = 0;
  int BoxTracker::destroyed   = 0;

  // The box is declared first so that it is destroyed last, after every
  // field that aliases it.
  class aliased_pair {
  public:
    explicit aliased_pair(int x)
        : owner_(alias_box<cell<int>>::make(x))
        , view_(owner_.alias())
    {}

    [[nodiscard]] const cell<int>& owner() const { return *owner_; }
    [[nodiscard]] const cell<int>& view() const { return *view_; }

  private:
    alias_box<cell<int>> owner_;
    alias_ptr<cell<int>> view_;
  };

} // namespace

static_assert(sizeof(alias_box<int>) == sizeof(int*));
static_assert(!std::is_copy_constructible_v<alias_box<int>>);
static_assert(std::is_nothrow_move_constructible_v<alias_box<int>>);
static_assert(std::is_nothrow_move_assignable_v<alias_box<int>>);

TEST_CASE("alias_box: Aliased pair shares one value", "[alias_box][cell]")
{
  aliased_pair pair(1);
  REQUIRE(pair.view().get() == 1);

  pair.view().set(42);
  REQUIRE(pair.owner().get() == 42);

  pair.owner().set(-3);
  REQUIRE(pair.view().get() == -3);
}

TEST_CASE("alias_box: Lifecycle", "[alias_box]")
{
  BoxTracker::reset();

  SECTION("destroys its target once at scope exit")
  {
    {
      auto box = make_alias_box<BoxTracker>(4);
      REQUIRE(box->value == 4);
      REQUIRE(BoxTracker::constructed == 1);
      REQUIRE(BoxTracker::destroyed == 0);
    }
    REQUIRE(BoxTracker::destroyed == 1);
  }

  SECTION("aliases neither construct nor destroy")
  {
    {
      auto box = alias_box<BoxTracker>::make(8);
      auto a1  = box.alias();
      auto a2  = a1;
      REQUIRE(a1.get() == box.get());
      REQUIRE(a2->value == 8);
      REQUIRE(&*a2 == &*box);
    }
    REQUIRE(BoxTracker::constructed == 1);
    REQUIRE(BoxTracker::destroyed == 1);
  }

  SECTION("adopts a unique_ptr")
  {
    {
      auto        owner = std::make_unique<BoxTracker>(2);
      auto*       raw   = owner.get();
      alias_box<BoxTracker> box(std::move(owner));
      REQUIRE(owner == nullptr);
      REQUIRE(box.as_ptr() == raw);
    }
    REQUIRE(BoxTracker::destroyed == 1);
  }

  SECTION("adopts a raw pointer")
  {
    {
      auto box = alias_box<BoxTracker>::from_raw(new BoxTracker(5));
      REQUIRE((*box).value == 5);
    }
    REQUIRE(BoxTracker::destroyed == 1);
  }
}

TEST_CASE("alias_box: Move semantics", "[alias_box]")
{
  BoxTracker::reset();

  SECTION("move construction leaves the source empty")
  {
    {
      auto  src  = make_alias_box<BoxTracker>(1);
      auto* addr = src.get();
      auto  dst  = std::move(src);
      REQUIRE_FALSE(src);
      REQUIRE(src.get() == nullptr);
      REQUIRE(dst);
      REQUIRE(dst.get() == addr);
    }
    REQUIRE(BoxTracker::destroyed == 1);
  }

  SECTION("move assignment destroys the previous target")
  {
    auto first  = make_alias_box<BoxTracker>(1);
    auto second = make_alias_box<BoxTracker>(2);
    first       = std::move(second);
    REQUIRE(BoxTracker::destroyed == 1);
    REQUIRE(first->value == 2);
    REQUIRE_FALSE(second);
  }

  SECTION("swap exchanges targets")
  {
    auto a = make_alias_box<BoxTracker>(1);
    auto b = make_alias_box<BoxTracker>(2);
    swap(a, b);
    REQUIRE(a->value == 2);
    REQUIRE(b->value == 1);
    REQUIRE(BoxTracker::destroyed == 0);
  }
}

TEST_CASE("alias_box: Release hands the single delete to the caller",
  "[alias_box][alias_ptr]")
{
  BoxTracker::reset();

  auto  box = make_alias_box<BoxTracker>(9);
  auto* raw = box.release();
  REQUIRE_FALSE(box);

  auto handle = alias_ptr<BoxTracker>::from_raw(raw);
  auto copy   = handle;
  REQUIRE(copy->value == 9);
  REQUIRE(BoxTracker::destroyed == 0);

  copy.destroy();
  REQUIRE(BoxTracker::destroyed == 1);
}

TEST_CASE("alias_box: Boxed string is read through aliases", "[alias_box]")
{
  auto box   = make_alias_box<std::string>("shared text");
  auto alias = box.alias();
  REQUIRE(*alias == "shared text");
  REQUIRE(alias->size() == box->size());
}
