// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <benchmark/benchmark.h>

#include <cstddef>
#include <memory>
#include <vector>

#include <boost/smart_ptr/local_shared_ptr.hpp>
#include <boost/smart_ptr/make_local_shared.hpp>

#include <aliasing/alias_ptr/alias_ptr.hpp>
#include <aliasing/alias_ptr/traits.hpp>
#include <aliasing/cell/cell.hpp>

using namespace aliasing;

// ============================================================================
// CONFIGURATION
// ============================================================================

using AtomicPtr = std::shared_ptr<cell<int>>;
using LocalPtr  = boost::local_shared_ptr<cell<int>>;
using AliasPtr  = alias_ptr<cell<int>>;

template <typename Ptr> struct handle_factory;

template <> struct handle_factory<AtomicPtr> {
  static AtomicPtr make(int v) { return std::make_shared<cell<int>>(v); }
};

template <> struct handle_factory<LocalPtr> {
  static LocalPtr make(int v) { return boost::make_local_shared<cell<int>>(v); }
};

template <> struct handle_factory<AliasPtr> {
  static AliasPtr make(int v) { return make_alias<cell<int>>(v); }
};

template <typename Ptr> static void release(Ptr& p)
{
  if constexpr (ManualLifetime<Ptr>) {
    p.destroy();
  }
}

// ============================================================================
// BENCHMARK: Duplication (The Key Differentiator)
// ============================================================================

template <typename Ptr> static void BM_Duplicate(benchmark::State& state)
{
  auto src = handle_factory<Ptr>::make(1);
  for (auto _ : state) {
    Ptr copy = src;
    benchmark::DoNotOptimize(copy.get());
  }
  release(src);
}

// Fan-out: one cell referenced from N slots, as in a graph with shared nodes.
template <typename Ptr> static void BM_FanOut(benchmark::State& state)
{
  std::size_t N   = state.range(0);
  auto        src = handle_factory<Ptr>::make(1);
  for (auto _ : state) {
    std::vector<Ptr> slots(N, src);
    benchmark::DoNotOptimize(slots.data());
  }
  release(src);
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// ============================================================================
// BENCHMARK: Creation and teardown (Allocation Overhead)
// ============================================================================

template <typename Ptr> static void BM_CreateRelease(benchmark::State& state)
{
  for (auto _ : state) {
    auto p = handle_factory<Ptr>::make(1);
    benchmark::DoNotOptimize(p.get());
    release(p);
  }
}

// ============================================================================
// BENCHMARK: Access through many aliases
// ============================================================================

template <typename Ptr> static void BM_SharedWrite(benchmark::State& state)
{
  auto src = handle_factory<Ptr>::make(0);
  Ptr  a   = src;
  Ptr  b   = src;
  for (auto _ : state) {
    a->set(a->get() + 1);
    b->set(b->get() + 1);
    benchmark::DoNotOptimize(src->get());
  }
  release(src);
}

// ============================================================================
// BENCHMARK: Interleaved Work (Latency Hiding)
// Non-atomic copies leave the arithmetic pipeline alone; atomic increments
// serialize it.
// ============================================================================

template <typename Ptr> static void BM_InterleavedWork(benchmark::State& state)
{
  auto src = handle_factory<Ptr>::make(1);

  volatile int input = 42;

  for (auto _ : state) {
    int a = input;
    int b = 1;

    a += b;
    b += a;
    a += b;
    b += a;

    Ptr copy = src;

    a += b;
    b += a;
    a += b;
    b += a;

    benchmark::DoNotOptimize(a);
    benchmark::DoNotOptimize(copy.get());
  }
  release(src);
}

// ============================================================================
// REGISTER BENCHMARKS
// ============================================================================

BENCHMARK_TEMPLATE(BM_Duplicate, AtomicPtr);
BENCHMARK_TEMPLATE(BM_Duplicate, LocalPtr);
BENCHMARK_TEMPLATE(BM_Duplicate, AliasPtr);

BENCHMARK_TEMPLATE(BM_FanOut, AtomicPtr)->Range(8, 8 << 10);
BENCHMARK_TEMPLATE(BM_FanOut, LocalPtr)->Range(8, 8 << 10);
BENCHMARK_TEMPLATE(BM_FanOut, AliasPtr)->Range(8, 8 << 10);

BENCHMARK_TEMPLATE(BM_CreateRelease, AtomicPtr);
BENCHMARK_TEMPLATE(BM_CreateRelease, LocalPtr);
BENCHMARK_TEMPLATE(BM_CreateRelease, AliasPtr);

BENCHMARK_TEMPLATE(BM_SharedWrite, AtomicPtr);
BENCHMARK_TEMPLATE(BM_SharedWrite, LocalPtr);
BENCHMARK_TEMPLATE(BM_SharedWrite, AliasPtr);

BENCHMARK_TEMPLATE(BM_InterleavedWork, AtomicPtr);
BENCHMARK_TEMPLATE(BM_InterleavedWork, LocalPtr);
BENCHMARK_TEMPLATE(BM_InterleavedWork, AliasPtr);

BENCHMARK_MAIN();
