/**
 * @file  bench/bench_dispatch.cpp
 * @brief Google Benchmark suite for tagged-array dispatch overhead.
 *
 * Benchmarks
 * ----------
 *   BM_Kernel_Add          raw unit-aware addition, no tag handling
 *   BM_Dispatch_Add        same addition through the cosmo dispatch layer
 *   BM_Dispatch_AddMixed   addition with a frame conversion on one operand
 *   BM_Dispatch_Multiply   exponent-combining multiplication
 *   BM_ToPhysical          comoving → physical conversion
 *   BM_EncodeDecodeState   binary state round trip
 *
 * Build (CMake):
 *   cmake -DCOSMOTAG_BENCH=ON ..
 *   cmake --build build --target bench_dispatch
 *   ./build/bench_dispatch --benchmark_format=json
 *
 * Throughput units: items/second (elements processed).
 */

#include "benchmark/benchmark.h"

#include "cosmotag/cosmo_array.hpp"
#include "cosmotag/dispatch.hpp"
#include "cosmotag/kernels.hpp"
#include "cosmotag/serialize.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace cosmotag;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::vector<double> make_values(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = 1.0 + static_cast<double>(i);
    }
    return v;
}

static CosmoArray make_array(std::size_t n, bool comoving) {
    return CosmoArray(make_values(n), "kpc",
                      TagState{.comoving = comoving,
                               .cosmo_factor = ScaleFactorExponent(Rational(1), 0.5)});
}

static void set_items(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Arithmetic ─────────────────────────────────────────────────────────────────

static void BM_Kernel_Add(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    for (auto _ : state) {
        Quantity r = kernels::binary(Ufunc::add, x.quantity(), x.quantity());
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_Kernel_Add)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Dispatch_Add(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    for (auto _ : state) {
        CosmoArray r = x + x;
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_Dispatch_Add)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Dispatch_AddMixed(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    const CosmoArray y = make_array(n, false);
    for (auto _ : state) {
        CosmoArray r = x + y;
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_Dispatch_AddMixed)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Dispatch_Multiply(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    for (auto _ : state) {
        CosmoArray r = x * x;
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_Dispatch_Multiply)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

// ── Conversion and state ───────────────────────────────────────────────────────

static void BM_ToPhysical(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    for (auto _ : state) {
        CosmoArray r = x.to_physical();
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_ToPhysical)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_EncodeDecodeState(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const CosmoArray x = make_array(n, true);
    for (auto _ : state) {
        CosmoArray r = decode_state(encode_state(x));
        benchmark::DoNotOptimize(r);
    }
    set_items(state, n);
}
BENCHMARK(BM_EncodeDecodeState)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
