/**
 * @file  bench/bench_engine.cpp
 * @brief Google Benchmark suite for segment density, sweeps and the engine.
 *
 * Benchmarks
 * ----------
 *   BM_Xi_Scalar              per-radius SegmentDensity::evaluate loop
 *   BM_Xi_Sweep               Eigen array sweep over the same radii
 *   BM_Engine_Compute         single-object pipeline
 *   BM_Engine_Batch           sequential batch
 *   BM_Engine_BatchParallel   threaded batch, arg = worker count
 *
 * Build (CMake):
 *   cmake --build build --target bench_engine
 *   ./build/bench_engine --benchmark_format=json
 *
 * Throughput units: items/second (radii or objects processed).
 */

#include "benchmark/benchmark.h"

#include "ssz/constants.hpp"
#include "ssz/engine.hpp"
#include "ssz/segment_density.hpp"
#include "ssz/sweep.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N synthetic objects spread across every regime, each with an observation.
static std::vector<ssz::CelestialObject> make_objects(std::size_t n) {
    std::vector<ssz::CelestialObject> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double frac = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        const double m    = 1.0 + 1e3 * frac;
        const double x    = 1.1 + 40.0 * frac;
        v.push_back(ssz::CelestialObject{
            .name         = "bench_" + std::to_string(i),
            .mass_msun    = m,
            .radius_m     = x * 2953.34 * m,
            .velocity_mps = 1e5 * frac,
            .z_obs        = 0.05 + 0.1 * frac,
        });
    }
    return v;
}

// ── Ξ evaluation ───────────────────────────────────────────────────────────────

static void BM_Xi_Scalar(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const ssz::RunConfig cfg{};
    const auto x = ssz::sweep::logspace(-2.0, 4.0, n);
    std::vector<double> out(static_cast<std::size_t>(n));
    for (auto _ : state) {
        for (Eigen::Index i = 0; i < n; ++i) {
            out[static_cast<std::size_t>(i)] =
                ssz::density::SegmentDensity::evaluate(x(i), 1.0, ssz::XiMode::Auto, cfg)
                    .value_or(0.0);
        }
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Xi_Scalar)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Xi_Sweep(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const ssz::RunConfig cfg{};
    const auto x = ssz::sweep::logspace(-2.0, 4.0, n);
    for (auto _ : state) {
        auto xi = ssz::sweep::xi(x, ssz::XiMode::Auto, cfg);
        benchmark::DoNotOptimize(xi);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Xi_Sweep)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_Engine_Compute(benchmark::State& state) {
    const ssz::core::Engine engine;
    const ssz::CelestialObject ns{
        .name         = "NS",
        .mass_msun    = 1.4,
        .radius_m     = 12e3,
        .velocity_mps = 0.0,
        .z_obs        = 0.24,
    };
    for (auto _ : state) {
        auto r = engine.compute(ns);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_Compute);

static void BM_Engine_Batch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto objects = make_objects(n);
    const ssz::core::Engine engine;
    for (auto _ : state) {
        auto out = engine.compute_batch(objects);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Engine_Batch)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Engine_BatchParallel(benchmark::State& state) {
    constexpr std::size_t n = 32768;
    const auto objects = make_objects(n);
    const ssz::core::Engine engine;
    const auto threads = static_cast<unsigned>(state.range(0));
    for (auto _ : state) {
        auto out = engine.compute_batch_parallel(objects, threads);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Engine_BatchParallel)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
