/**
 * @file bench_part_size_calculator.cpp
 * @brief Benchmarks for part size selection and service limit checks
 */

#include <benchmark/benchmark.h>

#include <kcenon/streamup/core/part_size_calculator.h>
#include <kcenon/streamup/core/service_limits.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::streamup::benchmark {

/**
 * @brief Part size for a declared object size, unbounded memory
 */
static void BM_PartSize_Unbounded(::benchmark::State& state) {
    const auto total_size = static_cast<uint64_t>(state.range(0)) * sizes::MB;
    const auto limits = service_limits::s3();

    for (auto _ : state) {
        auto part_size = part_size_calculator::calculate(total_size, 0, 4, 10, limits);
        ::benchmark::DoNotOptimize(part_size);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Part size under a memory budget
 */
static void BM_PartSize_MemoryBounded(::benchmark::State& state) {
    const auto total_size = static_cast<uint64_t>(state.range(0)) * sizes::MB;
    const auto memory_mb = static_cast<uint64_t>(state.range(1));
    const auto limits = service_limits::r2();

    for (auto _ : state) {
        auto part_size = part_size_calculator::calculate(total_size, memory_mb, 8, 16, limits);
        ::benchmark::DoNotOptimize(part_size);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Limit validation done once per upload configuration
 */
static void BM_ServiceLimits_Validate(::benchmark::State& state) {
    const auto limits = service_limits::minio();

    for (auto _ : state) {
        auto valid = limits.validate();
        ::benchmark::DoNotOptimize(valid);
    }
}

BENCHMARK(BM_PartSize_Unbounded)
    ->Arg(1)
    ->Arg(1024)
    ->Arg(70 * 1024)
    ->Arg(5 * 1024 * 1024)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_PartSize_MemoryBounded)
    ->Args({70 * 1024, 512})
    ->Args({70 * 1024, 2048})
    ->Args({1024 * 1024, 4096})
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_ServiceLimits_Validate)->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::streamup::benchmark
