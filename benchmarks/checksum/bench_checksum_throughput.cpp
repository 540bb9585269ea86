/**
 * @file bench_checksum_throughput.cpp
 * @brief Benchmarks for streaming MD5 and SHA-256 digests
 */

#include <benchmark/benchmark.h>

#include <kcenon/streamup/core/checksum.h>
#include <kcenon/streamup/io/byte_stream.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>

namespace kcenon::streamup::benchmark {

/**
 * @brief Digest a buffer fed in blocks of the given size
 */
static void run_accumulator(::benchmark::State& state, checksum_algorithm algo) {
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto block = static_cast<std::size_t>(state.range(1));
    auto data = test_data_generator::generate_random_data(total, 42);

    for (auto _ : state) {
        checksum_accumulator acc(algo);
        for (std::size_t offset = 0; offset < total; offset += block) {
            auto n = std::min(block, total - offset);
            if (!acc.update(std::span<const std::byte>(data.data() + offset, n))) {
                state.SkipWithError("update failed");
                return;
            }
        }
        auto digest = acc.finalize();
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_MD5(::benchmark::State& state) {
    run_accumulator(state, checksum_algorithm::md5);
}

static void BM_Checksum_SHA256(::benchmark::State& state) {
    run_accumulator(state, checksum_algorithm::sha256);
}

/**
 * @brief Digest of a file read through file_source
 */
static void BM_Checksum_MD5_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("checksum_source.bin", file_size, 42);
    byte_buffer buffer(256 * sizes::KB);

    for (auto _ : state) {
        auto source = file_source::open(path);
        if (!source) {
            state.SkipWithError("failed to open source file");
            return;
        }
        checksum_accumulator acc(checksum_algorithm::md5);
        for (;;) {
            auto n = source.value()->read(buffer);
            if (!n) {
                state.SkipWithError("read failed");
                return;
            }
            if (n.value() == 0) {
                break;
            }
            (void)acc.update(std::span<const std::byte>(buffer.data(), n.value()));
        }
        auto digest = acc.finalize();
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_MD5)
    ->Args({static_cast<int64_t>(sizes::min_part), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::min_part), static_cast<int64_t>(sizes::MB)})
    ->Args({static_cast<int64_t>(sizes::default_part), static_cast<int64_t>(sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Args({static_cast<int64_t>(sizes::min_part), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::min_part), static_cast<int64_t>(sizes::MB)})
    ->Args({static_cast<int64_t>(sizes::default_part), static_cast<int64_t>(sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_MD5_File)
    ->Arg(static_cast<int64_t>(sizes::small_object))
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::streamup::benchmark
