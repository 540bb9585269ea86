/**
 * @file bench_pipeline_throughput.cpp
 * @brief End-to-end upload and download throughput against the in-memory backend
 *
 * The backend stores parts in memory, so these numbers bound the pipeline
 * overhead (copying, hashing, hand-off between actors) rather than network
 * throughput.
 */

#include <benchmark/benchmark.h>

#include <kcenon/streamup/core/logging.h>
#include <kcenon/streamup/streamup.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::streamup::benchmark {

namespace {

auto make_config(const std::string& key, uint64_t total_size, std::size_t workers)
    -> upload_config {
    upload_config config;
    config.connection.access_key_id = "AKIDBENCH";
    config.connection.secret_access_key = "bench-secret";
    config.connection.bucket = "bench";
    config.key = key;
    config.total_size = total_size;
    config.workers = workers;
    config.queue_size = workers;
    return config;
}

void quiet_logs() {
    get_logger().set_console_output(false);
}

}  // namespace

/**
 * @brief Upload throughput by object size and worker count
 */
static void BM_Upload_Memory(::benchmark::State& state) {
    quiet_logs();
    const auto total_size = static_cast<uint64_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));
    auto block = test_data_generator::generate_random_data(sizes::MB, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto backend = std::make_shared<memory_backend>();
        uploader up(make_config("bench/upload.bin", total_size, workers), backend);
        repeating_source source(block, total_size);
        state.ResumeTiming();

        auto res = up.upload(source);
        if (!res) {
            state.SkipWithError(res.error().describe().c_str());
            return;
        }
        ::benchmark::DoNotOptimize(res.value().etag);
    }

    state.SetBytesProcessed(static_cast<int64_t>(total_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["workers"] = static_cast<double>(workers);
}

/**
 * @brief Upload throughput with checksumming turned off
 */
static void BM_Upload_Memory_NoChecksum(::benchmark::State& state) {
    quiet_logs();
    const auto total_size = static_cast<uint64_t>(state.range(0));
    auto block = test_data_generator::generate_random_data(sizes::MB, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto backend = std::make_shared<memory_backend>();
        auto config = make_config("bench/plain.bin", total_size, 4);
        config.calculate_checksum = false;
        uploader up(config, backend);
        repeating_source source(block, total_size);
        state.ResumeTiming();

        auto res = up.upload(source);
        if (!res) {
            state.SkipWithError(res.error().describe().c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(total_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Download throughput by read buffer size
 */
static void BM_Download_Memory(::benchmark::State& state) {
    quiet_logs();
    const auto total_size = static_cast<std::size_t>(state.range(0));
    const auto buffer_size = static_cast<std::size_t>(state.range(1));

    auto backend = std::make_shared<memory_backend>();
    backend->put_object("bench/download.bin",
                        test_data_generator::generate_random_data(total_size, 7));

    download_config config;
    config.connection.access_key_id = "AKIDBENCH";
    config.connection.secret_access_key = "bench-secret";
    config.connection.bucket = "bench";
    config.key = "bench/download.bin";
    config.buffer_size = buffer_size;

    for (auto _ : state) {
        downloader dl(config, backend);
        memory_sink sink;
        auto written = dl.download(sink);
        if (!written) {
            state.SkipWithError(written.error().describe().c_str());
            return;
        }
        ::benchmark::DoNotOptimize(sink.data().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(total_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload_Memory)
    ->Args({static_cast<int64_t>(sizes::small_object), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), 4})
    ->Args({static_cast<int64_t>(sizes::medium_object), 8})
    ->Args({static_cast<int64_t>(sizes::large_object), 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Upload_Memory_NoChecksum)
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Download_Memory)
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(256 * sizes::KB)})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::streamup::benchmark
