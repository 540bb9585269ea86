/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_STREAMUP_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_STREAMUP_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/streamup/core/types.h>
#include <kcenon/streamup/io/byte_stream.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::streamup::benchmark {

/**
 * @brief Deterministic payload generation
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0) -> byte_buffer;

    /**
     * @brief Generate log-like text data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_text_data(std::size_t size, uint32_t seed = 0) -> byte_buffer;
};

/**
 * @brief Source that replays one buffer until a byte budget is spent
 *
 * Lets throughput benchmarks stream large objects without holding them.
 */
class repeating_source : public byte_source {
public:
    repeating_source(const byte_buffer& block, uint64_t total_size);

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    const byte_buffer& block_;
    uint64_t remaining_;
    std::size_t offset_ = 0;
};

/**
 * @brief Manages temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format throughput as human-readable string (e.g. "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_object = 6 * MB;
constexpr std::size_t medium_object = 64 * MB;
constexpr std::size_t large_object = 256 * MB;

// Part sizes around the service minimum
constexpr std::size_t min_part = 5 * MB;
constexpr std::size_t default_part = 16 * MB;
}  // namespace sizes

}  // namespace kcenon::streamup::benchmark

#endif  // KCENON_STREAMUP_BENCHMARKS_BENCHMARK_HELPERS_H
