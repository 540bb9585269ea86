/**
 * @file part_size_calculator.h
 * @brief Chooses a multipart part size from object size, memory and limits
 */

#ifndef KCENON_STREAMUP_CORE_PART_SIZE_CALCULATOR_H
#define KCENON_STREAMUP_CORE_PART_SIZE_CALCULATOR_H

#include "kcenon/streamup/core/service_limits.h"
#include "kcenon/streamup/core/types.h"

#include <cstddef>
#include <cstdint>

namespace kcenon::streamup {

/**
 * @brief Pure, deterministic part size selection
 *
 * The calculator aims for about target_parts parts, caps the part size so
 * that (workers + queue_depth) resident parts fit in the memory budget,
 * rounds to whole MiB and clamps to the service limits. Peak memory of the
 * upload pipeline is part_size * (workers + queue_depth).
 *
 * Examples with the default tuning (4 workers, queue 10):
 * - 70 GiB  -> 72 MiB parts, ~1 GiB resident
 * - 500 GiB -> 512 MiB parts, ~7 GiB resident
 * - 500 GiB with a 2048 MiB budget -> 146 MiB parts, 3507 parts
 */
class part_size_calculator {
public:
    /// Part count the calculator aims for
    static constexpr uint64_t target_parts = 1000;

    /**
     * @brief Calculate the part size
     * @param total_size Object size in bytes
     * @param max_memory_mb Memory budget in MiB (0 = unbounded)
     * @param workers Concurrent upload workers
     * @param queue_depth Capacity of the part queue
     * @param limits Service limits
     * @return Part size in bytes, or a configuration error
     */
    [[nodiscard]] static auto calculate(uint64_t total_size,
                                        uint64_t max_memory_mb,
                                        std::size_t workers,
                                        std::size_t queue_depth,
                                        const service_limits& limits) -> result<uint64_t>;

    /**
     * @brief Peak resident bytes for a pipeline configuration
     */
    [[nodiscard]] static constexpr auto memory_usage(uint64_t part_size,
                                                     std::size_t workers,
                                                     std::size_t queue_depth) noexcept
        -> uint64_t {
        return part_size * static_cast<uint64_t>(workers + queue_depth);
    }

    /**
     * @brief Number of parts needed for an object (ceil division)
     */
    [[nodiscard]] static constexpr auto part_count(uint64_t total_size,
                                                   uint64_t part_size) noexcept -> uint64_t {
        if (part_size == 0) {
            return 0;
        }
        return (total_size + part_size - 1) / part_size;
    }

    /**
     * @brief Round to the nearest MiB, up at the midpoint
     */
    [[nodiscard]] static constexpr auto round_to_nearest_mb(uint64_t size) noexcept -> uint64_t {
        auto remainder = size % mib;
        if (remainder < mib / 2) {
            return size - remainder;
        }
        return size + (mib - remainder);
    }
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_PART_SIZE_CALCULATOR_H
