/**
 * @file part_size_calculator.cpp
 * @brief Part size selection
 */

#include "kcenon/streamup/core/part_size_calculator.h"

#include <algorithm>
#include <string>

namespace kcenon::streamup {

auto part_size_calculator::calculate(uint64_t total_size,
                                     uint64_t max_memory_mb,
                                     std::size_t workers,
                                     std::size_t queue_depth,
                                     const service_limits& limits) -> result<uint64_t> {
    if (auto valid = limits.validate(); !valid) {
        return unexpected{valid.error()};
    }

    const auto max_object = limits.max_object_size();
    if (total_size > max_object) {
        return unexpected{error{error_code::size_exceeds_limits,
            "size " + std::to_string(total_size) + " bytes exceeds service limit of " +
            std::to_string(max_object) + " bytes (" + std::to_string(max_object / gib) +
            " GiB)"}};
    }

    uint64_t part_size = total_size / target_parts;

    if (max_memory_mb > 0) {
        const auto slots = std::max<uint64_t>(1, static_cast<uint64_t>(workers + queue_depth));
        const auto memory_cap = max_memory_mb * mib / slots;
        part_size = std::min(part_size, memory_cap);
    }

    part_size = round_to_nearest_mb(part_size);
    part_size = std::clamp(part_size, limits.min_part_size, limits.max_part_size);

    if (part_count(total_size, part_size) > limits.max_parts) {
        part_size = (total_size + limits.max_parts - 1) / limits.max_parts;
        part_size = round_to_nearest_mb(part_size);
        // Rounding down may leave one part too many
        if (part_count(total_size, part_size) > limits.max_parts) {
            part_size += mib;
        }
        part_size = std::max(part_size, limits.min_part_size);

        if (part_size > limits.max_part_size) {
            return unexpected{error{error_code::size_exceeds_limits,
                "size " + std::to_string(total_size) +
                " bytes cannot be uploaded with given limits (would require part size " +
                std::to_string(part_size / mib) + " MiB, max is " +
                std::to_string(limits.max_part_size / mib) + " MiB)"}};
        }
    }

    return part_size;
}

}  // namespace kcenon::streamup
