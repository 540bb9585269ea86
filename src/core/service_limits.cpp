/**
 * @file service_limits.cpp
 * @brief Service limit validation
 */

#include "kcenon/streamup/core/service_limits.h"

#include <string>

namespace kcenon::streamup {

auto service_limits::validate() const -> result<void> {
    if (min_part_size < floor_part_size) {
        return unexpected{validation_error(error_code::invalid_service_limits,
            "min_part_size", "must be at least 5 MiB")};
    }
    if (max_part_size > ceiling_part_size) {
        return unexpected{validation_error(error_code::invalid_service_limits,
            "max_part_size", "cannot exceed 5 GiB")};
    }
    if (min_part_size > max_part_size) {
        return unexpected{validation_error(error_code::invalid_service_limits,
            "min_part_size", "cannot be greater than max_part_size")};
    }
    if (max_parts == 0 || max_parts > ceiling_parts) {
        return unexpected{validation_error(error_code::invalid_service_limits,
            "max_parts", "must be between 1 and " + std::to_string(ceiling_parts))};
    }
    return {};
}

}  // namespace kcenon::streamup
