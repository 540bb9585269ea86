/**
 * @file service_limits.h
 * @brief Multipart constraints imposed by object storage services
 */

#ifndef KCENON_STREAMUP_CORE_SERVICE_LIMITS_H
#define KCENON_STREAMUP_CORE_SERVICE_LIMITS_H

#include "kcenon/streamup/core/types.h"

#include <cstdint>

namespace kcenon::streamup {

/**
 * @brief Part size and part count limits of a multipart service
 *
 * Invariant: min_part_size <= max_part_size, and
 * max_part_size * max_parts bounds the largest uploadable object.
 * Violations are configuration errors reported by validate().
 */
struct service_limits {
    /// Smallest allowed part (every part except the last)
    uint64_t min_part_size = 5 * mib;

    /// Largest allowed part
    uint64_t max_part_size = 5 * gib;

    /// Maximum number of parts in one upload
    uint32_t max_parts = 10000;

    static constexpr uint64_t floor_part_size = 5 * mib;
    static constexpr uint64_t ceiling_part_size = 5 * gib;
    static constexpr uint32_t ceiling_parts = 10000;

    /**
     * @brief Amazon S3 limits
     */
    [[nodiscard]] static auto s3() -> service_limits { return service_limits{}; }

    /**
     * @brief Cloudflare R2 limits (S3 compatible)
     */
    [[nodiscard]] static auto r2() -> service_limits { return service_limits{}; }

    /**
     * @brief Backblaze B2 limits (S3 compatible API)
     */
    [[nodiscard]] static auto b2() -> service_limits { return service_limits{}; }

    /**
     * @brief MinIO defaults
     *
     * MinIO follows the S3 limits unless an administrator changed them.
     */
    [[nodiscard]] static auto minio() -> service_limits { return service_limits{}; }

    /**
     * @brief Validate the limits
     * @return error with code invalid_service_limits when violated
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Largest object these limits can represent
     */
    [[nodiscard]] auto max_object_size() const noexcept -> uint64_t {
        return max_part_size * static_cast<uint64_t>(max_parts);
    }

    [[nodiscard]] auto operator==(const service_limits& other) const -> bool = default;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_SERVICE_LIMITS_H
