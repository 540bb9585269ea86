/**
 * @file validation.h
 * @brief Input validation for object keys and user metadata
 */

#ifndef KCENON_STREAMUP_CORE_VALIDATION_H
#define KCENON_STREAMUP_CORE_VALIDATION_H

#include "kcenon/streamup/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace kcenon::streamup {

/// Longest object key accepted by S3-compatible services (bytes)
inline constexpr std::size_t max_object_key_length = 1024;

/// Longest user metadata key (bytes)
inline constexpr std::size_t max_metadata_key_length = 128;

/// Longest user metadata value (bytes)
inline constexpr std::size_t max_metadata_value_length = 256;

/**
 * @brief Validate an object key
 *
 * Rejects empty and oversized keys, NUL and control characters, "../" and
 * "..\" sequences, and leading or trailing whitespace. Keys containing "//"
 * are accepted but logged as suspicious.
 */
[[nodiscard]] auto validate_object_key(std::string_view key) -> result<void>;

/**
 * @brief Validate one user metadata entry
 *
 * Values must not contain CR or LF since they become HTTP header values.
 */
[[nodiscard]] auto validate_metadata_entry(std::string_view key,
                                           std::string_view value) -> result<void>;

/**
 * @brief Validate every entry of a metadata map
 */
[[nodiscard]] auto validate_metadata(const std::map<std::string, std::string>& metadata)
    -> result<void>;

/**
 * @brief Render a byte count for humans ("512 B", "1.50 KB", "70.00 MB")
 */
[[nodiscard]] auto format_size(uint64_t bytes) -> std::string;

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_VALIDATION_H
