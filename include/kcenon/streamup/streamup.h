/**
 * @file streamup.h
 * @brief Main header for the streamup library
 * @version 1.0.0
 *
 * Streams arbitrarily large inputs into S3-compatible object storage with
 * multipart uploads, holding only (workers + queue_size) parts in memory,
 * and streams objects back out.
 *
 * @code
 * #include <kcenon/streamup/streamup.h>
 *
 * using namespace kcenon::streamup;
 *
 * auto config = upload_config_builder()
 *     .with_credentials(access_key, secret_key)
 *     .with_bucket("backups")
 *     .with_key("db.tar.gz")
 *     .with_total_size(size)
 *     .build();
 *
 * auto up = uploader::create(config.value());
 * istream_source input(std::cin);
 * auto result = up.value()->upload(input);
 * @endcode
 */

#ifndef KCENON_STREAMUP_STREAMUP_H
#define KCENON_STREAMUP_STREAMUP_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/core/build_info.h"
#include "kcenon/streamup/core/checksum.h"
#include "kcenon/streamup/core/content_type.h"
#include "kcenon/streamup/core/part_size_calculator.h"
#include "kcenon/streamup/core/retry_policy.h"
#include "kcenon/streamup/core/service_limits.h"
#include "kcenon/streamup/core/validation.h"

// Streams and backends
#include "kcenon/streamup/io/byte_stream.h"
#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/backend/memory_backend.h"
#include "kcenon/streamup/backend/s3_backend.h"

// Transfers
#include "kcenon/streamup/upload/upload_config.h"
#include "kcenon/streamup/upload/uploader.h"
#include "kcenon/streamup/download/downloader.h"

// Maintenance
#include "kcenon/streamup/maintenance/cleanup.h"
#include "kcenon/streamup/maintenance/object_lister.h"

namespace kcenon::streamup {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 1;
    static constexpr int minor = 0;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_STREAMUP_H
