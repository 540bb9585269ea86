/**
 * @file upload_config.h
 * @brief Configuration of a streaming multipart upload
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_UPLOAD_UPLOAD_CONFIG_H
#define KCENON_STREAMUP_UPLOAD_UPLOAD_CONFIG_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/config/connection_config.h"
#include "kcenon/streamup/core/retry_policy.h"
#include "kcenon/streamup/core/service_limits.h"
#include "kcenon/streamup/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Progress callback invoked after each uploaded part
 *
 * Receives cumulative totals. Runs on the worker that finished the part,
 * with no lock held, so calls from different workers may overlap and arrive
 * out of order. The callback must be thread-safe.
 */
using progress_callback = std::function<void(uint64_t bytes_uploaded, uint32_t parts_uploaded)>;

/**
 * @brief Upload settings
 *
 * Zero-valued workers, queue size, retry delays and multiplier are replaced
 * with their defaults by normalized(). max_retries = 0 disables retries.
 */
struct upload_config {
    static constexpr std::size_t default_workers = 4;
    static constexpr std::size_t default_queue_size = 10;

    /// Credentials and bucket location
    connection_config connection;

    /// Object key
    std::string key;

    /// Declared object size in bytes (> 0)
    uint64_t total_size = 0;

    /// Concurrent part uploads
    std::size_t workers = default_workers;

    /// Capacity of the part queue between the reader and the workers
    std::size_t queue_size = default_queue_size;

    /// Memory budget in MiB for resident parts (0 = unbounded)
    uint64_t max_memory_mb = 0;

    /// Per-part retry tuning
    retry_config retry;

    /// Multipart limits of the target service
    service_limits limits;

    /// Object metadata sent when the session begins
    object_metadata metadata;

    /// Compute a digest of the uploaded bytes
    bool calculate_checksum = true;

    /// Digest algorithm ("md5" or "sha256")
    std::string checksum_algorithm = "md5";

    /// Optional progress callback
    progress_callback on_progress;

    /**
     * @brief Full validation including the connection settings
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Validate everything except the connection settings
     *
     * Used when the caller supplies the storage backend directly.
     */
    [[nodiscard]] auto validate_transfer_settings() const -> result<void>;

    /**
     * @brief Copy with zero-valued tuning replaced by defaults
     */
    [[nodiscard]] auto normalized() const -> upload_config;
};

/**
 * @brief Fluent builder for upload_config
 *
 * @code
 * auto config = upload_config_builder()
 *     .with_credentials("AKIA...", "secret")
 *     .with_bucket("backups")
 *     .with_key("db/2024-01-01.tar.gz")
 *     .with_total_size(70 * gib)
 *     .with_workers(8)
 *     .with_memory_limit_mb(2048)
 *     .build();
 * @endcode
 */
class upload_config_builder {
public:
    upload_config_builder() = default;

    auto with_connection(const connection_config& connection) -> upload_config_builder&;
    auto with_credentials(const std::string& access_key_id,
                          const std::string& secret_access_key) -> upload_config_builder&;
    auto with_session_token(const std::string& token) -> upload_config_builder&;
    auto with_bucket(const std::string& bucket) -> upload_config_builder&;
    auto with_account_id(const std::string& account_id) -> upload_config_builder&;
    auto with_endpoint(const std::string& endpoint) -> upload_config_builder&;
    auto with_region(const std::string& region) -> upload_config_builder&;
    auto with_path_style(bool enable) -> upload_config_builder&;
    auto with_request_timeout(std::chrono::milliseconds timeout) -> upload_config_builder&;

    auto with_key(const std::string& key) -> upload_config_builder&;
    auto with_total_size(uint64_t bytes) -> upload_config_builder&;

    /**
     * @brief Set worker count and part queue capacity
     */
    auto with_workers(std::size_t workers) -> upload_config_builder&;
    auto with_queue_size(std::size_t queue_size) -> upload_config_builder&;
    auto with_memory_limit_mb(uint64_t megabytes) -> upload_config_builder&;

    auto with_retry(const retry_config& retry) -> upload_config_builder&;
    auto with_service_limits(const service_limits& limits) -> upload_config_builder&;

    auto with_content_type(const std::string& content_type) -> upload_config_builder&;
    auto with_content_disposition(const std::string& value) -> upload_config_builder&;
    auto with_content_encoding(const std::string& value) -> upload_config_builder&;
    auto with_content_language(const std::string& value) -> upload_config_builder&;
    auto with_cache_control(const std::string& value) -> upload_config_builder&;
    auto with_user_metadata(const std::string& key, const std::string& value)
        -> upload_config_builder&;

    /**
     * @brief Enable the content digest with the given algorithm
     */
    auto with_checksum(const std::string& algorithm) -> upload_config_builder&;
    auto without_checksum() -> upload_config_builder&;

    auto with_progress_callback(progress_callback callback) -> upload_config_builder&;

    /**
     * @brief Validate and return the configuration with defaults applied
     */
    [[nodiscard]] auto build() const -> result<upload_config>;

private:
    upload_config config_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_UPLOAD_UPLOAD_CONFIG_H
