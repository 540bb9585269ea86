/**
 * @file connection_config.h
 * @brief Credentials and location of an S3-compatible bucket
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_CONFIG_CONNECTION_CONFIG_H
#define KCENON_STREAMUP_CONFIG_CONNECTION_CONFIG_H

#include "kcenon/streamup/core/types.h"

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Connection settings shared by uploads, downloads and maintenance
 *
 * Region and endpoint are optional. An account id selects Cloudflare R2
 * defaults (region "auto", endpoint https://<account>.r2.cloudflarestorage.com);
 * otherwise AWS defaults apply (region "us-east-1",
 * endpoint https://s3.<region>.amazonaws.com).
 */
struct connection_config {
    /// Access key id
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Session token for temporary credentials
    std::optional<std::string> session_token;

    /// Target bucket
    std::string bucket;

    /// Cloudflare account id (R2)
    std::string account_id;

    /// Explicit endpoint URL (overrides account-derived endpoint)
    std::string endpoint;

    /// Signing region (empty = derived)
    std::string region;

    /// Force path-style addressing even on the AWS endpoint
    bool force_path_style = false;

    /// Per-request timeout
    std::chrono::milliseconds request_timeout{30000};

    /**
     * @brief Region used for request signing
     */
    [[nodiscard]] auto resolved_region() const -> std::string;

    /**
     * @brief Base endpoint URL without trailing slash
     */
    [[nodiscard]] auto resolved_endpoint() const -> std::string;

    /**
     * @brief Whether requests address the bucket in the path
     *
     * True for custom and R2 endpoints.
     */
    [[nodiscard]] auto uses_path_style() const -> bool;

    /**
     * @brief Check required fields
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CONFIG_CONNECTION_CONFIG_H
