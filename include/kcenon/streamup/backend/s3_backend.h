/**
 * @file s3_backend.h
 * @brief S3-compatible storage backend over the REST API
 * @version 0.1.0
 *
 * Works against AWS S3, Cloudflare R2, Backblaze B2 and MinIO. Requests
 * are signed with SigV4 and sent through an http_client_interface, so the
 * transport can be replaced in tests.
 */

#ifndef KCENON_STREAMUP_BACKEND_S3_BACKEND_H
#define KCENON_STREAMUP_BACKEND_S3_BACKEND_H

#include "kcenon/streamup/backend/http_client.h"
#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/config/connection_config.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Tuning for the S3 backend
 */
struct s3_backend_options {
    /// Bytes fetched per ranged GET when streaming an object
    uint64_t read_window = 8 * mib;

    /// User-Agent header (empty = build_info::current().user_agent())
    std::string user_agent;
};

/**
 * @brief storage_backend implementation for S3-compatible services
 *
 * HTTP failures are mapped onto the error taxonomy: 404 becomes
 * object_not_found (upload_not_found for NoSuchUpload), 403 access_denied,
 * 429 and SlowDown throttled, 503 service_unavailable, 408 request_timeout
 * and other 5xx internal_service_error. The HTTP status and the service
 * error code are kept on the error.
 *
 * @note upload_part() may be called concurrently.
 */
class s3_backend : public storage_backend {
public:
    using clock_function = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Create a backend after validating the connection settings
     * @param connection Credentials and bucket location
     * @param client HTTP transport (nullptr = make_http_client())
     * @param options Backend tuning
     */
    [[nodiscard]] static auto create(const connection_config& connection,
                                     std::shared_ptr<http_client_interface> client = nullptr,
                                     s3_backend_options options = {})
        -> result<std::shared_ptr<s3_backend>>;

    ~s3_backend() override;

    s3_backend(const s3_backend&) = delete;
    auto operator=(const s3_backend&) -> s3_backend& = delete;

    // storage_backend
    [[nodiscard]] auto begin_multipart(const std::string& key,
                                       const object_metadata& metadata)
        -> result<std::string> override;
    [[nodiscard]] auto upload_part(const std::string& key,
                                   const std::string& upload_id,
                                   uint32_t part_number,
                                   std::span<const std::byte> data)
        -> result<std::string> override;
    [[nodiscard]] auto complete_multipart(const std::string& key,
                                          const std::string& upload_id,
                                          const std::vector<completed_part>& parts)
        -> result<multipart_completion> override;
    [[nodiscard]] auto abort_multipart(const std::string& key,
                                       const std::string& upload_id)
        -> result<void> override;
    [[nodiscard]] auto head_object(const std::string& key) -> result<object_info> override;
    [[nodiscard]] auto get_object(const std::string& key)
        -> result<std::unique_ptr<byte_source>> override;
    [[nodiscard]] auto list_multipart_sessions(const session_list_request& request)
        -> result<session_list_page> override;
    [[nodiscard]] auto list_objects(const object_list_request& request)
        -> result<object_list_page> override;
    [[nodiscard]] auto delete_object(const std::string& key) -> result<void> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "s3"; }

    /**
     * @brief Replace the signing clock (tests)
     */
    void set_clock(clock_function clock);

    /**
     * @brief Request URL for an object key (no query string)
     */
    [[nodiscard]] auto object_url(const std::string& key) const -> std::string;

    /**
     * @brief Map a non-success response onto an error
     */
    [[nodiscard]] static auto map_response_error(const http_response& response,
                                                 std::string_view operation) -> error;

    /**
     * @brief Build the CompleteMultipartUpload request body
     */
    [[nodiscard]] static auto build_complete_xml(const std::vector<completed_part>& parts)
        -> std::string;

private:
    s3_backend(const connection_config& connection,
               std::shared_ptr<http_client_interface> client,
               s3_backend_options options);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_BACKEND_S3_BACKEND_H
