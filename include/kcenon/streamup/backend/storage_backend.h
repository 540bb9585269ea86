/**
 * @file storage_backend.h
 * @brief Abstract multipart object storage backend
 * @version 0.1.0
 *
 * The upload pipeline, downloader and maintenance helpers talk to object
 * storage exclusively through this interface. s3_backend implements it over
 * the S3 REST API; memory_backend keeps objects in process.
 */

#ifndef KCENON_STREAMUP_BACKEND_STORAGE_BACKEND_H
#define KCENON_STREAMUP_BACKEND_STORAGE_BACKEND_H

#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/io/byte_stream.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Object metadata sent when a multipart session begins
 */
struct object_metadata {
    /// MIME type (auto-detected from the key when empty)
    std::string content_type;

    /// Content-Disposition header
    std::string content_disposition;

    /// Content-Encoding header (auto-detected for compressed extensions)
    std::string content_encoding;

    /// Content-Language header
    std::string content_language;

    /// Cache-Control header
    std::string cache_control;

    /// User metadata (sent as x-amz-meta-*)
    std::map<std::string, std::string> user_metadata;
};

/**
 * @brief Completion token of one uploaded part
 */
struct completed_part {
    /// 1-based part number
    uint32_t part_number = 0;

    /// Token returned by the backend (ETag)
    std::string etag;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Result of a completed multipart upload
 */
struct multipart_completion {
    /// ETag of the assembled object (may be empty)
    std::string etag;

    /// Location reported by the backend (may be empty)
    std::string location;
};

/**
 * @brief Summary of a stored object
 */
struct object_info {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    std::string content_type;
    std::chrono::system_clock::time_point last_modified{};
};

/**
 * @brief Incomplete multipart session on the backend
 */
struct multipart_session_info {
    std::string key;
    std::string upload_id;
    std::chrono::system_clock::time_point initiated{};
    std::string storage_class;
};

/**
 * @brief Query for incomplete multipart sessions
 */
struct session_list_request {
    std::string prefix;
    std::string key_marker;
    std::string upload_id_marker;

    /// Page size hint (0 = backend default)
    uint32_t max_uploads = 0;
};

/**
 * @brief One page of incomplete multipart sessions
 */
struct session_list_page {
    std::vector<multipart_session_info> sessions;
    bool is_truncated = false;
    std::string next_key_marker;
    std::string next_upload_id_marker;
};

/**
 * @brief Query for stored objects
 */
struct object_list_request {
    std::string prefix;
    std::string continuation_token;

    /// Page size hint (0 = backend default)
    uint32_t max_keys = 0;
};

/**
 * @brief One page of stored objects
 */
struct object_list_page {
    std::vector<object_info> objects;
    bool is_truncated = false;
    std::string next_continuation_token;
};

/**
 * @brief Remote object storage with multipart upload support
 *
 * Implementations must be safe for concurrent upload_part() calls on the
 * same session; every other call is issued by one thread at a time.
 * Failures use the error taxonomy of core/types.h and keep the HTTP status
 * and service error code where one exists.
 */
class storage_backend {
public:
    virtual ~storage_backend() = default;

    /**
     * @brief Begin a multipart session
     * @return Session (upload) identifier
     */
    [[nodiscard]] virtual auto begin_multipart(const std::string& key,
                                               const object_metadata& metadata)
        -> result<std::string> = 0;

    /**
     * @brief Upload one part
     * @return Completion token (ETag)
     */
    [[nodiscard]] virtual auto upload_part(const std::string& key,
                                           const std::string& upload_id,
                                           uint32_t part_number,
                                           std::span<const std::byte> data)
        -> result<std::string> = 0;

    /**
     * @brief Assemble the object from parts sorted ascending by part number
     */
    [[nodiscard]] virtual auto complete_multipart(const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<completed_part>& parts)
        -> result<multipart_completion> = 0;

    /**
     * @brief Discard a multipart session and its uploaded parts
     */
    [[nodiscard]] virtual auto abort_multipart(const std::string& key,
                                               const std::string& upload_id)
        -> result<void> = 0;

    /**
     * @brief Fetch object metadata
     */
    [[nodiscard]] virtual auto head_object(const std::string& key) -> result<object_info> = 0;

    /**
     * @brief Open a streaming reader over an object's bytes
     */
    [[nodiscard]] virtual auto get_object(const std::string& key)
        -> result<std::unique_ptr<byte_source>> = 0;

    /**
     * @brief List incomplete multipart sessions (one page)
     */
    [[nodiscard]] virtual auto list_multipart_sessions(const session_list_request& request)
        -> result<session_list_page> = 0;

    /**
     * @brief List stored objects (one page)
     */
    [[nodiscard]] virtual auto list_objects(const object_list_request& request)
        -> result<object_list_page> = 0;

    /**
     * @brief Delete a stored object
     */
    [[nodiscard]] virtual auto delete_object(const std::string& key) -> result<void> = 0;

    /**
     * @brief Short backend name for logs ("s3", "memory")
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_BACKEND_STORAGE_BACKEND_H
