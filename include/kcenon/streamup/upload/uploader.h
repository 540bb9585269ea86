/**
 * @file uploader.h
 * @brief Streaming multipart uploader
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_UPLOAD_UPLOADER_H
#define KCENON_STREAMUP_UPLOAD_UPLOADER_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/io/byte_stream.h"
#include "kcenon/streamup/upload/upload_config.h"
#include "kcenon/streamup/upload/upload_session.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Outcome of a successful upload
 */
struct upload_result {
    std::string key;
    std::string upload_id;

    /// ETag of the assembled object
    std::string etag;

    /// Location reported by the backend
    std::string location;

    uint64_t bytes_uploaded = 0;
    uint32_t parts_uploaded = 0;
    uint64_t part_size = 0;

    /// Hex digest of the uploaded bytes (empty when disabled)
    std::string checksum;

    std::chrono::milliseconds duration{0};
};

/**
 * @brief Uploads a byte stream of known size as a multipart object
 *
 * The session controller: validates the configuration, picks the part size,
 * begins the remote session, runs the upload pipeline and completes the
 * session with the part list sorted by part number. Any failure or
 * cancellation aborts the remote session before upload() returns; a failed
 * abort is logged and never replaces the original error.
 *
 * An uploader performs one upload. abort() may be called from any thread.
 *
 * @code
 * auto up = uploader::create(config);
 * if (!up) {
 *     return up.error();
 * }
 * auto source = file_source::open("backup.tar");
 * auto res = up.value()->upload(*source.value());
 * @endcode
 */
class uploader {
public:
    /**
     * @brief Create an uploader talking to an S3-compatible service
     *
     * Validates the whole configuration before any network call.
     */
    [[nodiscard]] static auto create(const upload_config& config)
        -> result<std::unique_ptr<uploader>>;

    /**
     * @brief Create an uploader for an explicit backend
     *
     * The connection settings of the configuration are not used; the rest is
     * validated when upload() starts.
     */
    uploader(upload_config config, std::shared_ptr<storage_backend> backend);

    ~uploader();

    uploader(const uploader&) = delete;
    auto operator=(const uploader&) -> uploader& = delete;

    /**
     * @brief Upload the whole source
     *
     * Blocks until the remote session is completed or aborted.
     */
    [[nodiscard]] auto upload(byte_source& source) -> result<upload_result>;

    /**
     * @brief Cancel the upload and abort the remote session
     *
     * Cancels the shared token. If a remote session exists and has not been
     * aborted yet it is aborted now; the remote abort happens at most once
     * whichever path gets there first. Without a remote session, or after
     * the upload is done, this only cancels.
     */
    auto abort() -> result<void>;

    /**
     * @brief Hex digest of the uploaded bytes, empty until the upload is done
     */
    [[nodiscard]] auto checksum() const -> std::string;

    [[nodiscard]] auto progress() const -> upload_progress;

    /**
     * @brief Chosen part size (0 before upload() starts)
     */
    [[nodiscard]] auto part_size() const -> uint64_t;

    [[nodiscard]] auto state() const -> upload_state;

    /**
     * @brief Remote session id (empty before the session begins)
     */
    [[nodiscard]] auto upload_id() const -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_UPLOAD_UPLOADER_H
