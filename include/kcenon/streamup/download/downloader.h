/**
 * @file downloader.h
 * @brief Streaming object download with optional checksum
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_DOWNLOAD_DOWNLOADER_H
#define KCENON_STREAMUP_DOWNLOAD_DOWNLOADER_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/config/connection_config.h"
#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/io/byte_stream.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Progress callback receiving the cumulative bytes written
 */
using download_progress_callback = std::function<void(uint64_t bytes_downloaded)>;

/**
 * @brief Download settings
 */
struct download_config {
    /// Credentials and bucket location
    connection_config connection;

    /// Object key
    std::string key;

    /// Compute a digest of the written bytes
    bool calculate_checksum = false;

    /// Digest algorithm ("md5" or "sha256")
    std::string checksum_algorithm = "md5";

    /// Read buffer size
    std::size_t buffer_size = 256 * kib;

    /// Optional progress callback
    download_progress_callback on_progress;

    /**
     * @brief Full validation including the connection settings
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Validate everything except the connection settings
     */
    [[nodiscard]] auto validate_transfer_settings() const -> result<void>;
};

/**
 * @brief Copies one object into a byte_sink
 *
 * Single-threaded: a head call for the size, then one streaming read. Each
 * block is written to the sink, then hashed, then reported, so the digest
 * always covers exactly the bytes the sink accepted. No retries beyond the
 * backend's own.
 */
class downloader {
public:
    /**
     * @brief Create a downloader talking to an S3-compatible service
     */
    [[nodiscard]] static auto create(const download_config& config)
        -> result<std::unique_ptr<downloader>>;

    /**
     * @brief Create a downloader for an explicit backend
     */
    downloader(download_config config, std::shared_ptr<storage_backend> backend);

    ~downloader();

    downloader(const downloader&) = delete;
    auto operator=(const downloader&) -> downloader& = delete;

    void set_progress_callback(download_progress_callback callback);

    /**
     * @brief Object size from a metadata call
     */
    [[nodiscard]] auto get_size() -> result<uint64_t>;

    /**
     * @brief Stream the object into the sink
     * @return Bytes written
     */
    [[nodiscard]] auto download(byte_sink& sink) -> result<uint64_t>;

    /**
     * @brief Hex digest of the last completed download (empty otherwise)
     */
    [[nodiscard]] auto checksum() const -> std::string;

    /**
     * @brief Stop an in-flight download before its next read
     */
    void abort();

    [[nodiscard]] auto bytes_downloaded() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_DOWNLOAD_DOWNLOADER_H
