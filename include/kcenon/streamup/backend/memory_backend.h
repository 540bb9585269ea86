/**
 * @file memory_backend.h
 * @brief In-process storage backend
 * @version 0.1.0
 *
 * Keeps objects and multipart sessions in memory with S3-like semantics
 * (quoted MD5 ETags, InvalidPartOrder on unsorted completion lists). Used by
 * tests, examples and benchmarks; the fault hook lets callers script
 * failures and delays per part attempt.
 */

#ifndef KCENON_STREAMUP_BACKEND_MEMORY_BACKEND_H
#define KCENON_STREAMUP_BACKEND_MEMORY_BACKEND_H

#include "kcenon/streamup/backend/storage_backend.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace kcenon::streamup {

/**
 * @brief Thread-safe in-memory storage backend
 */
class memory_backend : public storage_backend {
public:
    /**
     * @brief Hook consulted before a part is stored
     *
     * Receives the part number and the 1-based attempt count for that part.
     * Returning an error fails the attempt. The hook may block to reorder
     * completions.
     */
    using part_hook = std::function<std::optional<error>(uint32_t part_number, uint32_t attempt)>;

    memory_backend();
    ~memory_backend() override;

    memory_backend(const memory_backend&) = delete;
    auto operator=(const memory_backend&) -> memory_backend& = delete;

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
    [[nodiscard]] auto name() const -> std::string_view override { return "memory"; }

    // ========================================================================
    // Test and tooling helpers
    // ========================================================================

    void set_part_hook(part_hook hook);

    /**
     * @brief Store an object directly
     */
    void put_object(const std::string& key, byte_buffer data,
                    std::string content_type = "application/octet-stream");

    /**
     * @brief Create a multipart session with an explicit initiation time
     */
    [[nodiscard]] auto create_session(const std::string& key,
                                      std::chrono::system_clock::time_point initiated)
        -> std::string;

    /**
     * @brief Make the next N abort calls fail
     */
    void fail_next_aborts(uint32_t count);

    [[nodiscard]] auto object_data(const std::string& key) const -> std::optional<byte_buffer>;
    [[nodiscard]] auto object_metadata_of(const std::string& key) const
        -> std::optional<object_metadata>;
    [[nodiscard]] auto has_session(const std::string& upload_id) const -> bool;
    [[nodiscard]] auto session_count() const -> std::size_t;

    /**
     * @brief Part list passed to the most recent complete call
     */
    [[nodiscard]] auto last_completed_parts() const -> std::vector<completed_part>;

    /**
     * @brief Part numbers in the order their uploads finished
     */
    [[nodiscard]] auto part_completion_order() const -> std::vector<uint32_t>;

    [[nodiscard]] auto begin_calls() const -> uint32_t { return begin_calls_.load(); }
    [[nodiscard]] auto upload_part_calls() const -> uint32_t { return upload_part_calls_.load(); }
    [[nodiscard]] auto complete_calls() const -> uint32_t { return complete_calls_.load(); }
    [[nodiscard]] auto abort_calls() const -> uint32_t { return abort_calls_.load(); }

    /**
     * @brief Highest number of upload_part calls in flight at once
     */
    [[nodiscard]] auto peak_concurrent_parts() const -> uint32_t { return peak_in_flight_.load(); }

private:
    struct impl;
    std::unique_ptr<impl> impl_;

    std::atomic<uint32_t> begin_calls_{0};
    std::atomic<uint32_t> upload_part_calls_{0};
    std::atomic<uint32_t> complete_calls_{0};
    std::atomic<uint32_t> abort_calls_{0};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint32_t> peak_in_flight_{0};
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_BACKEND_MEMORY_BACKEND_H
