/**
 * @file cleanup.h
 * @brief Listing and aborting incomplete multipart uploads
 * @version 0.1.0
 *
 * Aborted or crashed uploads leave parts behind that the service keeps
 * billing for until the session is aborted. These helpers find such
 * sessions and abort them.
 */

#ifndef KCENON_STREAMUP_MAINTENANCE_CLEANUP_H
#define KCENON_STREAMUP_MAINTENANCE_CLEANUP_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/config/connection_config.h"
#include "kcenon/streamup/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Filters and options for cleanup
 */
struct cleanup_config {
    /// Credentials and bucket location (unused with an explicit backend)
    connection_config connection;

    /// Only sessions whose key starts with this prefix
    std::string prefix;

    /// Only sessions initiated at least this long ago (0 = any age)
    std::chrono::seconds older_than{0};

    /// Stop after this many sessions (0 = all)
    uint32_t max_results = 0;

    /// List only, do not abort
    bool dry_run = false;
};

/**
 * @brief Outcome of a cleanup run
 */
struct cleanup_report {
    std::size_t total_found = 0;
    std::size_t total_aborted = 0;

    /// One entry per session that could not be aborted
    std::vector<error> errors;

    /// Every session that matched the filters
    std::vector<multipart_session_info> uploads;
};

/**
 * @brief List incomplete multipart sessions matching the filters
 *
 * Follows key and upload id markers across pages. Sessions without an
 * initiation time pass the age filter.
 */
[[nodiscard]] auto list_incomplete_uploads(storage_backend& backend,
                                           const cleanup_config& config)
    -> result<std::vector<multipart_session_info>>;

/**
 * @brief List matching sessions and abort them unless dry_run is set
 *
 * A failed abort is recorded in the report and the remaining sessions are
 * still processed; only a listing failure fails the call.
 */
[[nodiscard]] auto cleanup_incomplete_uploads(storage_backend& backend,
                                              const cleanup_config& config)
    -> result<cleanup_report>;

/**
 * @brief list_incomplete_uploads() against the configured S3 connection
 */
[[nodiscard]] auto list_incomplete_uploads(const cleanup_config& config)
    -> result<std::vector<multipart_session_info>>;

/**
 * @brief cleanup_incomplete_uploads() against the configured S3 connection
 */
[[nodiscard]] auto cleanup_incomplete_uploads(const cleanup_config& config)
    -> result<cleanup_report>;

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_MAINTENANCE_CLEANUP_H
