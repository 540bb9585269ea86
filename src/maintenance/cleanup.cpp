/**
 * @file cleanup.cpp
 * @brief Incomplete multipart upload cleanup
 * @version 0.1.0
 */

#include "kcenon/streamup/maintenance/cleanup.h"

#include "kcenon/streamup/backend/s3_backend.h"
#include "kcenon/streamup/core/logging.h"

#include <utility>

namespace kcenon::streamup {

auto list_incomplete_uploads(storage_backend& backend, const cleanup_config& config)
    -> result<std::vector<multipart_session_info>> {
    get_logger().initialize();
    std::vector<multipart_session_info> uploads;

    const bool filter_age = config.older_than.count() > 0;
    const auto cutoff = std::chrono::system_clock::now() - config.older_than;
    const std::chrono::system_clock::time_point unknown{};

    session_list_request request;
    request.prefix = config.prefix;
    request.max_uploads = config.max_results;

    for (;;) {
        auto page = backend.list_multipart_sessions(request);
        if (!page) {
            auto err = page.error();
            err.message = "failed to list multipart uploads: " + err.describe();
            err.operation.clear();
            return unexpected{err};
        }

        for (auto& session : page.value().sessions) {
            if (filter_age && session.initiated != unknown && session.initiated > cutoff) {
                continue;
            }
            uploads.push_back(std::move(session));
            if (config.max_results > 0 && uploads.size() >= config.max_results) {
                return uploads;
            }
        }

        if (!page.value().is_truncated) {
            break;
        }
        if (page.value().next_key_marker.empty() && page.value().next_upload_id_marker.empty()) {
            SU_LOG_WARN(log_category::maintenance,
                        "listing truncated without a continuation marker, stopping");
            break;
        }
        request.key_marker = page.value().next_key_marker;
        request.upload_id_marker = page.value().next_upload_id_marker;
    }

    return uploads;
}

auto cleanup_incomplete_uploads(storage_backend& backend, const cleanup_config& config)
    -> result<cleanup_report> {
    auto uploads = list_incomplete_uploads(backend, config);
    if (!uploads) {
        return unexpected{uploads.error()};
    }

    cleanup_report report;
    report.total_found = uploads.value().size();
    report.uploads = std::move(uploads.value());

    SU_LOG_INFO(log_category::maintenance,
                "found " + std::to_string(report.total_found) + " incomplete uploads" +
                    (config.dry_run ? " (dry run)" : ""));
    if (config.dry_run) {
        return report;
    }

    for (const auto& upload : report.uploads) {
        auto aborted = backend.abort_multipart(upload.key, upload.upload_id);
        if (!aborted) {
            auto err = aborted.error();
            err.message = "failed to abort " + upload.key + " (upload ID: " + upload.upload_id +
                          "): " + err.describe();
            err.operation.clear();

            transfer_log_context ctx;
            ctx.key = upload.key;
            ctx.upload_id = upload.upload_id;
            ctx.error_message = err.message;
            SU_LOG_WARN_CTX(log_category::maintenance, "abort failed", ctx);

            report.errors.push_back(std::move(err));
            continue;
        }
        ++report.total_aborted;
    }

    SU_LOG_INFO(log_category::maintenance,
                "aborted " + std::to_string(report.total_aborted) + " of " +
                    std::to_string(report.total_found) + " incomplete uploads");
    return report;
}

auto list_incomplete_uploads(const cleanup_config& config)
    -> result<std::vector<multipart_session_info>> {
    auto backend = s3_backend::create(config.connection);
    if (!backend) {
        return unexpected{backend.error()};
    }
    return list_incomplete_uploads(*backend.value(), config);
}

auto cleanup_incomplete_uploads(const cleanup_config& config) -> result<cleanup_report> {
    auto backend = s3_backend::create(config.connection);
    if (!backend) {
        return unexpected{backend.error()};
    }
    return cleanup_incomplete_uploads(*backend.value(), config);
}

}  // namespace kcenon::streamup
