/**
 * @file upload_config.cpp
 * @brief Upload configuration validation and builder
 * @version 0.1.0
 */

#include "kcenon/streamup/upload/upload_config.h"

#include "kcenon/streamup/core/validation.h"

#include <string>
#include <utility>

namespace kcenon::streamup {

namespace {

auto is_upload_checksum(const std::string& algorithm) -> bool {
    return algorithm.empty() || algorithm == "md5" || algorithm == "sha256";
}

}  // namespace

// ============================================================================
// upload_config
// ============================================================================

auto upload_config::validate() const -> result<void> {
    if (auto valid = connection.validate(); !valid) {
        return valid;
    }
    return validate_transfer_settings();
}

auto upload_config::validate_transfer_settings() const -> result<void> {
    if (key.empty()) {
        return unexpected{validation_error(error_code::missing_field, "key", "required")};
    }
    if (total_size == 0) {
        return unexpected{validation_error(error_code::invalid_configuration, "total_size",
                                           "must be greater than 0")};
    }

    if (!is_upload_checksum(checksum_algorithm)) {
        return unexpected{validation_error(error_code::unsupported_checksum,
                                           "checksum_algorithm",
                                           "must be 'md5' or 'sha256'")};
    }

    if (auto valid = limits.validate(); !valid) {
        return valid;
    }

    const auto max_size = limits.max_object_size();
    if (total_size > max_size) {
        return unexpected{validation_error(error_code::size_exceeds_limits, "total_size",
            "exceeds service limit of " + std::to_string(max_size) + " bytes (" +
            std::to_string(max_size / gib) + " GB)")};
    }

    if (auto valid = validate_object_key(key); !valid) {
        return valid;
    }
    if (auto valid = validate_metadata(metadata.user_metadata); !valid) {
        return valid;
    }
    return {};
}

auto upload_config::normalized() const -> upload_config {
    upload_config copy = *this;
    if (copy.workers == 0) {
        copy.workers = default_workers;
    }
    if (copy.queue_size == 0) {
        copy.queue_size = default_queue_size;
    }

    const retry_config defaults;
    if (copy.retry.initial_delay.count() <= 0) {
        copy.retry.initial_delay = defaults.initial_delay;
    }
    if (copy.retry.max_delay.count() <= 0) {
        copy.retry.max_delay = defaults.max_delay;
    }
    if (copy.retry.multiplier <= 0.0) {
        copy.retry.multiplier = defaults.multiplier;
    }

    if (copy.checksum_algorithm.empty()) {
        copy.checksum_algorithm = "md5";
    }
    return copy;
}

// ============================================================================
// upload_config_builder
// ============================================================================

auto upload_config_builder::with_connection(const connection_config& connection)
    -> upload_config_builder& {
    config_.connection = connection;
    return *this;
}

auto upload_config_builder::with_credentials(const std::string& access_key_id,
                                             const std::string& secret_access_key)
    -> upload_config_builder& {
    config_.connection.access_key_id = access_key_id;
    config_.connection.secret_access_key = secret_access_key;
    return *this;
}

auto upload_config_builder::with_session_token(const std::string& token)
    -> upload_config_builder& {
    config_.connection.session_token = token;
    return *this;
}

auto upload_config_builder::with_bucket(const std::string& bucket) -> upload_config_builder& {
    config_.connection.bucket = bucket;
    return *this;
}

auto upload_config_builder::with_account_id(const std::string& account_id)
    -> upload_config_builder& {
    config_.connection.account_id = account_id;
    return *this;
}

auto upload_config_builder::with_endpoint(const std::string& endpoint)
    -> upload_config_builder& {
    config_.connection.endpoint = endpoint;
    return *this;
}

auto upload_config_builder::with_region(const std::string& region) -> upload_config_builder& {
    config_.connection.region = region;
    return *this;
}

auto upload_config_builder::with_path_style(bool enable) -> upload_config_builder& {
    config_.connection.force_path_style = enable;
    return *this;
}

auto upload_config_builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> upload_config_builder& {
    config_.connection.request_timeout = timeout;
    return *this;
}

auto upload_config_builder::with_key(const std::string& key) -> upload_config_builder& {
    config_.key = key;
    return *this;
}

auto upload_config_builder::with_total_size(uint64_t bytes) -> upload_config_builder& {
    config_.total_size = bytes;
    return *this;
}

auto upload_config_builder::with_workers(std::size_t workers) -> upload_config_builder& {
    config_.workers = workers;
    return *this;
}

auto upload_config_builder::with_queue_size(std::size_t queue_size) -> upload_config_builder& {
    config_.queue_size = queue_size;
    return *this;
}

auto upload_config_builder::with_memory_limit_mb(uint64_t megabytes) -> upload_config_builder& {
    config_.max_memory_mb = megabytes;
    return *this;
}

auto upload_config_builder::with_retry(const retry_config& retry) -> upload_config_builder& {
    config_.retry = retry;
    return *this;
}

auto upload_config_builder::with_service_limits(const service_limits& limits)
    -> upload_config_builder& {
    config_.limits = limits;
    return *this;
}

auto upload_config_builder::with_content_type(const std::string& content_type)
    -> upload_config_builder& {
    config_.metadata.content_type = content_type;
    return *this;
}

auto upload_config_builder::with_content_disposition(const std::string& value)
    -> upload_config_builder& {
    config_.metadata.content_disposition = value;
    return *this;
}

auto upload_config_builder::with_content_encoding(const std::string& value)
    -> upload_config_builder& {
    config_.metadata.content_encoding = value;
    return *this;
}

auto upload_config_builder::with_content_language(const std::string& value)
    -> upload_config_builder& {
    config_.metadata.content_language = value;
    return *this;
}

auto upload_config_builder::with_cache_control(const std::string& value)
    -> upload_config_builder& {
    config_.metadata.cache_control = value;
    return *this;
}

auto upload_config_builder::with_user_metadata(const std::string& key, const std::string& value)
    -> upload_config_builder& {
    config_.metadata.user_metadata[key] = value;
    return *this;
}

auto upload_config_builder::with_checksum(const std::string& algorithm)
    -> upload_config_builder& {
    config_.calculate_checksum = true;
    config_.checksum_algorithm = algorithm;
    return *this;
}

auto upload_config_builder::without_checksum() -> upload_config_builder& {
    config_.calculate_checksum = false;
    return *this;
}

auto upload_config_builder::with_progress_callback(progress_callback callback)
    -> upload_config_builder& {
    config_.on_progress = std::move(callback);
    return *this;
}

auto upload_config_builder::build() const -> result<upload_config> {
    auto config = config_.normalized();
    if (auto valid = config.validate(); !valid) {
        return unexpected{valid.error()};
    }
    return config;
}

}  // namespace kcenon::streamup
