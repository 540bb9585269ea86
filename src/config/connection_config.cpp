/**
 * @file connection_config.cpp
 * @brief Connection settings resolution and validation
 * @version 0.1.0
 */

#include "kcenon/streamup/config/connection_config.h"

namespace kcenon::streamup {

auto connection_config::resolved_region() const -> std::string {
    if (!region.empty()) {
        return region;
    }
    return account_id.empty() ? "us-east-1" : "auto";
}

auto connection_config::resolved_endpoint() const -> std::string {
    std::string url;
    if (!endpoint.empty()) {
        url = endpoint;
    } else if (!account_id.empty()) {
        url = "https://" + account_id + ".r2.cloudflarestorage.com";
    } else {
        url = "https://s3." + resolved_region() + ".amazonaws.com";
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto connection_config::uses_path_style() const -> bool {
    return force_path_style || !endpoint.empty() || !account_id.empty();
}

auto connection_config::validate() const -> result<void> {
    if (access_key_id.empty()) {
        return unexpected{validation_error(error_code::missing_field, "access_key_id",
                                           "access key id is required")};
    }
    if (secret_access_key.empty()) {
        return unexpected{validation_error(error_code::missing_field, "secret_access_key",
                                           "secret access key is required")};
    }
    if (bucket.empty()) {
        return unexpected{validation_error(error_code::missing_field, "bucket",
                                           "bucket is required")};
    }
    if (!endpoint.empty() && !endpoint.starts_with("http://") &&
        !endpoint.starts_with("https://")) {
        return unexpected{validation_error(error_code::invalid_configuration, "endpoint",
                                           "endpoint must start with http:// or https://")};
    }
    if (request_timeout.count() <= 0) {
        return unexpected{validation_error(error_code::invalid_configuration, "request_timeout",
                                           "request timeout must be positive")};
    }
    return {};
}

}  // namespace kcenon::streamup
