/**
 * @file object_lister.cpp
 * @brief Paginated object listing
 * @version 0.1.0
 */

#include "kcenon/streamup/maintenance/object_lister.h"

#include "kcenon/streamup/backend/s3_backend.h"
#include "kcenon/streamup/core/logging.h"

#include <utility>

namespace kcenon::streamup {

auto object_lister::create(const list_config& config) -> result<std::unique_ptr<object_lister>> {
    auto backend = s3_backend::create(config.connection);
    if (!backend) {
        return unexpected{backend.error()};
    }
    return std::make_unique<object_lister>(config, backend.value());
}

object_lister::object_lister(list_config config, std::shared_ptr<storage_backend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
    get_logger().initialize();
    if (config_.max_keys == 0) {
        config_.max_keys = list_config::default_max_keys;
    }
}

auto object_lister::list() -> result<std::vector<object_info>> {
    if (!backend_) {
        return unexpected{error{error_code::invalid_state, "no storage backend"}};
    }

    std::vector<object_info> objects;

    object_list_request request;
    request.prefix = config_.prefix;
    request.max_keys = config_.max_keys;

    for (;;) {
        auto page = backend_->list_objects(request);
        if (!page) {
            auto err = page.error();
            err.message = "failed to list objects: " + err.describe();
            err.operation.clear();
            return unexpected{err};
        }

        for (auto& object : page.value().objects) {
            objects.push_back(std::move(object));
            if (objects.size() >= config_.max_keys) {
                return objects;
            }
        }

        if (!page.value().is_truncated || page.value().next_continuation_token.empty()) {
            break;
        }
        request.continuation_token = page.value().next_continuation_token;
    }

    SU_LOG_DEBUG(log_category::maintenance,
                 "listed " + std::to_string(objects.size()) + " objects under '" +
                     config_.prefix + "'");
    return objects;
}

}  // namespace kcenon::streamup
