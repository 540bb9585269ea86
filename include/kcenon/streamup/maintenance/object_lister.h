/**
 * @file object_lister.h
 * @brief Paginated listing of stored objects
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_MAINTENANCE_OBJECT_LISTER_H
#define KCENON_STREAMUP_MAINTENANCE_OBJECT_LISTER_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/config/connection_config.h"
#include "kcenon/streamup/core/types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Listing options
 */
struct list_config {
    static constexpr uint32_t default_max_keys = 1000;

    /// Credentials and bucket location
    connection_config connection;

    /// Only keys starting with this prefix
    std::string prefix;

    /// Maximum objects returned (0 = default_max_keys)
    uint32_t max_keys = default_max_keys;
};

/**
 * @brief Lists objects page by page until max_keys are collected
 */
class object_lister {
public:
    /**
     * @brief Create a lister for an S3-compatible service
     */
    [[nodiscard]] static auto create(const list_config& config)
        -> result<std::unique_ptr<object_lister>>;

    object_lister(list_config config, std::shared_ptr<storage_backend> backend);

    /**
     * @brief Objects in key order, at most max_keys of them
     */
    [[nodiscard]] auto list() -> result<std::vector<object_info>>;

    [[nodiscard]] auto config() const noexcept -> const list_config& { return config_; }

private:
    list_config config_;
    std::shared_ptr<storage_backend> backend_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_MAINTENANCE_OBJECT_LISTER_H
