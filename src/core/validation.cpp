/**
 * @file validation.cpp
 * @brief Object key and metadata validation
 */

#include "kcenon/streamup/core/validation.h"
#include "kcenon/streamup/core/logging.h"

#include <cctype>
#include <cstdio>

namespace kcenon::streamup {

namespace {

auto is_control(unsigned char c) -> bool {
    return c < 0x20 || c == 0x7F;
}

auto is_space(unsigned char c) -> bool {
    return std::isspace(c) != 0;
}

}  // namespace

auto validate_object_key(std::string_view key) -> result<void> {
    if (key.empty()) {
        return unexpected{validation_error(error_code::invalid_object_key, "key",
                                           "cannot be empty")};
    }
    if (key.size() > max_object_key_length) {
        return unexpected{validation_error(error_code::invalid_object_key, "key",
            "too long (max 1024 bytes): " + std::to_string(key.size()) + " bytes")};
    }
    if (key.find('\0') != std::string_view::npos) {
        return unexpected{validation_error(error_code::invalid_object_key, "key",
                                           "contains null bytes")};
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (is_control(static_cast<unsigned char>(key[i]))) {
            return unexpected{validation_error(error_code::invalid_object_key, "key",
                "contains control character at position " + std::to_string(i))};
        }
    }
    if (key.find("../") != std::string_view::npos ||
        key.find("..\\") != std::string_view::npos) {
        return unexpected{validation_error(error_code::invalid_object_key, "key",
                                           "contains path traversal sequence")};
    }
    if (is_space(static_cast<unsigned char>(key.front())) ||
        is_space(static_cast<unsigned char>(key.back()))) {
        return unexpected{validation_error(error_code::invalid_object_key, "key",
                                           "has leading or trailing whitespace")};
    }
    if (key.find("//") != std::string_view::npos) {
        SU_LOG_WARN(log_category::upload,
                    "object key contains double slashes (//): " + std::string(key));
    }
    return {};
}

auto validate_metadata_entry(std::string_view key, std::string_view value) -> result<void> {
    if (key.empty()) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
                                           "key cannot be empty")};
    }
    if (key.size() > max_metadata_key_length) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
            "key too long (max 128 chars): " + std::to_string(key.size()) + " chars")};
    }
    if (value.size() > max_metadata_value_length) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
            "value too long (max 256 chars): " + std::to_string(value.size()) + " chars")};
    }
    if (key.find('\0') != std::string_view::npos) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
                                           "key contains null bytes")};
    }
    if (value.find('\0') != std::string_view::npos) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
                                           "value contains null bytes")};
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (is_control(static_cast<unsigned char>(key[i]))) {
            return unexpected{validation_error(error_code::invalid_metadata, "metadata",
                "key contains control character at position " + std::to_string(i))};
        }
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        return unexpected{validation_error(error_code::invalid_metadata, "metadata",
                                           "value contains newline characters")};
    }
    return {};
}

auto validate_metadata(const std::map<std::string, std::string>& metadata) -> result<void> {
    for (const auto& [key, value] : metadata) {
        if (auto valid = validate_metadata_entry(key, value); !valid) {
            return valid;
        }
    }
    return {};
}

auto format_size(uint64_t bytes) -> std::string {
    constexpr uint64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }

    uint64_t div = unit;
    int exp = 0;
    for (uint64_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }

    static constexpr char units[] = "KMGTPE";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), units[exp]);
    return buf;
}

}  // namespace kcenon::streamup
