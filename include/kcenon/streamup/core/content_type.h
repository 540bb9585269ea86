/**
 * @file content_type.h
 * @brief MIME type and content encoding detection from object keys
 */

#ifndef KCENON_STREAMUP_CORE_CONTENT_TYPE_H
#define KCENON_STREAMUP_CORE_CONTENT_TYPE_H

#include <string>
#include <string_view>

namespace kcenon::streamup {

/**
 * @brief Detect the MIME type of an object from its key or file name
 * @return MIME type, application/octet-stream when unknown
 */
[[nodiscard]] auto detect_content_type(std::string_view name) -> std::string;

/**
 * @brief Detect the Content-Encoding implied by a compressed extension
 * @return "gzip", "br", "zstd" or empty
 */
[[nodiscard]] auto detect_content_encoding(std::string_view name) -> std::string;

/**
 * @brief Whether content of this type benefits from compression
 */
[[nodiscard]] auto should_compress(std::string_view content_type) -> bool;

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_CONTENT_TYPE_H
