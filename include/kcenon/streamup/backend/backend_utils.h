/**
 * @file backend_utils.h
 * @brief Encoding, hashing, time and XML helpers for HTTP backends
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_BACKEND_BACKEND_UTILS_H
#define KCENON_STREAMUP_BACKEND_BACKEND_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::streamup::backend_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to a lowercase hexadecimal string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Build a canonical query string
 *
 * Keys and values are URL encoded and joined in key order, which is the
 * form SigV4 signs. Empty values keep their '=' ("uploads=").
 */
auto canonical_query_string(const std::map<std::string, std::string>& params) -> std::string;

/**
 * @brief Escape the five XML special characters
 */
auto xml_escape(const std::string& value) -> std::string;

/**
 * @brief Reverse xml_escape (named entities only)
 */
auto xml_unescape(const std::string& value) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 hash of a string
 * @return 32 digest bytes
 */
auto sha256(const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief SHA256 hash of bytes
 * @return 32 digest bytes
 */
auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 with string key
 */
auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a UTC time as YYYYMMDD'T'HHMMSS'Z'
 */
auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Format a UTC date as YYYYMMDD
 */
auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an ISO 8601 UTC timestamp ("2024-01-02T03:04:05.000Z")
 *
 * Fractional seconds are ignored.
 */
auto parse_iso8601(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

/**
 * @brief Parse an RFC 1123 HTTP date ("Tue, 02 Jan 2024 03:04:05 GMT")
 */
auto parse_http_date(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract the text of the first <tag>...</tag> element
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract the inner text of every <tag>...</tag> element in order
 */
auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string>;

}  // namespace kcenon::streamup::backend_utils

#endif  // KCENON_STREAMUP_BACKEND_BACKEND_UTILS_H
