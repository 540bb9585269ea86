/**
 * @file backend_utils.cpp
 * @brief Encoding, hashing, time and XML helpers for HTTP backends
 * @version 0.1.0
 */

#include "kcenon/streamup/backend/backend_utils.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string_view>
#include <utility>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace kcenon::streamup::backend_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto canonical_query_string(const std::map<std::string, std::string>& params) -> std::string {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += url_encode(key);
        out += '=';
        out += url_encode(value);
    }
    return out;
}

auto xml_escape(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

auto xml_unescape(const std::string& value) -> std::string {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size();) {
        bool replaced = false;
        if (value[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                std::string_view e(entity);
                if (value.compare(i, e.size(), e) == 0) {
                    out += ch;
                    i += e.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += value[i++];
        }
    }
    return out;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {

auto to_utc_tm(std::chrono::system_clock::time_point tp) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}

auto from_utc_tm(std::tm& tm) -> std::optional<std::chrono::system_clock::time_point> {
#ifdef _WIN32
    auto seconds = _mkgmtime(&tm);
#else
    auto seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

}  // namespace

auto format_amz_date(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto tm = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d");
    return oss.str();
}

auto parse_iso8601(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return from_utc_tm(tm);
}

auto parse_http_date(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return from_utc_tm(tm);
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string> {
    std::vector<std::string> elements;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    std::size_t pos = 0;
    while (true) {
        auto start_pos = xml.find(open_tag, pos);
        if (start_pos == std::string::npos) {
            break;
        }
        start_pos += open_tag.length();

        auto end_pos = xml.find(close_tag, start_pos);
        if (end_pos == std::string::npos) {
            break;
        }
        elements.push_back(xml.substr(start_pos, end_pos - start_pos));
        pos = end_pos + close_tag.length();
    }
    return elements;
}

}  // namespace kcenon::streamup::backend_utils
