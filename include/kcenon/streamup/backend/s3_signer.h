/**
 * @file s3_signer.h
 * @brief AWS Signature Version 4 request signing
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_BACKEND_S3_SIGNER_H
#define KCENON_STREAMUP_BACKEND_S3_SIGNER_H

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Static credentials used for signing
 */
struct s3_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
};

/**
 * @brief Signs S3 requests with AWS SigV4
 *
 * sign() adds Host, x-amz-date, x-amz-content-sha256, the optional
 * x-amz-security-token and Authorization. Every header present when
 * sign() runs is signed.
 */
class s3_signer {
public:
    s3_signer(s3_credentials credentials, std::string region, std::string service = "s3");

    /**
     * @brief Sign a request in place
     * @param method HTTP method
     * @param host Host header value
     * @param canonical_uri Absolute path (percent-encoded per segment)
     * @param canonical_query Canonical query string
     * @param headers Request headers; signing headers are added
     * @param payload_hash Hex SHA-256 of the body
     * @param now Signing time
     */
    void sign(const std::string& method,
              const std::string& host,
              const std::string& canonical_uri,
              const std::string& canonical_query,
              std::map<std::string, std::string>& headers,
              const std::string& payload_hash,
              std::chrono::system_clock::time_point now) const;

    /**
     * @brief Hex SHA-256 of an empty body
     */
    [[nodiscard]] static auto empty_payload_hash() -> const std::string&;

    [[nodiscard]] auto region() const -> const std::string& { return region_; }

private:
    s3_credentials credentials_;
    std::string region_;
    std::string service_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_BACKEND_S3_SIGNER_H
