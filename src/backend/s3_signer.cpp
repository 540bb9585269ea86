/**
 * @file s3_signer.cpp
 * @brief AWS Signature Version 4 request signing
 * @version 0.1.0
 */

#include "kcenon/streamup/backend/s3_signer.h"
#include "kcenon/streamup/backend/backend_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kcenon::streamup {

using namespace backend_utils;

namespace {

auto trim(const std::string& value) -> std::string {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

s3_signer::s3_signer(s3_credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)),
      region_(std::move(region)),
      service_(std::move(service)) {}

auto s3_signer::empty_payload_hash() -> const std::string& {
    static const std::string hash = bytes_to_hex(sha256(""));
    return hash;
}

void s3_signer::sign(const std::string& method,
                     const std::string& host,
                     const std::string& canonical_uri,
                     const std::string& canonical_query,
                     std::map<std::string, std::string>& headers,
                     const std::string& payload_hash,
                     std::chrono::system_clock::time_point now) const {
    std::string amz_date = format_amz_date(now);
    std::string date_stamp = format_date_stamp(now);

    headers["Host"] = host;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;
    if (credentials_.session_token.has_value()) {
        headers["x-amz-security-token"] = credentials_.session_token.value();
    }

    // Canonical headers, sorted by lowercase name
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [k, v] : headers) {
        std::string lower_key = k;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        sorted_headers[lower_key] = trim(v);
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [k, v] : sorted_headers) {
        canonical_headers << k << ":" << v << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << k;
        first = false;
    }
    std::string signed_headers = signed_headers_builder.str();

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << canonical_uri << "\n";
    canonical_request << canonical_query << "\n";
    canonical_request << canonical_headers.str() << "\n";
    canonical_request << signed_headers << "\n";
    canonical_request << payload_hash;

    std::string algorithm = "AWS4-HMAC-SHA256";
    std::string credential_scope =
        date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope << "\n";
    string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

    auto k_date = hmac_sha256("AWS4" + credentials_.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign.str());

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << credentials_.access_key_id << "/" << credential_scope << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << bytes_to_hex(signature);

    headers["Authorization"] = auth_header.str();
}

}  // namespace kcenon::streamup
