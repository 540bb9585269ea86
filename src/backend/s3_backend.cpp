/**
 * @file s3_backend.cpp
 * @brief S3-compatible storage backend implementation
 * @version 0.1.0
 */

#include "kcenon/streamup/backend/s3_backend.h"
#include "kcenon/streamup/backend/backend_utils.h"
#include "kcenon/streamup/backend/s3_signer.h"
#include "kcenon/streamup/core/build_info.h"
#include "kcenon/streamup/core/content_type.h"
#include "kcenon/streamup/core/logging.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <mutex>
#include <sstream>

namespace kcenon::streamup {

using namespace backend_utils;

namespace {

/**
 * @brief One signed request against the bucket
 */
struct s3_request {
    std::string method;

    /// Object key (empty = bucket-level request)
    std::string key;

    std::map<std::string, std::string> query;
    http_headers headers;
    std::string body;

    /// Hex SHA-256 of body (empty = computed)
    std::string payload_hash;
};

/**
 * @brief Addressing, signing and dispatch shared by the backend and its
 *        object readers
 */
class s3_transport {
public:
    s3_transport(const connection_config& connection,
                 std::shared_ptr<http_client_interface> client,
                 std::string user_agent)
        : connection_(connection),
          client_(std::move(client)),
          signer_(s3_credentials{connection.access_key_id, connection.secret_access_key,
                                 connection.session_token},
                  connection.resolved_region()),
          user_agent_(std::move(user_agent)),
          clock_([] { return std::chrono::system_clock::now(); }) {
        auto endpoint = connection.resolved_endpoint();
        auto scheme_end = endpoint.find("://");
        scheme_ = endpoint.substr(0, scheme_end);
        auto rest = endpoint.substr(scheme_end + 3);
        auto slash = rest.find('/');
        endpoint_host_ = slash == std::string::npos ? rest : rest.substr(0, slash);
        path_style_ = connection.uses_path_style();
    }

    [[nodiscard]] auto host() const -> std::string {
        return path_style_ ? endpoint_host_ : connection_.bucket + "." + endpoint_host_;
    }

    [[nodiscard]] auto canonical_uri(const std::string& key) const -> std::string {
        std::string uri = path_style_ ? "/" + url_encode(connection_.bucket) : "";
        if (!key.empty()) {
            uri += "/" + url_encode(key, false);
        }
        return uri.empty() ? "/" : uri;
    }

    [[nodiscard]] auto url(const std::string& key, const std::string& query) const -> std::string {
        auto full = scheme_ + "://" + host() + canonical_uri(key);
        if (!query.empty()) {
            full += "?" + query;
        }
        return full;
    }

    void set_clock(s3_backend::clock_function clock) {
        std::lock_guard<std::mutex> lock(clock_mutex_);
        clock_ = std::move(clock);
    }

    auto send(s3_request request) const -> result<http_response> {
        auto query = canonical_query_string(request.query);
        auto uri = canonical_uri(request.key);
        auto payload_hash = request.payload_hash.empty()
                                ? bytes_to_hex(sha256(request.body))
                                : request.payload_hash;

        std::chrono::system_clock::time_point now;
        {
            std::lock_guard<std::mutex> lock(clock_mutex_);
            now = clock_();
        }

        signer_.sign(request.method, host(), uri, query, request.headers, payload_hash, now);
        request.headers["User-Agent"] = user_agent_;

        auto target = url(request.key, query);
        SU_LOG_TRACE(log_category::backend, request.method + " " + target);

        if (request.method == "GET") {
            return client_->get(target, {}, request.headers);
        }
        if (request.method == "PUT") {
            return client_->put(target, request.body, request.headers);
        }
        if (request.method == "POST") {
            return client_->post(target, request.body, request.headers);
        }
        if (request.method == "DELETE") {
            return client_->del(target, request.headers);
        }
        if (request.method == "HEAD") {
            return client_->head(target, request.headers);
        }
        return unexpected{error{error_code::internal_error,
                                "unsupported HTTP method " + request.method}};
    }

private:
    connection_config connection_;
    std::shared_ptr<http_client_interface> client_;
    s3_signer signer_;
    std::string user_agent_;
    std::string scheme_;
    std::string endpoint_host_;
    bool path_style_ = true;

    mutable std::mutex clock_mutex_;
    s3_backend::clock_function clock_;
};

auto to_bytes(std::span<const std::byte> data) -> std::string {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

auto parse_uint(const std::string& text) -> uint64_t {
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::exception&) {
        return 0;
    }
}

auto element_or_empty(const std::string& xml, const std::string& tag) -> std::string {
    return xml_unescape(extract_xml_element(xml, tag).value_or(""));
}

auto invalid_response(std::string message, std::string_view operation) -> error {
    return error{error_code::invalid_response, std::move(message)}.during(std::string(operation));
}

/**
 * @brief Streams an object through successive ranged GETs
 *
 * Only one window of bytes is held at a time. Every range is pinned to the
 * ETag seen at open time so a concurrent overwrite fails the read.
 */
class ranged_object_source : public byte_source {
public:
    ranged_object_source(std::shared_ptr<const s3_transport> transport,
                         std::string key,
                         std::string etag,
                         uint64_t size,
                         uint64_t window)
        : transport_(std::move(transport)),
          key_(std::move(key)),
          etag_(std::move(etag)),
          size_(size),
          window_(window == 0 ? 8 * mib : window) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty()) {
            return std::size_t{0};
        }
        if (position_ == window_data_.size()) {
            if (offset_ >= size_) {
                return std::size_t{0};
            }
            auto fetched = fetch_next();
            if (!fetched) {
                return unexpected{fetched.error()};
            }
        }

        auto n = std::min(buffer.size(), window_data_.size() - position_);
        std::memcpy(buffer.data(), window_data_.data() + position_, n);
        position_ += n;
        return n;
    }

private:
    auto fetch_next() -> result<void> {
        auto last = std::min(offset_ + window_, size_) - 1;

        s3_request request;
        request.method = "GET";
        request.key = key_;
        request.headers["Range"] = "bytes=" + std::to_string(offset_) + "-" + std::to_string(last);
        if (!etag_.empty()) {
            request.headers["If-Match"] = etag_;
        }

        auto response = transport_->send(std::move(request));
        if (!response) {
            return unexpected{response.error().during("GetObject")};
        }
        auto& resp = response.value();
        if (resp.status_code != 200 && resp.status_code != 206) {
            return unexpected{s3_backend::map_response_error(resp, "GetObject")};
        }
        if (resp.body.empty()) {
            return unexpected{invalid_response("empty range response", "GetObject")};
        }

        // A 200 carries the whole object; skip what was already delivered
        std::size_t skip = resp.status_code == 200 ? static_cast<std::size_t>(offset_) : 0;
        if (skip >= resp.body.size()) {
            return unexpected{invalid_response("range response shorter than expected",
                                               "GetObject")};
        }
        window_data_.assign(resp.body.begin() + static_cast<std::ptrdiff_t>(skip), resp.body.end());
        position_ = 0;
        offset_ += window_data_.size();
        return {};
    }

    std::shared_ptr<const s3_transport> transport_;
    std::string key_;
    std::string etag_;
    uint64_t size_;
    uint64_t window_;

    uint64_t offset_ = 0;
    std::vector<uint8_t> window_data_;
    std::size_t position_ = 0;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct s3_backend::impl {
    std::shared_ptr<s3_transport> transport;
    s3_backend_options options;
};

s3_backend::s3_backend(const connection_config& connection,
                       std::shared_ptr<http_client_interface> client,
                       s3_backend_options options)
    : impl_(std::make_unique<impl>()) {
    auto user_agent = options.user_agent.empty() ? build_info::current().user_agent()
                                                 : options.user_agent;
    impl_->transport = std::make_shared<s3_transport>(connection, std::move(client), user_agent);
    impl_->options = std::move(options);
}

s3_backend::~s3_backend() = default;

auto s3_backend::create(const connection_config& connection,
                        std::shared_ptr<http_client_interface> client,
                        s3_backend_options options)
    -> result<std::shared_ptr<s3_backend>> {
    auto valid = connection.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    if (!client) {
        client = make_http_client(connection.request_timeout);
    }

    get_logger().register_secret(connection.secret_access_key);
    if (connection.session_token.has_value()) {
        get_logger().register_secret(connection.session_token.value());
    }

    return std::shared_ptr<s3_backend>(
        new s3_backend(connection, std::move(client), std::move(options)));
}

void s3_backend::set_clock(clock_function clock) {
    impl_->transport->set_clock(std::move(clock));
}

auto s3_backend::object_url(const std::string& key) const -> std::string {
    return impl_->transport->url(key, "");
}

// ============================================================================
// Error mapping
// ============================================================================

auto s3_backend::map_response_error(const http_response& response,
                                    std::string_view operation) -> error {
    auto body = response.body_string();
    auto service_code = element_or_empty(body, "Code");
    auto message = element_or_empty(body, "Message");
    const int status = response.status_code;

    error_code code = error_code::backend_error;
    if (service_code == "NoSuchUpload") {
        code = error_code::upload_not_found;
    } else if (service_code == "NoSuchKey" || status == 404) {
        code = error_code::object_not_found;
    } else if (service_code == "SlowDown" || status == 429) {
        code = error_code::throttled;
    } else if (service_code == "AccessDenied" || status == 403) {
        code = error_code::access_denied;
    } else if (service_code == "ServiceUnavailable" || status == 503) {
        code = error_code::service_unavailable;
    } else if (service_code == "RequestTimeout" || status == 408) {
        code = error_code::request_timeout;
    } else if (service_code == "InternalError" || (status >= 500 && status < 600)) {
        code = error_code::internal_service_error;
    }

    if (message.empty()) {
        message = "HTTP " + std::to_string(status);
    }

    error err{code, message};
    err.http_status = status;
    err.service_code = service_code;
    err.operation = std::string(operation);
    return err;
}

auto s3_backend::build_complete_xml(const std::vector<completed_part>& parts) -> std::string {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";

    for (const auto& part : parts) {
        xml << "  <Part>\n";
        xml << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        xml << "    <ETag>" << xml_escape(part.etag) << "</ETag>\n";
        xml << "  </Part>\n";
    }

    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

// ============================================================================
// Multipart operations
// ============================================================================

auto s3_backend::begin_multipart(const std::string& key, const object_metadata& metadata)
    -> result<std::string> {
    s3_request request;
    request.method = "POST";
    request.key = key;
    request.query["uploads"] = "";

    request.headers["Content-Type"] =
        metadata.content_type.empty() ? detect_content_type(key) : metadata.content_type;
    if (!metadata.content_disposition.empty()) {
        request.headers["Content-Disposition"] = metadata.content_disposition;
    }
    auto encoding = metadata.content_encoding.empty() ? detect_content_encoding(key)
                                                      : metadata.content_encoding;
    if (!encoding.empty()) {
        request.headers["Content-Encoding"] = encoding;
    }
    if (!metadata.content_language.empty()) {
        request.headers["Content-Language"] = metadata.content_language;
    }
    if (!metadata.cache_control.empty()) {
        request.headers["Cache-Control"] = metadata.cache_control;
    }
    for (const auto& [name, value] : metadata.user_metadata) {
        request.headers["x-amz-meta-" + name] = value;
    }

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("CreateMultipartUpload")};
    }
    auto& resp = response.value();
    if (resp.status_code != 200) {
        return unexpected{map_response_error(resp, "CreateMultipartUpload")};
    }

    auto upload_id = extract_xml_element(resp.body_string(), "UploadId");
    if (!upload_id.has_value() || upload_id->empty()) {
        return unexpected{invalid_response("no UploadId in response", "CreateMultipartUpload")};
    }
    return xml_unescape(upload_id.value());
}

auto s3_backend::upload_part(const std::string& key,
                             const std::string& upload_id,
                             uint32_t part_number,
                             std::span<const std::byte> data) -> result<std::string> {
    s3_request request;
    request.method = "PUT";
    request.key = key;
    request.query["partNumber"] = std::to_string(part_number);
    request.query["uploadId"] = upload_id;
    request.body = to_bytes(data);
    request.payload_hash = bytes_to_hex(sha256_bytes(data));
    request.headers["Content-Length"] = std::to_string(data.size());

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("UploadPart")};
    }
    auto& resp = response.value();
    if (resp.status_code != 200) {
        return unexpected{map_response_error(resp, "UploadPart")};
    }

    auto etag = resp.get_header("ETag");
    if (!etag.has_value() || etag->empty()) {
        return unexpected{invalid_response("no ETag in response", "UploadPart")};
    }
    return etag.value();
}

auto s3_backend::complete_multipart(const std::string& key,
                                    const std::string& upload_id,
                                    const std::vector<completed_part>& parts)
    -> result<multipart_completion> {
    s3_request request;
    request.method = "POST";
    request.key = key;
    request.query["uploadId"] = upload_id;
    request.body = build_complete_xml(parts);
    request.headers["Content-Type"] = "application/xml";
    request.headers["Content-Length"] = std::to_string(request.body.size());

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("CompleteMultipartUpload")};
    }
    auto& resp = response.value();
    auto body = resp.body_string();

    // S3 can report a failure inside a 200 response once processing has begun
    if (resp.status_code != 200 || body.find("<Error>") != std::string::npos) {
        auto err = map_response_error(resp, "CompleteMultipartUpload");
        if (resp.status_code == 200) {
            err.http_status = 0;
        }
        return unexpected{err};
    }

    multipart_completion completion;
    completion.etag = element_or_empty(body, "ETag");
    completion.location = element_or_empty(body, "Location");
    return completion;
}

auto s3_backend::abort_multipart(const std::string& key, const std::string& upload_id)
    -> result<void> {
    s3_request request;
    request.method = "DELETE";
    request.key = key;
    request.query["uploadId"] = upload_id;

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("AbortMultipartUpload")};
    }
    auto& resp = response.value();
    if (resp.status_code != 204 && resp.status_code != 200) {
        return unexpected{map_response_error(resp, "AbortMultipartUpload")};
    }
    return {};
}

// ============================================================================
// Object operations
// ============================================================================

auto s3_backend::head_object(const std::string& key) -> result<object_info> {
    s3_request request;
    request.method = "HEAD";
    request.key = key;

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("HeadObject")};
    }
    auto& resp = response.value();
    if (resp.status_code != 200) {
        return unexpected{map_response_error(resp, "HeadObject")};
    }

    auto length = resp.get_header("Content-Length");
    if (!length.has_value()) {
        return unexpected{invalid_response("no Content-Length in response", "HeadObject")};
    }

    object_info info;
    info.key = key;
    info.size = parse_uint(length.value());
    info.etag = resp.get_header("ETag").value_or("");
    info.content_type = resp.get_header("Content-Type").value_or("");
    if (auto modified = resp.get_header("Last-Modified")) {
        info.last_modified = parse_http_date(modified.value()).value_or(
            std::chrono::system_clock::time_point{});
    }
    return info;
}

auto s3_backend::get_object(const std::string& key) -> result<std::unique_ptr<byte_source>> {
    auto info = head_object(key);
    if (!info) {
        return unexpected{info.error().during("GetObject")};
    }

    std::unique_ptr<byte_source> source = std::make_unique<ranged_object_source>(
        impl_->transport, key, info.value().etag, info.value().size,
        impl_->options.read_window);
    return source;
}

auto s3_backend::list_multipart_sessions(const session_list_request& request)
    -> result<session_list_page> {
    s3_request req;
    req.method = "GET";
    req.query["uploads"] = "";
    if (!request.prefix.empty()) {
        req.query["prefix"] = request.prefix;
    }
    if (!request.key_marker.empty()) {
        req.query["key-marker"] = request.key_marker;
    }
    if (!request.upload_id_marker.empty()) {
        req.query["upload-id-marker"] = request.upload_id_marker;
    }
    if (request.max_uploads > 0) {
        req.query["max-uploads"] = std::to_string(request.max_uploads);
    }

    auto response = impl_->transport->send(std::move(req));
    if (!response) {
        return unexpected{response.error().during("ListMultipartUploads")};
    }
    auto& resp = response.value();
    if (resp.status_code != 200) {
        return unexpected{map_response_error(resp, "ListMultipartUploads")};
    }

    auto body = resp.body_string();
    session_list_page page;
    for (const auto& upload : extract_xml_elements(body, "Upload")) {
        multipart_session_info info;
        info.key = element_or_empty(upload, "Key");
        info.upload_id = element_or_empty(upload, "UploadId");
        info.storage_class = element_or_empty(upload, "StorageClass");
        info.initiated = parse_iso8601(element_or_empty(upload, "Initiated"))
                             .value_or(std::chrono::system_clock::time_point{});
        page.sessions.push_back(std::move(info));
    }
    page.is_truncated = element_or_empty(body, "IsTruncated") == "true";
    page.next_key_marker = element_or_empty(body, "NextKeyMarker");
    page.next_upload_id_marker = element_or_empty(body, "NextUploadIdMarker");
    return page;
}

auto s3_backend::list_objects(const object_list_request& request) -> result<object_list_page> {
    s3_request req;
    req.method = "GET";
    req.query["list-type"] = "2";
    if (!request.prefix.empty()) {
        req.query["prefix"] = request.prefix;
    }
    if (!request.continuation_token.empty()) {
        req.query["continuation-token"] = request.continuation_token;
    }
    if (request.max_keys > 0) {
        req.query["max-keys"] = std::to_string(request.max_keys);
    }

    auto response = impl_->transport->send(std::move(req));
    if (!response) {
        return unexpected{response.error().during("ListObjectsV2")};
    }
    auto& resp = response.value();
    if (resp.status_code != 200) {
        return unexpected{map_response_error(resp, "ListObjectsV2")};
    }

    auto body = resp.body_string();
    object_list_page page;
    for (const auto& contents : extract_xml_elements(body, "Contents")) {
        object_info info;
        info.key = element_or_empty(contents, "Key");
        info.size = parse_uint(element_or_empty(contents, "Size"));
        info.etag = element_or_empty(contents, "ETag");
        info.last_modified = parse_iso8601(element_or_empty(contents, "LastModified"))
                                 .value_or(std::chrono::system_clock::time_point{});
        page.objects.push_back(std::move(info));
    }
    page.is_truncated = element_or_empty(body, "IsTruncated") == "true";
    page.next_continuation_token = element_or_empty(body, "NextContinuationToken");
    return page;
}

auto s3_backend::delete_object(const std::string& key) -> result<void> {
    s3_request request;
    request.method = "DELETE";
    request.key = key;

    auto response = impl_->transport->send(std::move(request));
    if (!response) {
        return unexpected{response.error().during("DeleteObject")};
    }
    auto& resp = response.value();
    if (resp.status_code != 204 && resp.status_code != 200) {
        return unexpected{map_response_error(resp, "DeleteObject")};
    }
    return {};
}

}  // namespace kcenon::streamup
