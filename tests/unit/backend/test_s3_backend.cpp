/**
 * @file test_s3_backend.cpp
 * @brief Unit tests for the S3 REST backend against a scripted transport
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/backend/backend_utils.h>
#include <kcenon/streamup/backend/s3_backend.h>

#include "integration/test_fixtures.h"

#include <deque>
#include <mutex>

namespace kcenon::streamup::test {

namespace {

/**
 * @brief HTTP transport replaying queued responses and recording requests
 */
class scripted_http_client : public http_client_interface {
public:
    struct recorded_request {
        std::string method;
        std::string url;
        http_headers headers;
        std::string body;
    };

    void respond(int status, std::string body = {}, http_headers headers = {}) {
        http_response response;
        response.status_code = status;
        response.headers = std::move(headers);
        response.body.assign(body.begin(), body.end());

        std::lock_guard<std::mutex> lock(mutex_);
        responses_.emplace_back(std::move(response));
    }

    void fail(error err) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.emplace_back(unexpected{std::move(err)});
    }

    [[nodiscard]] auto requests() const -> std::vector<recorded_request> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto last() const -> recorded_request {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

    auto get(const std::string& url, const std::map<std::string, std::string>&,
             const http_headers& headers) -> result<http_response> override {
        return record("GET", url, headers, {});
    }

    auto post(const std::string& url, const std::string& body,
              const http_headers& headers) -> result<http_response> override {
        return record("POST", url, headers, body);
    }

    auto put(const std::string& url, const std::string& body,
             const http_headers& headers) -> result<http_response> override {
        return record("PUT", url, headers, body);
    }

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record("DELETE", url, headers, {});
    }

    auto head(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record("HEAD", url, headers, {});
    }

private:
    auto record(const std::string& method, const std::string& url,
                const http_headers& headers, const std::string& body)
        -> result<http_response> {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(recorded_request{method, url, headers, body});
        if (responses_.empty()) {
            return unexpected{error{error_code::network_error, "no scripted response"}};
        }
        auto next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    mutable std::mutex mutex_;
    std::deque<result<http_response>> responses_;
    std::vector<recorded_request> requests_;
};

}  // namespace

class S3BackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        client_ = std::make_shared<scripted_http_client>();

        s3_backend_options options;
        options.read_window = 4;
        options.user_agent = "streamup-test/1.0";

        auto created = s3_backend::create(test_connection(), client_, options);
        ASSERT_TRUE(created);
        backend_ = created.value();
        backend_->set_clock([] {
            return std::chrono::system_clock::time_point(std::chrono::seconds(1369353600));
        });
    }

    void TearDown() override { get_logger().set_console_output(true); }

    std::shared_ptr<scripted_http_client> client_;
    std::shared_ptr<s3_backend> backend_;
};

TEST_F(S3BackendTest, BeginMultipartSendsMetadataAndParsesUploadId) {
    client_->respond(200,
                     "<InitiateMultipartUploadResult><Bucket>test-bucket</Bucket>"
                     "<Key>backups/db.tar.gz</Key><UploadId>up-1</UploadId>"
                     "</InitiateMultipartUploadResult>");

    object_metadata metadata;
    metadata.cache_control = "no-cache";
    metadata.user_metadata["owner"] = "ops";

    auto id = backend_->begin_multipart("backups/db.tar.gz", metadata);
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), "up-1");

    auto req = client_->last();
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "http://127.0.0.1:9000/test-bucket/backups/db.tar.gz?uploads=");
    EXPECT_EQ(req.headers["Content-Type"], "application/gzip");
    EXPECT_EQ(req.headers["Content-Encoding"], "gzip");
    EXPECT_EQ(req.headers["Cache-Control"], "no-cache");
    EXPECT_EQ(req.headers["x-amz-meta-owner"], "ops");
    EXPECT_EQ(req.headers["User-Agent"], "streamup-test/1.0");
    EXPECT_EQ(req.headers["Host"], "127.0.0.1:9000");
    EXPECT_EQ(req.headers["x-amz-date"], "20130524T000000Z");
    EXPECT_EQ(req.headers["Authorization"].rfind("AWS4-HMAC-SHA256 Credential=AKIDTESTKEY/", 0),
              0u);
}

TEST_F(S3BackendTest, BeginMultipartWithoutUploadIdIsInvalidResponse) {
    client_->respond(200, "<InitiateMultipartUploadResult/>");

    auto id = backend_->begin_multipart("obj", {});
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, error_code::invalid_response);
    EXPECT_EQ(id.error().operation, "CreateMultipartUpload");
}

TEST_F(S3BackendTest, UploadPartSignsPayloadAndReturnsEtag) {
    client_->respond(200, "", {{"ETag", "\"etag-3\""}});
    auto data = make_pattern(64);

    auto etag = backend_->upload_part("obj", "up-1", 3, data);
    ASSERT_TRUE(etag);
    EXPECT_EQ(etag.value(), "\"etag-3\"");

    auto req = client_->last();
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.url, "http://127.0.0.1:9000/test-bucket/obj?partNumber=3&uploadId=up-1");
    EXPECT_EQ(req.body, to_string(data));
    EXPECT_EQ(req.headers["Content-Length"], "64");
    EXPECT_EQ(req.headers["x-amz-content-sha256"],
              backend_utils::bytes_to_hex(backend_utils::sha256_bytes(data)));
}

TEST_F(S3BackendTest, UploadPartReadsEtagCaseInsensitively) {
    client_->respond(200, "", {{"etag", "\"lower\""}});
    auto etag = backend_->upload_part("obj", "up-1", 1, make_pattern(8));
    ASSERT_TRUE(etag);
    EXPECT_EQ(etag.value(), "\"lower\"");
}

TEST_F(S3BackendTest, UploadPartWithoutEtagIsInvalidResponse) {
    client_->respond(200);
    auto etag = backend_->upload_part("obj", "up-1", 1, make_pattern(8));
    ASSERT_FALSE(etag);
    EXPECT_EQ(etag.error().code, error_code::invalid_response);
}

TEST_F(S3BackendTest, UploadPartMapsServiceErrors) {
    client_->respond(503,
                     "<Error><Code>SlowDown</Code><Message>Please reduce your request rate."
                     "</Message></Error>");

    auto etag = backend_->upload_part("obj", "up-1", 1, make_pattern(8));
    ASSERT_FALSE(etag);
    EXPECT_EQ(etag.error().code, error_code::throttled);
    EXPECT_EQ(etag.error().http_status, 503);
    EXPECT_EQ(etag.error().service_code, "SlowDown");
    EXPECT_EQ(etag.error().operation, "UploadPart");
    EXPECT_EQ(etag.error().describe(),
              "upload error during UploadPart: Please reduce your request rate. (SlowDown)");
}

TEST_F(S3BackendTest, TransportFailureKeepsCodeAndNamesOperation) {
    client_->fail(error{error_code::connection_reset, "connection reset by peer"});

    auto etag = backend_->upload_part("obj", "up-1", 1, make_pattern(8));
    ASSERT_FALSE(etag);
    EXPECT_EQ(etag.error().code, error_code::connection_reset);
    EXPECT_EQ(etag.error().operation, "UploadPart");
}

TEST_F(S3BackendTest, TransportErrorCarriesLibraryCause) {
    auto err = http_transport_error("PUT", "https://b.s3.amazonaws.com/obj", "connection refused");
    EXPECT_EQ(err.code, error_code::network_error);
    EXPECT_EQ(err.message, "HTTP PUT https://b.s3.amazonaws.com/obj failed: connection refused");
    EXPECT_TRUE(retry_policy::should_retry(err));

    auto bare = http_transport_error("GET", "https://b.s3.amazonaws.com/obj", "");
    EXPECT_EQ(bare.message, "HTTP GET https://b.s3.amazonaws.com/obj failed");
}

TEST_F(S3BackendTest, CompleteMultipartSendsSortedPartList) {
    client_->respond(200,
                     "<CompleteMultipartUploadResult>"
                     "<Location>http://127.0.0.1:9000/test-bucket/obj</Location>"
                     "<ETag>&quot;final-2&quot;</ETag>"
                     "</CompleteMultipartUploadResult>");

    auto done = backend_->complete_multipart("obj", "up-1",
                                             {{1, "\"a\""}, {2, "\"b\""}});
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().etag, "\"final-2\"");
    EXPECT_EQ(done.value().location, "http://127.0.0.1:9000/test-bucket/obj");

    auto req = client_->last();
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "http://127.0.0.1:9000/test-bucket/obj?uploadId=up-1");
    EXPECT_EQ(req.headers["Content-Type"], "application/xml");
    auto first = req.body.find("<PartNumber>1</PartNumber>");
    auto second = req.body.find("<PartNumber>2</PartNumber>");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(req.body.find("<ETag>&quot;a&quot;</ETag>"), std::string::npos);
}

TEST_F(S3BackendTest, CompleteMultipartErrorInsideOkResponse) {
    client_->respond(200,
                     "<?xml version=\"1.0\"?><Error><Code>InternalError</Code>"
                     "<Message>We encountered an internal error.</Message></Error>");

    auto done = backend_->complete_multipart("obj", "up-1", {{1, "\"a\""}});
    ASSERT_FALSE(done);
    EXPECT_EQ(done.error().code, error_code::internal_service_error);
    EXPECT_EQ(done.error().service_code, "InternalError");
    EXPECT_EQ(done.error().http_status, 0);
    EXPECT_EQ(done.error().operation, "CompleteMultipartUpload");
}

TEST_F(S3BackendTest, AbortMultipart) {
    client_->respond(204);
    EXPECT_TRUE(backend_->abort_multipart("obj", "up-1"));
    auto req = client_->last();
    EXPECT_EQ(req.method, "DELETE");
    EXPECT_EQ(req.url, "http://127.0.0.1:9000/test-bucket/obj?uploadId=up-1");

    client_->respond(404, "<Error><Code>NoSuchUpload</Code></Error>");
    auto missing = backend_->abort_multipart("obj", "up-1");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, error_code::upload_not_found);
}

TEST_F(S3BackendTest, HeadObjectParsesHeaders) {
    client_->respond(200, "",
                     {{"Content-Length", "42"},
                      {"ETag", "\"abc\""},
                      {"Content-Type", "text/plain"},
                      {"Last-Modified", "Fri, 24 May 2013 00:00:00 GMT"}});

    auto info = backend_->head_object("notes.txt");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().key, "notes.txt");
    EXPECT_EQ(info.value().size, 42u);
    EXPECT_EQ(info.value().etag, "\"abc\"");
    EXPECT_EQ(info.value().content_type, "text/plain");
    EXPECT_EQ(info.value().last_modified,
              std::chrono::system_clock::time_point(std::chrono::seconds(1369353600)));
    EXPECT_EQ(client_->last().method, "HEAD");
}

TEST_F(S3BackendTest, HeadObjectNotFound) {
    client_->respond(404);
    auto info = backend_->head_object("missing");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, error_code::object_not_found);
    EXPECT_EQ(info.error().message, "HTTP 404");
}

TEST_F(S3BackendTest, GetObjectStreamsRangedWindows) {
    client_->respond(200, "", {{"Content-Length", "10"}, {"ETag", "\"v1\""}});
    client_->respond(206, "0123");
    client_->respond(206, "4567");
    client_->respond(206, "89");

    auto reader = backend_->get_object("file.txt");
    ASSERT_TRUE(reader);

    memory_sink sink;
    byte_buffer buffer(3);
    for (;;) {
        auto n = reader.value()->read(buffer);
        ASSERT_TRUE(n);
        if (n.value() == 0) {
            break;
        }
        ASSERT_TRUE(sink.write(std::span<const std::byte>(buffer).first(n.value())));
    }
    EXPECT_EQ(sink.str(), "0123456789");

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[1].headers["Range"], "bytes=0-3");
    EXPECT_EQ(requests[2].headers["Range"], "bytes=4-7");
    EXPECT_EQ(requests[3].headers["Range"], "bytes=8-9");
    EXPECT_EQ(requests[3].headers["If-Match"], "\"v1\"");
}

TEST_F(S3BackendTest, GetObjectFailsWhenObjectChanges) {
    client_->respond(200, "", {{"Content-Length", "8"}, {"ETag", "\"v1\""}});
    client_->respond(206, "0123");
    client_->respond(412, "<Error><Code>PreconditionFailed</Code></Error>");

    auto reader = backend_->get_object("file.txt");
    ASSERT_TRUE(reader);

    byte_buffer buffer(8);
    auto n = read_full(*reader.value(), buffer);
    ASSERT_FALSE(n);
    EXPECT_EQ(n.error().service_code, "PreconditionFailed");
    EXPECT_EQ(n.error().operation, "GetObject");
}

TEST_F(S3BackendTest, GetObjectOfEmptyObjectReadsNothing) {
    client_->respond(200, "", {{"Content-Length", "0"}});

    auto reader = backend_->get_object("empty");
    ASSERT_TRUE(reader);
    byte_buffer buffer(8);
    auto n = reader.value()->read(buffer);
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 0u);
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(S3BackendTest, ListMultipartSessionsParsesPage) {
    client_->respond(200,
                     "<ListMultipartUploadsResult>"
                     "<IsTruncated>true</IsTruncated>"
                     "<NextKeyMarker>logs/b</NextKeyMarker>"
                     "<NextUploadIdMarker>u2</NextUploadIdMarker>"
                     "<Upload><Key>logs/a</Key><UploadId>u1</UploadId>"
                     "<Initiated>2013-05-24T00:00:00.000Z</Initiated>"
                     "<StorageClass>STANDARD</StorageClass></Upload>"
                     "<Upload><Key>logs/b</Key><UploadId>u2</UploadId>"
                     "<Initiated>2013-05-24T01:00:00.000Z</Initiated></Upload>"
                     "</ListMultipartUploadsResult>");

    session_list_request request;
    request.prefix = "logs/";
    request.max_uploads = 2;
    auto page = backend_->list_multipart_sessions(request);
    ASSERT_TRUE(page);

    ASSERT_EQ(page.value().sessions.size(), 2u);
    EXPECT_EQ(page.value().sessions[0].key, "logs/a");
    EXPECT_EQ(page.value().sessions[0].upload_id, "u1");
    EXPECT_EQ(page.value().sessions[0].storage_class, "STANDARD");
    EXPECT_EQ(page.value().sessions[1].initiated,
              std::chrono::system_clock::time_point(std::chrono::seconds(1369353600 + 3600)));
    EXPECT_TRUE(page.value().is_truncated);
    EXPECT_EQ(page.value().next_key_marker, "logs/b");
    EXPECT_EQ(page.value().next_upload_id_marker, "u2");

    EXPECT_EQ(client_->last().url,
              "http://127.0.0.1:9000/test-bucket?max-uploads=2&prefix=logs%2F&uploads=");
}

TEST_F(S3BackendTest, ListObjectsParsesPage) {
    client_->respond(200,
                     "<ListBucketResult>"
                     "<IsTruncated>false</IsTruncated>"
                     "<Contents><Key>a.txt</Key><Size>12</Size><ETag>&quot;e1&quot;</ETag>"
                     "<LastModified>2013-05-24T00:00:00.000Z</LastModified></Contents>"
                     "</ListBucketResult>");

    object_list_request request;
    request.continuation_token = "tok";
    auto page = backend_->list_objects(request);
    ASSERT_TRUE(page);

    ASSERT_EQ(page.value().objects.size(), 1u);
    EXPECT_EQ(page.value().objects[0].key, "a.txt");
    EXPECT_EQ(page.value().objects[0].size, 12u);
    EXPECT_EQ(page.value().objects[0].etag, "\"e1\"");
    EXPECT_FALSE(page.value().is_truncated);

    EXPECT_EQ(client_->last().url,
              "http://127.0.0.1:9000/test-bucket?continuation-token=tok&list-type=2");
}

TEST_F(S3BackendTest, DeleteObject) {
    client_->respond(204);
    EXPECT_TRUE(backend_->delete_object("gone.txt"));
    EXPECT_EQ(client_->last().method, "DELETE");

    client_->respond(403, "<Error><Code>AccessDenied</Code></Error>");
    auto denied = backend_->delete_object("gone.txt");
    ASSERT_FALSE(denied);
    EXPECT_EQ(denied.error().code, error_code::access_denied);
}

class S3ErrorMappingTest : public ::testing::Test {
protected:
    static auto map(int status, const std::string& body = {}) -> error {
        http_response response;
        response.status_code = status;
        response.body.assign(body.begin(), body.end());
        return s3_backend::map_response_error(response, "Op");
    }
};

TEST_F(S3ErrorMappingTest, StatusCodes) {
    EXPECT_EQ(map(403).code, error_code::access_denied);
    EXPECT_EQ(map(404).code, error_code::object_not_found);
    EXPECT_EQ(map(408).code, error_code::request_timeout);
    EXPECT_EQ(map(429).code, error_code::throttled);
    EXPECT_EQ(map(500).code, error_code::internal_service_error);
    EXPECT_EQ(map(502).code, error_code::internal_service_error);
    EXPECT_EQ(map(503).code, error_code::service_unavailable);
    EXPECT_EQ(map(400).code, error_code::backend_error);
}

TEST_F(S3ErrorMappingTest, ServiceCodesWin) {
    EXPECT_EQ(map(404, "<Error><Code>NoSuchUpload</Code></Error>").code,
              error_code::upload_not_found);
    EXPECT_EQ(map(400, "<Error><Code>RequestTimeout</Code></Error>").code,
              error_code::request_timeout);
}

TEST_F(S3ErrorMappingTest, KeepsContext) {
    auto err = map(400, "<Error><Code>InvalidPart</Code><Message>bad &amp; wrong</Message>"
                        "</Error>");
    EXPECT_EQ(err.http_status, 400);
    EXPECT_EQ(err.service_code, "InvalidPart");
    EXPECT_EQ(err.message, "bad & wrong");
    EXPECT_EQ(err.operation, "Op");
}

class S3AddressingTest : public ::testing::Test {
protected:
    static auto backend_for(const connection_config& connection) -> std::shared_ptr<s3_backend> {
        auto created = s3_backend::create(connection, std::make_shared<scripted_http_client>());
        EXPECT_TRUE(created);
        return created.value();
    }
};

TEST_F(S3AddressingTest, AwsUsesVirtualHostedStyle) {
    auto connection = test_connection();
    connection.endpoint.clear();
    connection.region = "eu-west-1";

    EXPECT_EQ(backend_for(connection)->object_url("dir/a b.txt"),
              "https://test-bucket.s3.eu-west-1.amazonaws.com/dir/a%20b.txt");
}

TEST_F(S3AddressingTest, ForcedPathStyleOnAws) {
    auto connection = test_connection();
    connection.endpoint.clear();
    connection.force_path_style = true;

    EXPECT_EQ(backend_for(connection)->object_url("k"),
              "https://s3.us-east-1.amazonaws.com/test-bucket/k");
}

TEST_F(S3AddressingTest, AccountIdSelectsR2) {
    auto connection = test_connection();
    connection.endpoint.clear();
    connection.account_id = "acct123";

    EXPECT_EQ(backend_for(connection)->object_url("k"),
              "https://acct123.r2.cloudflarestorage.com/test-bucket/k");
}

TEST_F(S3AddressingTest, CreateRejectsInvalidConnection) {
    auto connection = test_connection();
    connection.bucket.clear();

    auto created = s3_backend::create(connection, std::make_shared<scripted_http_client>());
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, error_code::missing_field);
}

}  // namespace kcenon::streamup::test
