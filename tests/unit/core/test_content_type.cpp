/**
 * @file test_content_type.cpp
 * @brief Unit tests for MIME type and encoding detection
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/core/content_type.h>

namespace kcenon::streamup::test {

class ContentTypeTest : public ::testing::Test {};

TEST_F(ContentTypeTest, CommonTypes) {
    EXPECT_EQ(detect_content_type("index.html"), "text/html");
    EXPECT_EQ(detect_content_type("photo.JPG"), "image/jpeg");
    EXPECT_EQ(detect_content_type("report.pdf"), "application/pdf");
    EXPECT_EQ(detect_content_type("archive.tar"), "application/x-tar");
}

TEST_F(ContentTypeTest, WebTypesTakePrecedence) {
    EXPECT_EQ(detect_content_type("data.json"), "application/json");
    EXPECT_EQ(detect_content_type("font.woff2"), "font/woff2");
    EXPECT_EQ(detect_content_type("README.md"), "text/markdown");
    EXPECT_EQ(detect_content_type("config.yaml"), "text/yaml");
}

TEST_F(ContentTypeTest, UsesLastExtensionOfBaseName) {
    EXPECT_EQ(detect_content_type("backups/db.tar.gz"), "application/gzip");
    EXPECT_EQ(detect_content_type("v1.2/README"), "application/octet-stream");
}

TEST_F(ContentTypeTest, UnknownFallsBackToOctetStream) {
    EXPECT_EQ(detect_content_type("blob.xyz123"), "application/octet-stream");
    EXPECT_EQ(detect_content_type("Makefile"), "application/octet-stream");
    EXPECT_EQ(detect_content_type(""), "application/octet-stream");
}

TEST_F(ContentTypeTest, ContentEncoding) {
    EXPECT_EQ(detect_content_encoding("db.tar.gz"), "gzip");
    EXPECT_EQ(detect_content_encoding("bundle.js.br"), "br");
    EXPECT_EQ(detect_content_encoding("dump.zst"), "zstd");
    EXPECT_EQ(detect_content_encoding("plain.txt"), "");
}

TEST_F(ContentTypeTest, ShouldCompress) {
    EXPECT_TRUE(should_compress("text/plain"));
    EXPECT_TRUE(should_compress("application/json"));
    EXPECT_TRUE(should_compress("image/svg+xml"));
    EXPECT_FALSE(should_compress("image/png"));
    EXPECT_FALSE(should_compress("application/gzip"));
}

}  // namespace kcenon::streamup::test
