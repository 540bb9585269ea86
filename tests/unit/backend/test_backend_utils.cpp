/**
 * @file test_backend_utils.cpp
 * @brief Unit tests for HTTP backend helper functions
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/backend/backend_utils.h>

#include <chrono>

namespace kcenon::streamup::test {

using namespace kcenon::streamup::backend_utils;

namespace {

auto at_seconds(long long seconds) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

}  // namespace

class EncodingTest : public ::testing::Test {};

TEST_F(EncodingTest, BytesToHex) {
    EXPECT_EQ(bytes_to_hex({0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(bytes_to_hex({}), "");
}

TEST_F(EncodingTest, UrlEncodeUnreservedPassThrough) {
    EXPECT_EQ(url_encode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST_F(EncodingTest, UrlEncodeReservedCharacters) {
    EXPECT_EQ(url_encode("a b"), "a%20b");
    EXPECT_EQ(url_encode("a+b=c&d"), "a%2Bb%3Dc%26d");
    EXPECT_EQ(url_encode("dir/file"), "dir%2Ffile");
    EXPECT_EQ(url_encode("dir/file", false), "dir/file");
}

TEST_F(EncodingTest, UrlEncodeUtf8Bytes) {
    EXPECT_EQ(url_encode("\xc3\xa9"), "%C3%A9");
}

TEST_F(EncodingTest, CanonicalQueryIsSortedAndKeepsEmptyValues) {
    std::map<std::string, std::string> params = {
        {"uploads", ""},
    };
    EXPECT_EQ(canonical_query_string(params), "uploads=");

    params = {
        {"uploadId", "abc/def"},
        {"partNumber", "7"},
    };
    EXPECT_EQ(canonical_query_string(params), "partNumber=7&uploadId=abc%2Fdef");

    EXPECT_EQ(canonical_query_string({}), "");
}

TEST_F(EncodingTest, XmlEscapeRoundTrip) {
    std::string raw = "<a href=\"x\">Tom & Jerry's</a>";
    auto escaped = xml_escape(raw);
    EXPECT_EQ(escaped, "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&apos;s&lt;/a&gt;");
    EXPECT_EQ(xml_unescape(escaped), raw);
}

TEST_F(EncodingTest, XmlUnescapeLeavesUnknownEntities) {
    EXPECT_EQ(xml_unescape("&amp;&unknown;&"), "&&unknown;&");
}

class CryptoTest : public ::testing::Test {};

TEST_F(CryptoTest, Sha256OfEmptyString) {
    EXPECT_EQ(bytes_to_hex(sha256("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(CryptoTest, Sha256BytesMatchesStringVariant) {
    std::string text = "abc";
    auto bytes = std::as_bytes(std::span<const char>(text.data(), text.size()));
    EXPECT_EQ(sha256_bytes(bytes), sha256(text));
    EXPECT_EQ(bytes_to_hex(sha256(text)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(CryptoTest, HmacSha256KnownVector) {
    // RFC 4231 test case 2
    auto mac = hmac_sha256(std::string("Jefe"), "what do ya want for nothing?");
    EXPECT_EQ(bytes_to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(CryptoTest, HmacKeyOverloadsAgree) {
    std::vector<uint8_t> key = {'k', 'e', 'y'};
    EXPECT_EQ(hmac_sha256(key, "data"), hmac_sha256(std::string("key"), "data"));
}

class TimeFormatTest : public ::testing::Test {};

TEST_F(TimeFormatTest, AmzDateAndDateStamp) {
    auto tp = at_seconds(1369353600);
    EXPECT_EQ(format_amz_date(tp), "20130524T000000Z");
    EXPECT_EQ(format_date_stamp(tp), "20130524");

    EXPECT_EQ(format_amz_date(at_seconds(1369353600 + 3661)), "20130524T010101Z");
}

TEST_F(TimeFormatTest, ParseIso8601) {
    auto parsed = parse_iso8601("2013-05-24T00:00:00.000Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, at_seconds(1369353600));

    auto no_fraction = parse_iso8601("2013-05-24T01:01:01Z");
    ASSERT_TRUE(no_fraction.has_value());
    EXPECT_EQ(*no_fraction, at_seconds(1369353600 + 3661));
}

TEST_F(TimeFormatTest, ParseIso8601RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("not a date").has_value());
    EXPECT_FALSE(parse_iso8601("").has_value());
}

TEST_F(TimeFormatTest, ParseHttpDate) {
    auto parsed = parse_http_date("Fri, 24 May 2013 00:00:00 GMT");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, at_seconds(1369353600));

    EXPECT_FALSE(parse_http_date("yesterday").has_value());
}

class XmlExtractTest : public ::testing::Test {};

TEST_F(XmlExtractTest, FirstElement) {
    std::string xml =
        "<InitiateMultipartUploadResult>"
        "<Bucket>b</Bucket><Key>k</Key><UploadId>abc123</UploadId>"
        "</InitiateMultipartUploadResult>";

    EXPECT_EQ(extract_xml_element(xml, "UploadId"), std::optional<std::string>("abc123"));
    EXPECT_EQ(extract_xml_element(xml, "Bucket"), std::optional<std::string>("b"));
    EXPECT_FALSE(extract_xml_element(xml, "Missing").has_value());
}

TEST_F(XmlExtractTest, UnclosedElementIsMissing) {
    EXPECT_FALSE(extract_xml_element("<Key>dangling", "Key").has_value());
}

TEST_F(XmlExtractTest, AllElementsInOrder) {
    std::string xml =
        "<ListMultipartUploadsResult>"
        "<Upload><Key>a</Key><UploadId>1</UploadId></Upload>"
        "<Upload><Key>b</Key><UploadId>2</UploadId></Upload>"
        "</ListMultipartUploadsResult>";

    auto uploads = extract_xml_elements(xml, "Upload");
    ASSERT_EQ(uploads.size(), 2u);
    EXPECT_EQ(extract_xml_element(uploads[0], "Key"), std::optional<std::string>("a"));
    EXPECT_EQ(extract_xml_element(uploads[1], "UploadId"), std::optional<std::string>("2"));

    EXPECT_TRUE(extract_xml_elements(xml, "Contents").empty());
}

}  // namespace kcenon::streamup::test
