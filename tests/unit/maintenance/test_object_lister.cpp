/**
 * @file test_object_lister.cpp
 * @brief Unit tests for paginated object listing
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/maintenance/object_lister.h>

#include "integration/test_fixtures.h"

namespace kcenon::streamup::test {

namespace {

class failing_list_backend : public forwarding_backend {
public:
    using forwarding_backend::forwarding_backend;

    auto list_objects(const object_list_request&) -> result<object_list_page> override {
        error err{error_code::service_unavailable, "Please reduce your request rate"};
        err.http_status = 503;
        err.service_code = "SlowDown";
        return unexpected{err};
    }
};

}  // namespace

class ObjectListerTest : public MemoryBackendFixture {
protected:
    void SetUp() override {
        MemoryBackendFixture::SetUp();
        for (int i = 0; i < 5; ++i) {
            backend_->put_object("logs/day" + std::to_string(i) + ".gz",
                                 make_pattern(100 + i), "application/gzip");
        }
        backend_->put_object("db/dump.sql", make_pattern(10), "application/sql");
    }

    auto config(const std::string& prefix = "") const -> list_config {
        list_config c;
        c.connection = test_connection();
        c.prefix = prefix;
        return c;
    }
};

TEST_F(ObjectListerTest, ListsAllObjectsInKeyOrder) {
    object_lister lister(config(), backend_);
    auto objects = lister.list();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects.value().size(), 6u);
    EXPECT_EQ(objects.value()[0].key, "db/dump.sql");
    EXPECT_EQ(objects.value()[1].key, "logs/day0.gz");
    EXPECT_EQ(objects.value()[1].size, 100u);
    EXPECT_EQ(objects.value()[1].content_type, "application/gzip");
    EXPECT_FALSE(objects.value()[1].etag.empty());
}

TEST_F(ObjectListerTest, PrefixFilter) {
    object_lister lister(config("logs/"), backend_);
    auto objects = lister.list();
    ASSERT_TRUE(objects);
    EXPECT_EQ(objects.value().size(), 5u);
}

TEST_F(ObjectListerTest, EmptyResult) {
    object_lister lister(config("none/"), backend_);
    auto objects = lister.list();
    ASSERT_TRUE(objects);
    EXPECT_TRUE(objects.value().empty());
}

TEST_F(ObjectListerTest, ZeroMaxKeysUsesDefault) {
    auto c = config();
    c.max_keys = 0;
    object_lister lister(c, backend_);
    EXPECT_EQ(lister.config().max_keys, list_config::default_max_keys);
}

TEST_F(ObjectListerTest, FollowsContinuationTokens) {
    auto paged = std::make_shared<small_page_backend>(backend_, 2);
    object_lister lister(config(), paged);

    auto objects = lister.list();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects.value().size(), 6u);
    EXPECT_EQ(objects.value().back().key, "logs/day4.gz");
    EXPECT_EQ(paged->object_list_calls(), 3u);
}

TEST_F(ObjectListerTest, StopsAtMaxKeys) {
    auto paged = std::make_shared<small_page_backend>(backend_, 2);
    auto c = config();
    c.max_keys = 3;
    object_lister lister(c, paged);

    auto objects = lister.list();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects.value().size(), 3u);
    EXPECT_EQ(objects.value()[2].key, "logs/day1.gz");
    EXPECT_EQ(paged->object_list_calls(), 2u);
}

TEST_F(ObjectListerTest, ListingFailureIsReported) {
    auto failing = std::make_shared<failing_list_backend>(backend_);
    object_lister lister(config(), failing);

    auto objects = lister.list();
    ASSERT_FALSE(objects);
    EXPECT_EQ(objects.error().code, error_code::service_unavailable);
    EXPECT_EQ(objects.error().message,
              "failed to list objects: Please reduce your request rate (SlowDown)");
}

TEST_F(ObjectListerTest, CreateValidatesConnection) {
    auto c = config();
    c.connection.bucket.clear();
    auto lister = object_lister::create(c);
    ASSERT_FALSE(lister);
    EXPECT_EQ(lister.error().code, error_code::missing_field);

    ASSERT_TRUE(object_lister::create(config()));
}

}  // namespace kcenon::streamup::test
