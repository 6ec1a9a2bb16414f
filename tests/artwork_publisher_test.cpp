#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace listen_along;
using namespace listen_along::testing;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

// ============================================================================
// ArtworkPublisher
// ============================================================================

TEST(ArtworkPublisher, CacheHitIgnoresDifferentBytes) {
    auto host = std::make_shared<StrictMock<MockImageHost>>();
    EXPECT_CALL(*host, upload(bytes_of("first")))
        .WillOnce(Return(std::string("https://files.catbox.moe/1.jpg")));

    services::ArtworkPublisher publisher(host);

    auto first = publisher.publish("media-session-abc", bytes_of("first"));
    auto second = publisher.publish("media-session-abc", bytes_of("re-encoded"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "https://files.catbox.moe/1.jpg");
    EXPECT_EQ(publisher.cache_size(), 1u);
}

TEST(ArtworkPublisher, FailureIsNotCached) {
    auto host = std::make_shared<StrictMock<MockImageHost>>();
    EXPECT_CALL(*host, upload(_))
        .WillOnce(Return(std::unexpected(core::UploadError::TransportFailed)))
        .WillOnce(Return(std::string("https://files.catbox.moe/2.jpg")));

    services::ArtworkPublisher publisher(host);

    auto failed = publisher.publish("key", bytes_of("img"));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), core::UploadError::TransportFailed);
    EXPECT_FALSE(publisher.cached("key").has_value());

    auto retried = publisher.publish("key", bytes_of("img"));
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(publisher.cached("key"), "https://files.catbox.moe/2.jpg");
}

TEST(ArtworkPublisher, DistinctKeysUploadSeparately) {
    auto host = std::make_shared<StrictMock<MockImageHost>>();
    EXPECT_CALL(*host, upload(_))
        .Times(2)
        .WillRepeatedly(Return(std::string("https://files.catbox.moe/x.jpg")));

    services::ArtworkPublisher publisher(host);
    EXPECT_TRUE(publisher.publish("a", bytes_of("img")).has_value());
    EXPECT_TRUE(publisher.publish("b", bytes_of("img")).has_value());
    EXPECT_EQ(publisher.cache_size(), 2u);
}

// ============================================================================
// CatboxImageHost
// ============================================================================

namespace {

struct CatboxFixture : ::testing::Test {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    core::ArtworkConfig config;

    services::CatboxImageHost make_host() {
        return services::CatboxImageHost(http, config);
    }
};

} // namespace

TEST_F(CatboxFixture, EmptyPayloadIsRejectedWithoutIo) {
    auto host = make_host();
    auto result = host.upload({});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::UploadError::EmptyPayload);
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(CatboxFixture, OversizedPayloadIsRejected) {
    config.max_upload_bytes = 4;
    auto host = make_host();
    auto result = host.upload(bytes_of("12345"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::UploadError::TooLarge);
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(CatboxFixture, SendsMultipartUpload) {
    http->respond(services::HttpStatus::OK, "https://files.catbox.moe/abc123.jpg\n");
    auto host = make_host();

    auto result = host.upload(bytes_of("jpegdata"));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "https://files.catbox.moe/abc123.jpg");

    ASSERT_EQ(http->requests.size(), 1u);
    const auto& request = http->requests.front();
    EXPECT_EQ(request.method, services::HttpMethod::POST);
    EXPECT_EQ(request.url, "https://catbox.moe/user/api.php");
    ASSERT_EQ(request.multipart.size(), 2u);
    EXPECT_EQ(request.multipart[0].name, "reqtype");
    EXPECT_EQ(request.multipart[0].data, "fileupload");
    EXPECT_EQ(request.multipart[1].name, "fileToUpload");
    EXPECT_EQ(request.multipart[1].data, "jpegdata");
    EXPECT_EQ(request.multipart[1].filename, "cover.jpg");
    EXPECT_EQ(request.timeout, std::chrono::seconds(10));
}

TEST_F(CatboxFixture, TransportErrorMapsToTransportFailed) {
    http->error = services::NetworkError::Timeout;
    auto result = make_host().upload(bytes_of("img"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::UploadError::TransportFailed);
}

TEST_F(CatboxFixture, HttpErrorMapsToTransportFailed) {
    http->respond(services::HttpStatus::ServiceUnavailable, "try later");
    auto result = make_host().upload(bytes_of("img"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::UploadError::TransportFailed);
}

TEST_F(CatboxFixture, NonUrlBodyIsRejected) {
    http->respond(services::HttpStatus::OK, "<html>error</html>");
    auto result = make_host().upload(bytes_of("img"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::UploadError::RejectedResponse);
}

TEST(CatboxAcceptance, UrlRules) {
    using services::CatboxImageHost;
    EXPECT_TRUE(CatboxImageHost::is_acceptable_url("https://files.catbox.moe/x.png"));
    EXPECT_TRUE(CatboxImageHost::is_acceptable_url("http://files.catbox.moe/x.png"));

    EXPECT_FALSE(CatboxImageHost::is_acceptable_url(""));
    EXPECT_FALSE(CatboxImageHost::is_acceptable_url("https://example.com/x.png"));
    EXPECT_FALSE(CatboxImageHost::is_acceptable_url("files.catbox.moe/x.png"));
    EXPECT_FALSE(CatboxImageHost::is_acceptable_url("https://files.catbox.moe/" + std::string(500, 'a')));
}
