/**
 * @file test_s3_gateway.cpp
 * @brief Unit tests for the S3 gateway over a scripted HTTP client
 */

#include <gtest/gtest.h>

#include "fixtures/fake_http_client.h"

#include <garage/transfer/gateway/gateway_utils.h>
#include <garage/transfer/gateway/s3_gateway.h>

#include <memory>
#include <sstream>
#include <string>

namespace garage::transfer::test {

namespace {

auto fast_retry_policy() -> retry_policy {
    retry_policy policy;
    policy.max_attempts = 3;
    policy.initial_delay = std::chrono::milliseconds(1);
    policy.max_delay = std::chrono::milliseconds(2);
    policy.use_jitter = false;
    return policy;
}

auto list_xml(const std::string& contents, bool truncated, const std::string& token = "")
    -> std::string {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Name>photos</Name><Prefix>2024/</Prefix>";
    xml += contents;
    xml += std::string("<IsTruncated>") + (truncated ? "true" : "false") + "</IsTruncated>";
    if (!token.empty()) {
        xml += "<NextContinuationToken>" + token + "</NextContinuationToken>";
    }
    xml += "</ListBucketResult>";
    return xml;
}

auto contents_xml(const std::string& key, uint64_t size) -> std::string {
    return "<Contents><Key>" + key + "</Key><LastModified>2024-01-01T00:00:00.000Z"
           "</LastModified><ETag>&quot;abc&quot;</ETag><Size>" + std::to_string(size) +
           "</Size><StorageClass>STANDARD</StorageClass></Contents>";
}

}  // namespace

// =============================================================================
// Construction Tests
// =============================================================================

class S3GatewayCreateTest : public ::testing::Test {};

TEST_F(S3GatewayCreateTest, RejectsEmptyEndpoint) {
    auto config = gateway_config_builder().with_credentials("GK1", "secret").build();
    auto gateway = s3_gateway::create(config, std::make_shared<fake_http_client>());
    ASSERT_FALSE(gateway.has_value());
    EXPECT_EQ(gateway.error().code, error_code::configuration_error);
}

TEST_F(S3GatewayCreateTest, RejectsMissingCredentials) {
    auto config = gateway_config_builder().with_endpoint("http://localhost:3900").build();
    auto gateway = s3_gateway::create(config, std::make_shared<fake_http_client>());
    ASSERT_FALSE(gateway.has_value());
    EXPECT_EQ(gateway.error().code, error_code::configuration_error);
}

TEST_F(S3GatewayCreateTest, RejectsTinyMultipartParts) {
    auto config = gateway_config_builder()
        .with_endpoint("http://localhost:3900")
        .with_credentials("GK1", "secret")
        .with_multipart(1024, 1024)
        .build();
    auto gateway = s3_gateway::create(config, std::make_shared<fake_http_client>());
    ASSERT_FALSE(gateway.has_value());
    EXPECT_EQ(gateway.error().code, error_code::configuration_error);
}

TEST_F(S3GatewayCreateTest, DefaultsToGarageRegion) {
    auto config = gateway_config_builder()
        .with_endpoint("http://localhost:3900")
        .with_credentials("GK1", "secret")
        .with_region("")
        .build();
    auto gateway = s3_gateway::create(config, std::make_shared<fake_http_client>());
    ASSERT_TRUE(gateway.has_value());
    EXPECT_EQ(gateway.value()->config().region, "garage");
    EXPECT_FALSE(gateway.value()->config().use_ssl);
}

// =============================================================================
// Operation Tests
// =============================================================================

class S3GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<fake_http_client>();
        auto config = gateway_config_builder()
            .with_endpoint("http://localhost:3900")
            .with_credentials("GK31c2f218a2e44f485b94239e", "b892c0665f0ada8a4755dae98baa3b13")
            .with_retry_policy(fast_retry_policy())
            .with_multipart(5 * 1024 * 1024, 5 * 1024 * 1024)
            .build();
        auto gateway = s3_gateway::create(config, http_);
        ASSERT_TRUE(gateway.has_value()) << gateway.error().message;
        gateway_ = std::move(gateway.value());
    }

    std::shared_ptr<fake_http_client> http_;
    std::unique_ptr<s3_gateway> gateway_;
};

TEST_F(S3GatewayTest, ListPageSendsListObjectsV2Request) {
    http_->respond(200, list_xml(contents_xml("2024/a.jpg", 10), true, "tok/1"));

    auto page = gateway_->list_page("photos", "2024/", std::nullopt);
    ASSERT_TRUE(page.has_value()) << page.error().message;
    ASSERT_EQ(page.value().objects.size(), 1u);
    EXPECT_EQ(page.value().objects[0].key, "2024/a.jpg");
    EXPECT_EQ(page.value().next_token, "tok/1");

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "GET");
    EXPECT_EQ(requests[0].url, "http://localhost:3900/photos?list-type=2&prefix=2024%2F");
    EXPECT_EQ(requests[0].headers.at("Host"), "localhost:3900");
    EXPECT_EQ(requests[0].headers.at("Authorization").rfind("AWS4-HMAC-SHA256 ", 0), 0u);
}

TEST_F(S3GatewayTest, ListPageForwardsContinuationToken) {
    http_->respond(200, list_xml("", false));

    auto page = gateway_->list_page("photos", "", std::string("tok/1"));
    ASSERT_TRUE(page.has_value());
    EXPECT_FALSE(page.value().next_token.has_value());

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url,
              "http://localhost:3900/photos?continuation-token=tok%2F1&list-type=2");
}

TEST_F(S3GatewayTest, ListPageMapsMissingBucket) {
    http_->respond(404,
                   "<Error><Code>NoSuchBucket</Code><Message>Bucket not found</Message></Error>");

    auto page = gateway_->list_page("nope", "", std::nullopt);
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, error_code::bucket_not_found);
}

TEST_F(S3GatewayTest, GetObjectStreamsBodyWithProgress) {
    http_->respond(200, "hello world");

    std::ostringstream sink;
    uint64_t last_reported = 0;
    auto written = gateway_->get_object("photos", "dir/a b.txt", sink,
                                        [&](uint64_t transferred, uint64_t total) {
                                            last_reported = transferred;
                                            EXPECT_EQ(total, 11u);
                                        });

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 11u);
    EXPECT_EQ(sink.str(), "hello world");
    EXPECT_EQ(last_reported, 11u);
    EXPECT_EQ(http_->requests()[0].url, "http://localhost:3900/photos/dir/a%20b.txt");
}

TEST_F(S3GatewayTest, GetMissingObjectIsNotFound) {
    http_->respond(404, "<Error><Code>NoSuchKey</Code><Message>Key missing</Message></Error>");

    std::ostringstream sink;
    auto written = gateway_->get_object("photos", "gone.txt", sink, {});
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::object_not_found);
    EXPECT_NE(written.error().message.find("NoSuchKey"), std::string::npos);
    EXPECT_NE(written.error().message.find("Key missing"), std::string::npos);
}

TEST_F(S3GatewayTest, PutObjectSignsPayloadHash) {
    http_->respond(200);

    std::istringstream source("payload");
    auto stored = gateway_->put_object("photos", "p.txt", source, 7, {});
    ASSERT_TRUE(stored.has_value()) << stored.error().message;
    EXPECT_EQ(stored.value(), 7u);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].body, "payload");
    EXPECT_EQ(requests[0].headers.at("x-amz-content-sha256"),
              gateway_utils::sha256_hex("payload"));
}

TEST_F(S3GatewayTest, PutObjectShortReadFails) {
    std::istringstream source("abc");
    auto stored = gateway_->put_object("photos", "p.txt", source, 10, {});
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::file_read_error);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(S3GatewayTest, RetriesServerErrorsThenSucceeds) {
    http_->respond(503, "<Error><Code>SlowDown</Code></Error>");
    http_->fail_connection();
    http_->respond(204);

    auto deleted = gateway_->delete_object("photos", "k");
    ASSERT_TRUE(deleted.has_value()) << deleted.error().message;
    EXPECT_EQ(http_->requests().size(), 3u);
}

TEST_F(S3GatewayTest, GivesUpAfterMaxAttempts) {
    http_->respond(500);
    http_->respond(500);
    http_->respond(500);
    http_->respond(204);

    auto deleted = gateway_->delete_object("photos", "k");
    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().code, error_code::request_failed);
    EXPECT_EQ(http_->requests().size(), 3u);
    EXPECT_EQ(http_->pending(), 1u);
}

TEST_F(S3GatewayTest, ClientErrorsAreNotRetried) {
    http_->respond(403, "<Error><Code>AccessDenied</Code><Message>nope</Message></Error>");

    auto deleted = gateway_->delete_object("photos", "k");
    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().code, error_code::access_denied);
    EXPECT_EQ(http_->requests().size(), 1u);
}

TEST_F(S3GatewayTest, DeleteOfAbsentKeySucceeds) {
    http_->respond(404);

    auto deleted = gateway_->delete_object("photos", "k");
    EXPECT_TRUE(deleted.has_value());
}

TEST_F(S3GatewayTest, HeadObjectReadsHeaders) {
    http_->respond(200, "", {{"Content-Length", "42"}, {"ETag", "\"e\""},
                             {"Last-Modified", "Mon, 01 Jan 2024 00:00:00 GMT"}});

    auto head = gateway_->head_object("photos", "k");
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head.value().key, "k");
    EXPECT_EQ(head.value().size, 42u);
    EXPECT_EQ(head.value().etag, "\"e\"");
    EXPECT_EQ(http_->requests()[0].method, "HEAD");
}

TEST_F(S3GatewayTest, HeadMissingObject) {
    http_->respond(404);

    auto head = gateway_->head_object("photos", "k");
    ASSERT_FALSE(head.has_value());
    EXPECT_EQ(head.error().code, error_code::object_not_found);
}

TEST_F(S3GatewayTest, MultipartUploadSendsPartsAndCompletes) {
    const uint64_t size = 11 * 1024 * 1024;
    const std::string data(size, 'x');

    http_->respond(200, "<InitiateMultipartUploadResult><UploadId>upload-1</UploadId>"
                        "</InitiateMultipartUploadResult>");
    http_->respond(200, "", {{"ETag", "\"p1\""}});
    http_->respond(200, "", {{"ETag", "\"p2\""}});
    http_->respond(200, "", {{"ETag", "\"p3\""}});
    http_->respond(200, "<CompleteMultipartUploadResult><ETag>\"all\"</ETag>"
                        "</CompleteMultipartUploadResult>");

    std::istringstream source(data);
    int progress_calls = 0;
    auto stored = gateway_->put_object("photos", "big.bin", source, size,
                                       [&](uint64_t, uint64_t) { ++progress_calls; });

    ASSERT_TRUE(stored.has_value()) << stored.error().message;
    EXPECT_EQ(stored.value(), size);
    EXPECT_EQ(progress_calls, 3);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "http://localhost:3900/photos/big.bin?uploads=");
    EXPECT_EQ(requests[1].url,
              "http://localhost:3900/photos/big.bin?partNumber=1&uploadId=upload-1");
    EXPECT_EQ(requests[1].body.size(), 5u * 1024 * 1024);
    EXPECT_EQ(requests[3].body.size(), 1u * 1024 * 1024);
    EXPECT_EQ(requests[4].method, "POST");
    EXPECT_NE(requests[4].body.find("<PartNumber>3</PartNumber><ETag>\"p3\"</ETag>"),
              std::string::npos);
}

TEST_F(S3GatewayTest, MultipartFailureAbortsUpload) {
    const uint64_t size = 6 * 1024 * 1024;
    const std::string data(size, 'y');

    http_->respond(200, "<InitiateMultipartUploadResult><UploadId>upload-2</UploadId>"
                        "</InitiateMultipartUploadResult>");
    http_->respond(200, "", {{"ETag", "\"p1\""}});
    http_->respond(403, "<Error><Code>AccessDenied</Code></Error>");
    http_->respond(204);

    std::istringstream source(data);
    auto stored = gateway_->put_object("photos", "big.bin", source, size, {});

    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::access_denied);

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[3].method, "DELETE");
    EXPECT_EQ(requests[3].url, "http://localhost:3900/photos/big.bin?uploadId=upload-2");
}

TEST_F(S3GatewayTest, CompleteWithEmbeddedErrorAborts) {
    const uint64_t size = 5 * 1024 * 1024;
    const std::string data(size, 'z');

    http_->respond(200, "<InitiateMultipartUploadResult><UploadId>u3</UploadId>"
                        "</InitiateMultipartUploadResult>");
    http_->respond(200, "", {{"ETag", "\"p1\""}});
    http_->respond(200, "<Error><Code>InternalError</Code><Message>oops</Message></Error>");
    http_->respond(204);

    std::istringstream source(data);
    auto stored = gateway_->put_object("photos", "big.bin", source, size, {});

    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::request_failed);
    EXPECT_EQ(http_->requests().back().method, "DELETE");
}

TEST_F(S3GatewayTest, PresignProducesSignedUrl) {
    auto url = gateway_->presign("photos", "a b.jpg", presign_method::get,
                                 std::chrono::seconds(3600));
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().rfind("http://localhost:3900/photos/a%20b.jpg?", 0), 0u);
    EXPECT_NE(url.value().find("X-Amz-Expires=3600"), std::string::npos);
    EXPECT_NE(url.value().find("X-Amz-Credential=GK31c2f218a2e44f485b94239e%2F"),
              std::string::npos);
    EXPECT_NE(url.value().find("%2Fgarage%2Fs3%2Faws4_request"), std::string::npos);
    EXPECT_NE(url.value().find("&X-Amz-Signature="), std::string::npos);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(S3GatewayTest, PresignRejectsOutOfRangeExpiry) {
    auto zero = gateway_->presign("photos", "k", presign_method::put, std::chrono::seconds(0));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, error_code::invalid_argument);

    auto too_long = gateway_->presign("photos", "k", presign_method::put,
                                      std::chrono::seconds(604801));
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error().code, error_code::invalid_argument);
}

// =============================================================================
// Response Parsing Tests
// =============================================================================

class ListObjectsParsingTest : public ::testing::Test {};

TEST_F(ListObjectsParsingTest, ParsesContents) {
    auto page = s3_gateway::parse_list_objects_response(
        list_xml(contents_xml("a&amp;b.txt", 5) + contents_xml("c.txt", 1048576), false));

    ASSERT_TRUE(page.has_value()) << page.error().message;
    ASSERT_EQ(page.value().objects.size(), 2u);
    EXPECT_EQ(page.value().objects[0].key, "a&b.txt");
    EXPECT_EQ(page.value().objects[0].size, 5u);
    EXPECT_EQ(page.value().objects[0].etag, "\"abc\"");
    EXPECT_EQ(page.value().objects[0].last_modified, "2024-01-01T00:00:00.000Z");
    EXPECT_EQ(page.value().objects[1].size, 1048576u);
    EXPECT_FALSE(page.value().next_token.has_value());
}

TEST_F(ListObjectsParsingTest, EmptyListing) {
    auto page = s3_gateway::parse_list_objects_response(list_xml("", false));
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page.value().objects.empty());
}

TEST_F(ListObjectsParsingTest, TruncatedWithoutTokenIsError) {
    auto page = s3_gateway::parse_list_objects_response(list_xml(contents_xml("a", 1), true));
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, error_code::response_parse_error);
}

TEST_F(ListObjectsParsingTest, InvalidSizeIsError) {
    auto page = s3_gateway::parse_list_objects_response(
        list_xml("<Contents><Key>a</Key><Size>-1</Size></Contents>", false));
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, error_code::response_parse_error);
}

TEST_F(ListObjectsParsingTest, NonListingDocumentIsError) {
    auto page = s3_gateway::parse_list_objects_response("<html>proxy error</html>");
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, error_code::response_parse_error);
}

// =============================================================================
// Error Mapping Tests
// =============================================================================

class ErrorMappingTest : public ::testing::Test {};

TEST_F(ErrorMappingTest, MapsStatusAndCode) {
    EXPECT_EQ(s3_gateway::map_error_response(403, "", "GET b/k").code,
              error_code::access_denied);
    EXPECT_EQ(s3_gateway::map_error_response(
                  404, "<Error><Code>NoSuchKey</Code></Error>", "GET b/k").code,
              error_code::object_not_found);
    EXPECT_EQ(s3_gateway::map_error_response(
                  404, "<Error><Code>NoSuchBucket</Code></Error>", "GET b/k").code,
              error_code::bucket_not_found);
    EXPECT_EQ(s3_gateway::map_error_response(500, "", "GET b/k").code,
              error_code::request_failed);
}

TEST_F(ErrorMappingTest, MessageNamesContextCodeAndMessage) {
    auto err = s3_gateway::map_error_response(
        403, "<Error><Code>AccessDenied</Code><Message>Forbidden &amp; denied</Message></Error>",
        "PUT photos/a.jpg");

    EXPECT_EQ(err.message, "PUT photos/a.jpg failed: HTTP 403 AccessDenied (Forbidden & denied)");
}

}  // namespace garage::transfer::test
