#include <gtest/gtest.h>
#include "client/UploadClient.hpp"
#include "test_support.hpp"

using namespace chunkwire;
using test::FakeTransport;

class UploadClientTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        config.serverUrl = "http://files.test:8080";
        config.retryDelay = std::chrono::milliseconds(0);
        config.maxRetryDelay = std::chrono::milliseconds(0);
    }

    ClientConfig config;
    test::TempDir dir;
};

TEST_F(UploadClientTest, MissingFileIsReportedBeforeProbingServer)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::unreachable(); });
    UploadClient client(config, transport);

    TransferResult result = client.checkAndUpload((dir.path() / "ghost.bin").string());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::LocalIO);
    EXPECT_EQ(transport.calls(), 0u);
}

TEST_F(UploadClientTest, DirectoryIsReportedBeforeProbingServer)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200); });
    UploadClient client(config, transport);

    TransferResult result = client.checkAndUpload(dir.path().string());

    EXPECT_EQ(result.errorKind, ErrorKind::LocalIO);
    EXPECT_EQ(transport.calls(), 0u);
}

TEST_F(UploadClientTest, UnreachableServerStopsBeforeFirstChunk)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::unreachable(); });
    UploadClient client(config, transport);

    TransferResult result = client.checkAndUpload(dir.writeFile("a.bin", test::randomBytes(20000)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Transient);
    EXPECT_EQ(result.chunksTotal, 3u);
    EXPECT_EQ(result.chunksSent, 0u);
    ASSERT_EQ(transport.calls(), 1u);
    EXPECT_NE(transport.urls[0].find("/status"), std::string::npos);
}

TEST_F(UploadClientTest, ProbesStatusThenUploads)
{
    FakeTransport transport([](const std::string& url, size_t) {
        if (url.find("/status") != std::string::npos) {
            return FakeTransport::reply(200, R"({"status":"running","uploaded_files":[],"active_uploads":0})");
        }
        return FakeTransport::reply(200);
    });
    UploadClient client(config, transport);

    TransferResult result = client.checkAndUpload(dir.writeFile("a.bin", test::randomBytes(20000)));

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.chunksSent, 3u);
    ASSERT_EQ(transport.calls(), 4u);
    EXPECT_NE(transport.urls[0].find("/status"), std::string::npos);
    EXPECT_NE(transport.urls[1].find("/upload?"), std::string::npos);
}
