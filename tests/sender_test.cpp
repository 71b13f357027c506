#include <gtest/gtest.h>
#include <thread>
#include "client/Sender.hpp"
#include "server/HttpServer.hpp"
#include "server/Reassembler.hpp"
#include "server/UploadHandler.hpp"
#include "test_support.hpp"

using namespace chunkwire;
using test::FakeTransport;

class SenderTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        config.serverUrl = "http://files.test:8080/";
        config.chunkSize = 8192;
        config.maxRetries = 3;
        config.retryDelay = std::chrono::milliseconds(0);
        config.maxRetryDelay = std::chrono::milliseconds(0);
    }

    // Index of the chunk carried by an upload URL, or -1
    static int chunkIndexOf(const std::string& url)
    {
        auto query = url::splitTarget(url.substr(url.find("/upload"))).second;
        for (const auto& kv : url::parseQuery(query)) {
            if (kv.first == "chunk" || kv.first == "c") return std::stoi(kv.second);
        }
        return -1;
    }

    TransferResult run(Transport& transport, const std::string& path)
    {
        Sender sender(config, transport);
        sender.setProgressCallback(nullptr);
        return sender.upload(path);
    }

    ClientConfig config;
    test::TempDir dir;
};

TEST_F(SenderTest, UploadsThreeChunksInOrder)
{
    test::MemoryStore store;
    Reassembler reassembler(store);
    UploadHandler handler(reassembler, store);
    HttpServer server;
    handler.registerEndpoints(server);
    test::InProcessTransport transport(server);

    auto bytes = test::randomBytes(20000);
    TransferResult result = run(transport, dir.writeFile("photo.raw", bytes));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunksSent, 3u);
    EXPECT_EQ(result.chunksTotal, 3u);
    EXPECT_EQ(result.errorKind, ErrorKind::None);
    EXPECT_EQ(transport.calls(), 3u);
    EXPECT_EQ(store.completed("photo.raw"), bytes);
}

TEST_F(SenderTest, ChunkThatAlwaysFailsAbortsUpload)
{
    FakeTransport transport([](const std::string& url, size_t) {
        return chunkIndexOf(url) == 2 ? FakeTransport::reply(500, "boom") : FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("five.bin", test::randomBytes(8192 * 5)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.chunksSent, 2u);
    EXPECT_EQ(result.chunksTotal, 5u);
    EXPECT_EQ(result.errorKind, ErrorKind::Transient);
    EXPECT_EQ(transport.calls(), 2u + config.maxRetries);
    for (size_t i = 2; i < transport.calls(); ++i) {
        EXPECT_EQ(chunkIndexOf(transport.urls[i]), 2);
    }
}

TEST_F(SenderTest, RetryBudgetIsExact)
{
    for (unsigned retries : {1u, 2u, 5u}) {
        config.maxRetries = retries;
        FakeTransport transport([](const std::string&, size_t) { return FakeTransport::unreachable(true); });

        TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(100)));

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.chunksSent, 0u);
        EXPECT_EQ(transport.calls(), retries);
    }
}

TEST_F(SenderTest, TransientFailureThenSuccess)
{
    FakeTransport transport([](const std::string&, size_t call) {
        return call == 0 ? FakeTransport::unreachable() : FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(10000)));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunksSent, 2u);
    EXPECT_EQ(transport.calls(), 3u);
    EXPECT_EQ(chunkIndexOf(transport.urls[0]), 0);
    EXPECT_EQ(chunkIndexOf(transport.urls[1]), 0);
    EXPECT_EQ(chunkIndexOf(transport.urls[2]), 1);
}

TEST_F(SenderTest, TransportExceptionIsRetried)
{
    FakeTransport transport([](const std::string&, size_t call) -> TransportResponse {
        if (call < 2) throw std::runtime_error("socket exploded");
        return FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(10)));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(transport.calls(), 3u);
}

TEST_F(SenderTest, PermanentErrorIsNotRetried)
{
    FakeTransport transport([](const std::string&, size_t) {
        return FakeTransport::reply(400, R"({"status":"error","error":"malformed","message":"bad"})");
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(10)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Permanent);
    EXPECT_EQ(transport.calls(), 1u);
}

TEST_F(SenderTest, OrderingViolationIsNotRetried)
{
    FakeTransport transport([](const std::string& url, size_t) {
        if (chunkIndexOf(url) == 1) {
            return FakeTransport::reply(409, R"({"status":"error","error":"ordering_violation","expected":0})");
        }
        return FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(20000)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::OrderingViolation);
    EXPECT_EQ(result.chunksSent, 1u);
    EXPECT_EQ(transport.calls(), 2u);
}

TEST_F(SenderTest, ServerAlreadyPastChunkCountsAsAck)
{
    FakeTransport transport([](const std::string& url, size_t) {
        if (chunkIndexOf(url) == 1) {
            return FakeTransport::reply(409, R"({"status":"error","error":"ordering_violation","expected":2})");
        }
        return FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(20000)));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunksSent, 3u);
}

TEST_F(SenderTest, ServerFurtherAheadAbortsUpload)
{
    FakeTransport transport([](const std::string& url, size_t) {
        if (chunkIndexOf(url) == 1) {
            return FakeTransport::reply(409, R"({"status":"error","error":"ordering_violation","expected":3})");
        }
        return FakeTransport::reply(200);
    });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(40000)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::OrderingViolation);
    EXPECT_EQ(result.chunksSent, 1u);
    EXPECT_EQ(transport.calls(), 2u);
}

TEST_F(SenderTest, NonJsonSuccessIsTolerated)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200, "OK, thanks"); });

    TransferResult result = run(transport, dir.writeFile("a.bin", test::randomBytes(10)));

    EXPECT_TRUE(result.success);
}

TEST_F(SenderTest, MissingFileFailsBeforeNetwork)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200); });

    TransferResult result = run(transport, (dir.path() / "ghost.bin").string());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::LocalIO);
    EXPECT_EQ(result.chunksSent, 0u);
    EXPECT_EQ(transport.calls(), 0u);
}

TEST_F(SenderTest, CancelBetweenChunksKeepsCount)
{
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200); });
    CancelToken cancel;
    Sender sender(config, transport);
    sender.setCancelToken(&cancel);
    sender.setProgressCallback([&cancel](const ChunkProgress& progress) {
        if (progress.chunksSent == 2) cancel.cancel();
    });

    TransferResult result = sender.upload(dir.writeFile("a.bin", test::randomBytes(8192 * 4)));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::Cancelled);
    EXPECT_EQ(result.chunksSent, 2u);
    EXPECT_EQ(result.chunksTotal, 4u);
    EXPECT_EQ(transport.calls(), 2u);
}

TEST_F(SenderTest, CancelDuringRetryDelay)
{
    config.retryDelay = std::chrono::milliseconds(10000);
    config.maxRetryDelay = std::chrono::milliseconds(10000);
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(503); });
    CancelToken cancel;
    Sender sender(config, transport);
    sender.setCancelToken(&cancel);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    TransferResult result = sender.upload(dir.writeFile("a.bin", test::randomBytes(10)));
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(result.errorKind, ErrorKind::Cancelled);
    EXPECT_EQ(transport.calls(), 1u);
    EXPECT_LT(waited, std::chrono::seconds(5));
}

TEST_F(SenderTest, LostAckIsRecoveredWithoutDuplicatingBytes)
{
    test::MemoryStore store;
    Reassembler reassembler(store);
    UploadHandler handler(reassembler, store);
    HttpServer server;
    handler.registerEndpoints(server);
    test::InProcessTransport transport(server);
    // The server stores chunk 1 but its answer never arrives
    transport.setFilter([](const std::string&, size_t call, TransportResponse& replaced) {
        if (call != 1) return false;
        replaced = FakeTransport::unreachable(true);
        return true;
    });

    auto bytes = test::randomBytes(20000);
    TransferResult result = run(transport, dir.writeFile("lossy.bin", bytes));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(transport.calls(), 4u);
    EXPECT_EQ(store.completed("lossy.bin"), bytes);
}

TEST_F(SenderTest, LowBandwidthProfileOnTheWire)
{
    config = ClientConfig::forProfile("low-bandwidth");
    config.retryDelay = std::chrono::milliseconds(0);
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200); });

    TransferResult result = run(transport, dir.writeFile("tiny.txt", test::randomBytes(1000)));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.chunksTotal, 2u);
    EXPECT_TRUE(transport.lastOptions.closeConnection);
    EXPECT_EQ(transport.lastOptions.timeout, std::chrono::seconds(15));
    const std::string& last = transport.urls.back();
    EXPECT_EQ(last.rfind("http://127.0.0.1:8080/upload?f=tiny.txt&d=", 0), 0u);
    EXPECT_NE(last.find("&c=1&t=2&end=1"), std::string::npos);
}

TEST_F(SenderTest, BackoffGrowsAndIsCapped)
{
    config.retryDelay = std::chrono::milliseconds(100);
    config.backoffMultiplier = 2.0;
    config.maxRetryDelay = std::chrono::milliseconds(500);
    FakeTransport transport([](const std::string&, size_t) { return FakeTransport::reply(200); });
    Sender sender(config, transport);

    EXPECT_EQ(sender.retryDelayFor(1).count(), 100);
    EXPECT_EQ(sender.retryDelayFor(2).count(), 200);
    EXPECT_EQ(sender.retryDelayFor(3).count(), 400);
    EXPECT_EQ(sender.retryDelayFor(4).count(), 500);
}

TEST(SenderClassifyTest, StatusCodesMapToErrorKinds)
{
    EXPECT_EQ(Sender::classify(FakeTransport::reply(200)).kind, ErrorKind::None);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(204, "")).kind, ErrorKind::None);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(500)).kind, ErrorKind::Transient);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(503)).kind, ErrorKind::Transient);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(429)).kind, ErrorKind::Transient);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(404)).kind, ErrorKind::Permanent);
    EXPECT_EQ(Sender::classify(FakeTransport::reply(409, "conflict")).kind, ErrorKind::Permanent);
    EXPECT_EQ(Sender::classify(FakeTransport::unreachable()).kind, ErrorKind::Transient);

    SendOutcome ordering = Sender::classify(FakeTransport::reply(
        409, R"({"status":"error","error":"ordering_violation","expected":4,"message":"Expected chunk 4"})"));
    EXPECT_EQ(ordering.kind, ErrorKind::OrderingViolation);
    EXPECT_EQ(ordering.expected, 4u);
    EXPECT_EQ(ordering.message, "Expected chunk 4");

    SendOutcome ok = Sender::classify(FakeTransport::reply(200, R"({"message":"Chunk 1/3 received"})"));
    EXPECT_EQ(ok.message, "Chunk 1/3 received");
}
