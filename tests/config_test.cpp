#include <gtest/gtest.h>
#include <fstream>
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "test_support.hpp"

using namespace chunkwire;

TEST(ConfigTest, NormalProfileDefaults)
{
    ClientConfig config = ClientConfig::forProfile("normal");
    EXPECT_EQ(config.chunkSize, 8192u);
    EXPECT_EQ(config.wireProfile, "standard");
    EXPECT_FALSE(config.closeConnection);
    EXPECT_EQ(config.requestTimeout, std::chrono::seconds(30));
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, LowBandwidthProfile)
{
    ClientConfig config = ClientConfig::forProfile("low-bandwidth");
    EXPECT_EQ(config.chunkSize, 512u);
    EXPECT_EQ(config.wireProfile, "compact");
    EXPECT_TRUE(config.closeConnection);
    EXPECT_GT(config.maxRetries, 3u);
    EXPECT_THROW(ClientConfig::forProfile("satellite"), ConfigError);
}

TEST(ConfigTest, JsonOverridesProfile)
{
    nlohmann::json j = {
        {"profile", "low-bandwidth"},
        {"server_url", "http://10.0.0.2:9000"},
        {"max_retries", 7},
        {"retry_delay_ms", 0}
    };
    ClientConfig config = ClientConfig::fromJson(j);
    EXPECT_EQ(config.serverUrl, "http://10.0.0.2:9000");
    EXPECT_EQ(config.maxRetries, 7u);
    EXPECT_EQ(config.retryDelay.count(), 0);
    EXPECT_EQ(config.chunkSize, 512u);
}

TEST(ConfigTest, BadValuesAreConfigErrors)
{
    EXPECT_THROW(ClientConfig::fromJson({{"chunk_size", "big"}}), ConfigError);
    EXPECT_THROW(ClientConfig::fromJson({{"chunk_size", 0}}), ConfigError);
    EXPECT_THROW(ClientConfig::fromJson({{"max_retries", 0}}), ConfigError);
    EXPECT_THROW(ClientConfig::fromJson({{"wire_profile", "xml"}}), ConfigError);
    EXPECT_THROW(ClientConfig::fromJson(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson({{"threads", 0}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson({{"wire_profile", "xml"}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson({{"read_timeout_s", 0}}), ConfigError);
}

TEST(ConfigTest, NumericOptionsRejectSignsAndJunk)
{
    EXPECT_EQ(parseUnsigned("5", "--retries"), 5u);
    EXPECT_EQ(parseUnsigned("0", "--retries"), 0u);
    EXPECT_THROW(parseUnsigned("-1", "--retries"), ConfigError);
    EXPECT_THROW(parseUnsigned("+3", "--retries"), ConfigError);
    EXPECT_THROW(parseUnsigned(" 7", "--chunk-size"), ConfigError);
    EXPECT_THROW(parseUnsigned("12kb", "--chunk-size"), ConfigError);
    EXPECT_THROW(parseUnsigned("", "--chunk-size"), ConfigError);
    EXPECT_THROW(parseUnsigned("99999999999999999999999", "--chunk-size"), ConfigError);
}

TEST(ConfigTest, ServerConfigFromFile)
{
    test::TempDir dir;
    auto path = dir.path() / "server.json";
    std::ofstream(path) << R"({"port": 9090, "storage_dir": "/tmp/up", "wire_profile": "compact"})";

    ServerConfig config = ServerConfig::fromJsonFile(path.string());
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.storageDir, "/tmp/up");
    EXPECT_EQ(config.wireProfile, "compact");
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.readTimeout, std::chrono::seconds(30));

    EXPECT_THROW(ServerConfig::fromJsonFile((dir.path() / "missing.json").string()), ConfigError);
    std::ofstream(dir.path() / "broken.json") << "{ port: ";
    EXPECT_THROW(ServerConfig::fromJsonFile((dir.path() / "broken.json").string()), ConfigError);
}
