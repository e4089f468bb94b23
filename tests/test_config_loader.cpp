#include <gtest/gtest.h>
#include "config_loader.hpp"
#include <cstdio>
#include <fstream>

using namespace router;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_path = "test_router_config.json";
    }

    void TearDown() override {
        std::remove(test_config_path.c_str());
    }

    void write_config(const std::string& content) {
        std::ofstream file(test_config_path);
        file << content;
        file.close();
    }

    std::string test_config_path;
};

TEST_F(ConfigLoaderTest, LoadValidConfig) {
    std::string valid_config = R"({
        "router": {
            "host": "127.0.0.1",
            "port": 9000,
            "log_file": "test.log",
            "log_level": "DEBUG"
        },
        "workers": [
            {"url": "http://localhost:8080"},
            "http://localhost:8081/"
        ],
        "health_check_interval": 10,
        "timeout": 60,
        "routing_strategy": "random"
    })";

    write_config(valid_config);

    auto result = ConfigLoader::load(test_config_path);
    ASSERT_TRUE(result.has_value()) << result.error();

    Config config = result.value();
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.server.log_file, "test.log");
    EXPECT_EQ(config.server.log_level, "DEBUG");
    ASSERT_EQ(config.pool.workers.size(), 2u);
    EXPECT_EQ(config.pool.workers[0], "http://localhost:8080");
    EXPECT_EQ(config.pool.workers[1], "http://localhost:8081");
    EXPECT_EQ(config.pool.health_check_interval_seconds, 10);
    EXPECT_EQ(config.pool.request_timeout_seconds, 60);
    EXPECT_EQ(config.pool.routing_strategy, RoutingStrategy::Random);
}

TEST_F(ConfigLoaderTest, Defaults) {
    auto result = ConfigLoader::parse_config(R"({"workers": [{"url": "http://w1:8080"}]})");
    ASSERT_TRUE(result.has_value()) << result.error();

    Config config = result.value();
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.server.max_connections, kDefaultMaxConnections);
    EXPECT_EQ(config.server.log_level, "INFO");
    EXPECT_EQ(config.pool.health_check_interval_seconds, 30);
    EXPECT_EQ(config.pool.request_timeout_seconds, 300);
    EXPECT_EQ(config.pool.routing_strategy, RoutingStrategy::RoundRobin);
}

TEST_F(ConfigLoaderTest, MissingFile) {
    auto result = ConfigLoader::load("nonexistent.json");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, InvalidJson) {
    write_config("{ invalid json }");
    auto result = ConfigLoader::load(test_config_path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("JSON parsing error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, MissingWorkers) {
    auto result = ConfigLoader::parse_config(R"({"timeout": 10})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, EmptyWorkers) {
    auto result = ConfigLoader::parse_config(R"({"workers": []})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, MalformedWorkerEntry) {
    auto result = ConfigLoader::parse_config(R"({"workers": [{"host": "w1"}]})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, NonHttpWorkerRejected) {
    auto result = ConfigLoader::parse_config(R"({"workers": ["https://w1:8443"]})");
    ASSERT_FALSE(result.has_value());
}

TEST_F(ConfigLoaderTest, UnknownStrategy) {
    auto result = ConfigLoader::parse_config(
        R"({"workers": ["http://w1:8080"], "routing_strategy": "least_connections"})");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("least_connections"), std::string::npos);
}

TEST_F(ConfigLoaderTest, NonPositiveIntervals) {
    EXPECT_FALSE(ConfigLoader::parse_config(
        R"({"workers": ["http://w1:8080"], "health_check_interval": 0})").has_value());
    EXPECT_FALSE(ConfigLoader::parse_config(
        R"({"workers": ["http://w1:8080"], "timeout": -5})").has_value());
}

TEST_F(ConfigLoaderTest, MaxConnections) {
    auto result = ConfigLoader::parse_config(
        R"({"router": {"max_connections": 128}, "workers": ["http://w1:8080"]})");
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result.value().server.max_connections, 128);

    EXPECT_FALSE(ConfigLoader::parse_config(
        R"({"router": {"max_connections": 0}, "workers": ["http://w1:8080"]})").has_value());
}

TEST_F(ConfigLoaderTest, PortOutOfRange) {
    auto too_large = ConfigLoader::parse_config(
        R"({"router": {"port": 70000}, "workers": ["http://w1:8080"]})");
    ASSERT_FALSE(too_large.has_value());
    EXPECT_NE(too_large.error().find("1..65535"), std::string::npos);

    EXPECT_FALSE(ConfigLoader::parse_config(
        R"({"router": {"port": 0}, "workers": ["http://w1:8080"]})").has_value());
    EXPECT_FALSE(ConfigLoader::parse_config(
        R"({"router": {"port": -1}, "workers": ["http://w1:8080"]})").has_value());
    EXPECT_TRUE(ConfigLoader::parse_config(
        R"({"router": {"port": 65535}, "workers": ["http://w1:8080"]})").has_value());
}
