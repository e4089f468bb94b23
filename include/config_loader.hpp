#pragma once

#include "routing_policy.hpp"
#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace router {

inline constexpr int kDefaultMaxConnections = 64;

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    // Size of the HTTP server's thread pool; one thread per in-flight connection
    int max_connections = kDefaultMaxConnections;
    std::string log_file = "logs/router.log";
    std::string log_level = "INFO";
};

struct PoolConfig {
    std::vector<std::string> workers;
    RoutingStrategy routing_strategy = RoutingStrategy::RoundRobin;
    int health_check_interval_seconds = 30;
    int request_timeout_seconds = 300;
};

struct Config {
    ServerConfig server;
    PoolConfig pool;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
    static std::expected<RoutingStrategy, std::string> parse_strategy(const std::string& name);
};

} // namespace router
