#include "config_loader.hpp"
#include "worker_record.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>


using json = nlohmann::json;

namespace router {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    return parse_config(content);
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        if (!j.is_object()) {
            return std::unexpected("Config root must be an object");
        }

        Config config;

        // Optional router section
        if (j.contains("router")) {
            auto& r = j["router"];
            config.server.host = r.value("host", config.server.host);
            config.server.port = r.value("port", config.server.port);
            config.server.max_connections = r.value("max_connections", config.server.max_connections);
            config.server.log_file = r.value("log_file", config.server.log_file);
            config.server.log_level = r.value("log_level", config.server.log_level);
        }

        // Workers: either {"url": "..."} objects or plain strings
        if (!j.contains("workers") || !j["workers"].is_array()) {
            return std::unexpected("Missing 'workers' list");
        }
        for (const auto& worker : j["workers"]) {
            if (worker.is_string()) {
                config.pool.workers.push_back(normalize_address(worker.get<std::string>()));
            } else if (worker.is_object() && worker.contains("url")) {
                config.pool.workers.push_back(normalize_address(worker["url"].get<std::string>()));
            } else {
                return std::unexpected("Worker entry must be a URL string or an object with 'url'");
            }
        }

        config.pool.health_check_interval_seconds =
            j.value("health_check_interval", config.pool.health_check_interval_seconds);
        config.pool.request_timeout_seconds = j.value("timeout", config.pool.request_timeout_seconds);

        auto strategy = parse_strategy(j.value("routing_strategy", std::string("round_robin")));
        if (!strategy) {
            return std::unexpected(strategy.error());
        }
        config.pool.routing_strategy = strategy.value();

        if (auto valid = validate_config(config); !valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.pool.workers.empty()) {
        return std::unexpected("no workers configured");
    }

    for (const auto& address : config.pool.workers) {
        // Plain HTTP only; the client is built without TLS support
        if (address.rfind("http://", 0) != 0 || address.size() <= 7) {
            return std::unexpected("invalid worker address '" + address + "'");
        }
    }

    if (config.pool.health_check_interval_seconds <= 0) {
        return std::unexpected("health_check_interval must be positive");
    }

    if (config.pool.request_timeout_seconds <= 0) {
        return std::unexpected("timeout must be positive");
    }

    if (config.server.port < 1 || config.server.port > 65535) {
        return std::unexpected("router port must be in 1..65535");
    }

    if (config.server.max_connections <= 0) {
        return std::unexpected("max_connections must be positive");
    }

    return {};
}

std::expected<RoutingStrategy, std::string> ConfigLoader::parse_strategy(const std::string& name) {
    if (name == "round_robin") return RoutingStrategy::RoundRobin;
    if (name == "random") return RoutingStrategy::Random;
    return std::unexpected("Unknown routing_strategy '" + name + "' (expected round_robin or random)");
}

} // namespace router
