#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace router {

class ResponseInjector {
public:
    static constexpr const char* kMetadataKey = "router_metadata";

    // Decode a worker's JSON result and attach router_metadata
    // {worker_url, attempt}. Fails if the body is not a JSON object.
    static std::expected<nlohmann::json, std::string> inject(const std::string& body,
                                                             const std::string& worker_url,
                                                             int attempt);
};

} // namespace router
