#include "response_injector.hpp"
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace router {

std::expected<json, std::string> ResponseInjector::inject(const std::string& body,
                                                          const std::string& worker_url,
                                                          int attempt) {
    try {
        json j = json::parse(body);

        if (!j.is_object()) {
            return std::unexpected(fmt::format("Expected JSON object, got {}", j.type_name()));
        }

        j[kMetadataKey] = {
            {"worker_url", worker_url},
            {"attempt", attempt}
        };

        return j;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid JSON response: ") + e.what());
    }
}

} // namespace router
