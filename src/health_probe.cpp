#include "health_probe.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>

namespace router {

HealthProbe::HealthProbe(std::chrono::milliseconds timeout) : timeout_(timeout) {}

ProbeResult HealthProbe::probe(const WorkerRecord& worker) const {
    auto start = std::chrono::steady_clock::now();

    try {
        auto [origin, base_path] = split_base_url(worker.address());

        httplib::Client client(origin);
        client.set_connection_timeout(timeout_);
        client.set_read_timeout(timeout_);
        client.set_write_timeout(timeout_);
        // Per-phase timeouts above reset on every recv; this bounds the whole exchange
        client.set_max_timeout(timeout_);

        auto res = client.Get(base_path + kPingPath);

        if (!res) {
            auto err = res.error();
            auto elapsed = std::chrono::steady_clock::now() - start;

            // Read and total-deadline timeouts surface as generic transport errors
            if (err == httplib::Error::ConnectionTimeout ||
                ((err == httplib::Error::Connection || err == httplib::Error::Read) &&
                 elapsed >= timeout_)) {
                return {false, fmt::format("Connection timeout ({}ms)", timeout_.count())};
            }
            if (err == httplib::Error::Connection) {
                return {false, fmt::format("Connection failed: {}", httplib::to_string(err))};
            }
            return {false, fmt::format("Error: {}", httplib::to_string(err))};
        }

        if (res->status != 200) {
            return {false, fmt::format("HTTP {}", res->status)};
        }

        std::string body = trim(res->body);
        if (body != kExpectedBody) {
            return {false, fmt::format("Unexpected response: '{}'", body)};
        }

        return {true, ""};

    } catch (const std::exception& e) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Worker {} probe exception: {}", worker.address(), e.what()));
        return {false, fmt::format("Error: {}", e.what())};
    }
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace router
