#include "dispatcher.hpp"
#include "logger.hpp"
#include "response_injector.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

using json = nlohmann::json;

namespace router {

Dispatcher::Dispatcher(WorkerPool& pool) : pool_(pool) {}

size_t Dispatcher::max_attempts() const {
    return std::min(kMaxAttempts, pool_.size());
}

std::expected<json, DispatchError> Dispatcher::dispatch(const std::string& request_body) {
    const int max_retries = static_cast<int>(max_attempts());

    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        auto selected = pool_.select_worker();

        // No worker now means no later attempt could differ
        if (!selected.has_value()) {
            Logger::error(Logger::Component::Dispatch, selected.error());
            return std::unexpected(DispatchError{
                DispatchError::Kind::NoWorkerAvailable, attempt - 1, "No healthy workers available"});
        }

        WorkerRecord* worker = selected.value();
        Logger::info(Logger::Component::Dispatch,
            fmt::format("Attempt {}/{}: selected worker {}", attempt, max_retries, worker->address()));

        auto result = forward(*worker, request_body, attempt);
        if (result.has_value()) {
            return std::move(result.value());
        }

        Logger::warn(Logger::Component::Dispatch,
            fmt::format("Worker {} failed on attempt {}: {}", worker->address(), attempt, result.error()));
        worker->force_unhealthy(result.error());
    }

    Logger::error(Logger::Component::Dispatch,
        fmt::format("All workers failed after {} attempts", max_retries));
    return std::unexpected(DispatchError{
        DispatchError::Kind::AttemptsExhausted, max_retries,
        fmt::format("All workers failed after {} attempts", max_retries)});
}

std::expected<json, std::string> Dispatcher::forward(const WorkerRecord& worker,
                                                     const std::string& request_body,
                                                     int attempt) {
    auto timeout = pool_.request_timeout();
    auto start = std::chrono::steady_clock::now();

    try {
        auto [origin, base_path] = split_base_url(worker.address());

        httplib::Client client(origin);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        // Per-phase timeouts above reset on every recv; this bounds the whole exchange
        client.set_max_timeout(timeout);

        auto res = client.Post(base_path + kRunPath, request_body, "application/json");

        if (!res) {
            auto err = res.error();
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (err == httplib::Error::ConnectionTimeout ||
                ((err == httplib::Error::Connection || err == httplib::Error::Read) &&
                 elapsed >= timeout)) {
                return std::unexpected(fmt::format("Request timeout ({}s)", timeout.count()));
            }
            return std::unexpected(fmt::format("Request failed: {}", httplib::to_string(err)));
        }

        if (res->status != 200) {
            Logger::debug(Logger::Component::Dispatch,
                fmt::format("Worker {} returned {}: {}", worker.address(), res->status, res->body));
            return std::unexpected(fmt::format("HTTP {}", res->status));
        }

        auto annotated = ResponseInjector::inject(res->body, worker.address(), attempt);
        if (!annotated.has_value()) {
            return std::unexpected(annotated.error());
        }

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        Logger::info(Logger::Component::Response,
            fmt::format("200 from worker {} ({}ms, attempt {})", worker.address(), duration_ms, attempt));

        return annotated;

    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Error: {}", e.what()));
    }
}

} // namespace router
