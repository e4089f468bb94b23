#include "http_service.hpp"
#include "logger.hpp"
#include "response_injector.hpp"
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace router {

namespace {

json error_body(const std::string& detail) {
    return json{{"detail", detail}};
}

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace

HttpService::HttpService(WorkerPool& pool, Dispatcher& dispatcher, size_t max_connections)
    : pool_(pool), dispatcher_(dispatcher), max_connections_(max_connections) {
    // Each /run_code holds its connection thread for the whole forward, so the
    // pool must be wide enough that /health and / still get a thread
    server_.new_task_queue = [n = max_connections_] { return new httplib::ThreadPool(n); };

    // Inbound client I/O only; forwards carry their own timeout
    server_.set_read_timeout(kClientIoTimeout);
    server_.set_write_timeout(kClientIoTimeout);
    register_routes();
}

bool HttpService::listen(const std::string& host, int port) {
    return server_.listen(host, port);
}

int HttpService::bind_to_any_port(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool HttpService::listen_after_bind() {
    return server_.listen_after_bind();
}

void HttpService::stop() {
    server_.stop();
}

bool HttpService::is_running() const {
    return server_.is_running();
}

json HttpService::status_json() const {
    json workers = json::array();
    for (const auto& w : pool_.snapshot()) {
        workers.push_back({
            {"url", w.address},
            {"healthy", w.healthy},
            {"last_check", to_epoch_seconds(w.last_checked_at)},
            {"last_error", w.last_error}
        });
    }

    return json{
        {"service", kServiceName},
        {"version", kVersion},
        {"routing_strategy", to_string(pool_.strategy())},
        {"workers", workers}
    };
}

json HttpService::health_json() const {
    size_t healthy = pool_.healthy_count();
    return json{
        {"status", healthy > 0 ? "healthy" : "unhealthy"},
        {"total_workers", pool_.size()},
        {"healthy_workers", healthy}
    };
}

void HttpService::register_routes() {
    server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(status_json().dump(), "application/json");
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(health_json().dump(), "application/json");
    });

    server_.Post("/run_code", [this](const httplib::Request& req, httplib::Response& res) {
        handle_run_code(req, res);
    });
}

void HttpService::handle_run_code(const httplib::Request& req, httplib::Response& res) {
    auto start_time = std::chrono::steady_clock::now();

    Logger::info(Logger::Component::Request,
        fmt::format("Client {} → {} {} ({} bytes)", req.remote_addr, req.method, req.path, req.body.size()));

    // Validated only; the raw body is forwarded unchanged
    json parsed = json::parse(req.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        Logger::warn(Logger::Component::Request,
            fmt::format("Rejected request from {}: body is not a JSON object", req.remote_addr));
        res.status = 400;
        res.set_content(error_body("Request body must be a JSON object").dump(), "application/json");
        return;
    }

    auto result = dispatcher_.dispatch(req.body);

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (!result.has_value()) {
        const auto& err = result.error();
        Logger::error(Logger::Component::Response,
            fmt::format("503 → Client {} ({}ms): {}", req.remote_addr, duration_ms, err.message));
        res.status = 503;
        res.set_content(error_body(err.message).dump(), "application/json");
        return;
    }

    const auto& body = result.value();
    Logger::info(Logger::Component::Response,
        fmt::format("200 → Client {} ({}ms) via worker {}", req.remote_addr, duration_ms,
            body[ResponseInjector::kMetadataKey].value("worker_url", "")));

    res.status = 200;
    res.set_content(body.dump(), "application/json");
}

} // namespace router
