#pragma once

#include "dispatcher.hpp"
#include "worker_pool.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace router {

// HTTP front end: GET /, GET /health, POST /run_code
class HttpService {
public:
    static constexpr const char* kServiceName = "Sandbox Router";
    static constexpr const char* kVersion = "1.0.0";
    static constexpr std::chrono::seconds kClientIoTimeout{5};

    HttpService(WorkerPool& pool, Dispatcher& dispatcher,
                size_t max_connections = kDefaultMaxConnections);

    HttpService(const HttpService&) = delete;
    HttpService& operator=(const HttpService&) = delete;

    // Blocking; returns false if the socket could not be bound
    bool listen(const std::string& host, int port);

    // Bind to an ephemeral port, then serve with listen_after_bind()
    int bind_to_any_port(const std::string& host);
    bool listen_after_bind();

    void stop();
    bool is_running() const;
    size_t max_connections() const { return max_connections_; }

    nlohmann::json status_json() const;
    nlohmann::json health_json() const;

private:
    void register_routes();
    void handle_run_code(const httplib::Request& req, httplib::Response& res);

    WorkerPool& pool_;
    Dispatcher& dispatcher_;
    size_t max_connections_;
    httplib::Server server_;
};

} // namespace router
