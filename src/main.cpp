#include "config_loader.hpp"
#include "dispatcher.hpp"
#include "http_service.hpp"
#include "logger.hpp"
#include "worker_pool.hpp"
#include <csignal>
#include <atomic>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <thread>

using namespace router;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config.json";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.server.log_file, config.server.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} workers, strategy {}, health check every {}s, timeout {}s",
            config.pool.workers.size(),
            to_string(config.pool.routing_strategy),
            config.pool.health_check_interval_seconds,
            config.pool.request_timeout_seconds));
    for (const auto& address : config.pool.workers) {
        Logger::info(Logger::Component::Config, fmt::format("  - {}", address));
    }

    WorkerPool pool(config.pool);

    Logger::info(Logger::Component::HealthCheck, "Performing initial health checks");
    pool.probe_all();
    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Initial health check complete: {}/{} workers healthy",
            pool.healthy_count(), pool.size()));

    pool.start_health_checks();

    Dispatcher dispatcher(pool);
    HttpService service(pool, dispatcher, static_cast<size_t>(config.server.max_connections));

    Logger::info(Logger::Component::Router,
        fmt::format("Started on {}:{} ({} connection threads)",
            config.server.host, config.server.port, config.server.max_connections));

    std::cout << fmt::format("Router started on port {}\n", config.server.port);
    std::cout << "Press Ctrl+C to stop\n";

    // Run server in a separate thread to allow graceful shutdown
    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!service.listen(config.server.host, config.server.port)) {
            Logger::error(Logger::Component::Router,
                fmt::format("Failed to listen on {}:{}", config.server.host, config.server.port));
            listen_failed.store(true);
        }
    });

    while (!shutdown_requested.load() && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Router, "Shutting down gracefully");

    service.stop();
    pool.stop_health_checks();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return listen_failed.load() ? 1 : 0;
}
