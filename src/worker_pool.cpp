#include "worker_pool.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace router {

WorkerPool::WorkerPool(const PoolConfig& config, HealthProbe probe)
    : config_(config), probe_(probe) {
    workers_.reserve(config_.workers.size());
    for (const auto& address : config_.workers) {
        workers_.push_back(std::make_unique<WorkerRecord>(address));
    }
}

WorkerPool::~WorkerPool() {
    stop_health_checks();
}

std::expected<WorkerRecord*, std::string> WorkerPool::select_worker() {
    if (healthy_workers().empty()) {
        // Not debounced: concurrent callers during an outage each re-probe
        Logger::warn(Logger::Component::Router,
            "No healthy workers, forcing re-probe of all workers");
        probe_all();

        if (healthy_workers().empty()) {
            return std::unexpected("No healthy workers available");
        }
    }

    auto all = workers();
    if (config_.routing_strategy == RoutingStrategy::Random) {
        return random_.select(all);
    }
    return round_robin_.select(all);
}

void WorkerPool::probe_all() {
    for (auto& worker : workers_) {
        check_worker(*worker);
    }
}

size_t WorkerPool::refresh_stale_workers(std::stop_token stop_token) {
    size_t probed = 0;
    for (auto& worker : workers_) {
        if (stop_token.stop_requested()) {
            break;
        }
        auto now = std::chrono::system_clock::now();
        if (now - worker->last_checked_at() > health_check_interval()) {
            check_worker(*worker);
            ++probed;
        }
    }
    return probed;
}

void WorkerPool::start_health_checks() {
    if (refresh_thread_.joinable()) {
        return;
    }
    refresh_thread_ = std::jthread([this](std::stop_token stop_token) {
        refresh_loop(stop_token);
    });
}

void WorkerPool::stop_health_checks() {
    if (refresh_thread_.joinable()) {
        refresh_thread_.request_stop();
        refresh_thread_.join();
    }
}

std::vector<WorkerRecord*> WorkerPool::workers() const {
    std::vector<WorkerRecord*> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker.get());
    }
    return result;
}

std::vector<WorkerSnapshot> WorkerPool::snapshot() const {
    std::vector<WorkerSnapshot> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->snapshot());
    }
    return result;
}

size_t WorkerPool::healthy_count() const {
    return healthy_workers().size();
}

std::chrono::seconds WorkerPool::health_check_interval() const {
    return std::chrono::seconds(config_.health_check_interval_seconds);
}

std::chrono::seconds WorkerPool::request_timeout() const {
    return std::chrono::seconds(config_.request_timeout_seconds);
}

void WorkerPool::check_worker(WorkerRecord& worker) {
    bool was_healthy = worker.is_healthy();

    // No pool lock is held across the network call
    auto start = std::chrono::steady_clock::now();
    ProbeResult result = probe_.probe(worker);
    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    worker.record_health_result(result.ok, result.detail);

    if (result.ok) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Worker {}: HEALTHY ({}ms)", worker.address(), duration_ms));
    } else {
        Logger::error(Logger::Component::HealthCheck,
            fmt::format("Worker {}: UNHEALTHY ({}) ({}ms)", worker.address(), result.detail, duration_ms));
    }

    if (was_healthy && !result.ok) {
        Logger::warn(Logger::Component::HealthCheck,
            fmt::format("Worker {}: state changed HEALTHY → UNHEALTHY", worker.address()));
    } else if (!was_healthy && result.ok) {
        Logger::info(Logger::Component::HealthCheck,
            fmt::format("Worker {}: state changed UNHEALTHY → HEALTHY", worker.address()));
    }
}

void WorkerPool::refresh_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::HealthCheck, "Health check thread started");

    while (!stop_token.stop_requested()) {
        Logger::debug(Logger::Component::HealthCheck, "Starting health check cycle");

        size_t probed = refresh_stale_workers(stop_token);
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Health check cycle done, {} workers probed", probed));

        // Interruptible sleep; wakes immediately on stop
        std::unique_lock lock(refresh_mutex_);
        refresh_cv_.wait_for(lock, stop_token, kRefreshTick, [] { return false; });
    }

    Logger::info(Logger::Component::HealthCheck, "Health check thread stopped");
}

std::vector<WorkerRecord*> WorkerPool::healthy_workers() const {
    std::vector<WorkerRecord*> result;
    for (const auto& worker : workers_) {
        if (worker->is_healthy()) {
            result.push_back(worker.get());
        }
    }
    return result;
}

} // namespace router
