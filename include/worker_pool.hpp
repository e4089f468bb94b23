#pragma once

#include "config_loader.hpp"
#include "health_probe.hpp"
#include "routing_policy.hpp"
#include "worker_record.hpp"
#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace router {

class WorkerPool {
public:
    static constexpr std::chrono::seconds kRefreshTick{10};

    explicit WorkerPool(const PoolConfig& config, HealthProbe probe = HealthProbe());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Pick a worker per the configured strategy. If no worker is healthy,
    // every worker is re-probed synchronously before giving up.
    std::expected<WorkerRecord*, std::string> select_worker();

    // Probe every worker now, ignoring the check interval
    void probe_all();

    // One pass of the background loop: probe workers whose last check is
    // older than the interval. Returns how many workers were probed.
    size_t refresh_stale_workers(std::stop_token stop_token = {});

    // Background refresh loop
    void start_health_checks();
    void stop_health_checks();

    std::vector<WorkerRecord*> workers() const;
    std::vector<WorkerSnapshot> snapshot() const;
    size_t size() const { return workers_.size(); }
    size_t healthy_count() const;

    RoutingStrategy strategy() const { return config_.routing_strategy; }
    std::chrono::seconds health_check_interval() const;
    std::chrono::seconds request_timeout() const;

    // Round-robin cursor position, for diagnostics
    size_t cursor() const { return round_robin_.cursor(); }

private:
    void check_worker(WorkerRecord& worker);
    void refresh_loop(std::stop_token stop_token);
    std::vector<WorkerRecord*> healthy_workers() const;

    PoolConfig config_;
    HealthProbe probe_;
    std::vector<std::unique_ptr<WorkerRecord>> workers_;

    RoundRobinPolicy round_robin_;
    RandomPolicy random_;

    std::mutex refresh_mutex_;
    std::condition_variable_any refresh_cv_;
    std::jthread refresh_thread_;
};

} // namespace router
