#include "routing_policy.hpp"
#include <random>

namespace router {

std::expected<WorkerRecord*, std::string> RoundRobinPolicy::select(
    const std::vector<WorkerRecord*>& workers) {
    if (workers.empty()) {
        return std::unexpected("No workers configured");
    }

    std::lock_guard lock(mutex_);
    cursor_ %= workers.size();

    // At most one full cycle
    for (size_t i = 0; i < workers.size(); ++i) {
        WorkerRecord* worker = workers[cursor_];
        cursor_ = (cursor_ + 1) % workers.size();
        if (worker->is_healthy()) {
            return worker;
        }
    }

    return std::unexpected("No healthy workers available");
}

size_t RoundRobinPolicy::cursor() const {
    std::lock_guard lock(mutex_);
    return cursor_;
}

std::expected<WorkerRecord*, std::string> RandomPolicy::select(
    const std::vector<WorkerRecord*>& workers) {
    std::vector<WorkerRecord*> healthy;
    healthy.reserve(workers.size());
    for (auto* worker : workers) {
        if (worker->is_healthy()) {
            healthy.push_back(worker);
        }
    }

    if (healthy.empty()) {
        return std::unexpected("No healthy workers available");
    }

    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, healthy.size() - 1);
    return healthy[dist(rng)];
}

std::string to_string(RoutingStrategy strategy) {
    switch (strategy) {
        case RoutingStrategy::RoundRobin: return "round_robin";
        case RoutingStrategy::Random: return "random";
        default: return "unknown";
    }
}

} // namespace router
