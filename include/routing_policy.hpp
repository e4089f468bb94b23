#pragma once

#include "worker_record.hpp"
#include <concepts>
#include <expected>
#include <mutex>
#include <string>
#include <vector>

namespace router {

enum class RoutingStrategy {
    RoundRobin,
    Random
};

// Policies see the full ordered worker sequence and return a healthy member
template<typename T>
concept RoutingPolicy = requires(T policy, const std::vector<WorkerRecord*>& workers) {
    { policy.select(workers) } -> std::same_as<std::expected<WorkerRecord*, std::string>>;
};

// Round-robin over the full sequence, skipping unhealthy workers.
// The cursor advances once per visited worker, healthy or not, so every
// healthy worker gets an equal share regardless of where the unhealthy
// ones sit. Cursor updates are serialized by mutex_.
class RoundRobinPolicy {
public:
    RoundRobinPolicy() : cursor_(0) {}

    std::expected<WorkerRecord*, std::string> select(const std::vector<WorkerRecord*>& workers);

    size_t cursor() const;

private:
    mutable std::mutex mutex_;
    size_t cursor_;
};

// Uniform choice among the currently healthy workers; no shared cursor
class RandomPolicy {
public:
    std::expected<WorkerRecord*, std::string> select(const std::vector<WorkerRecord*>& workers);
};

static_assert(RoutingPolicy<RoundRobinPolicy>);
static_assert(RoutingPolicy<RandomPolicy>);

std::string to_string(RoutingStrategy strategy);

} // namespace router
