#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace router {

// Copy of a worker's state for status reporting
struct WorkerSnapshot {
    std::string address;
    bool healthy;
    std::chrono::system_clock::time_point last_checked_at;
    std::string last_error;
};

class WorkerRecord {
public:
    explicit WorkerRecord(std::string address);

    // Non-copyable, non-movable (owns a mutex); the pool holds records by pointer
    WorkerRecord(const WorkerRecord&) = delete;
    WorkerRecord& operator=(const WorkerRecord&) = delete;

    const std::string& address() const { return address_; }

    bool is_healthy() const;
    std::chrono::system_clock::time_point last_checked_at() const;
    std::string last_error() const;
    WorkerSnapshot snapshot() const;

    // Apply a probe verdict and stamp the check time
    void record_health_result(bool ok, const std::string& detail);

    // Mark unhealthy after a forwarding failure; does not touch the check time
    void force_unhealthy(const std::string& reason);

private:
    const std::string address_;

    mutable std::mutex mutex_;
    bool healthy_;
    std::chrono::system_clock::time_point last_checked_at_;
    std::string last_error_;
};

// Strip trailing slashes so that paths can be appended directly
std::string normalize_address(const std::string& address);

// Split "http://host:port/prefix" into ("http://host:port", "/prefix")
std::pair<std::string, std::string> split_base_url(const std::string& address);

} // namespace router
