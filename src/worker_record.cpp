#include "worker_record.hpp"

namespace router {

WorkerRecord::WorkerRecord(std::string address)
    : address_(normalize_address(address)), healthy_(true), last_checked_at_{} {}

bool WorkerRecord::is_healthy() const {
    std::lock_guard lock(mutex_);
    return healthy_;
}

std::chrono::system_clock::time_point WorkerRecord::last_checked_at() const {
    std::lock_guard lock(mutex_);
    return last_checked_at_;
}

std::string WorkerRecord::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

WorkerSnapshot WorkerRecord::snapshot() const {
    std::lock_guard lock(mutex_);
    return WorkerSnapshot{address_, healthy_, last_checked_at_, last_error_};
}

void WorkerRecord::record_health_result(bool ok, const std::string& detail) {
    std::lock_guard lock(mutex_);
    healthy_ = ok;
    last_error_ = ok ? std::string() : detail;
    last_checked_at_ = std::chrono::system_clock::now();
}

void WorkerRecord::force_unhealthy(const std::string& reason) {
    std::lock_guard lock(mutex_);
    healthy_ = false;
    last_error_ = reason;
}

std::string normalize_address(const std::string& address) {
    std::string result = address;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::pair<std::string, std::string> split_base_url(const std::string& address) {
    std::string normalized = normalize_address(address);

    size_t host_start = 0;
    size_t scheme_end = normalized.find("://");
    if (scheme_end != std::string::npos) {
        host_start = scheme_end + 3;
    }

    size_t path_start = normalized.find('/', host_start);
    if (path_start == std::string::npos) {
        return {normalized, ""};
    }
    return {normalized.substr(0, path_start), normalized.substr(path_start)};
}

} // namespace router
