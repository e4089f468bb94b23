#pragma once

#include "worker_record.hpp"
#include <chrono>
#include <string>

namespace router {

struct ProbeResult {
    bool ok;
    std::string detail;
};

class HealthProbe {
public:
    static constexpr const char* kPingPath = "/v1/ping";
    static constexpr const char* kExpectedBody = "pong";
    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

    explicit HealthProbe(std::chrono::milliseconds timeout = kDefaultTimeout);

    // Single liveness check; never throws, never mutates the worker
    ProbeResult probe(const WorkerRecord& worker) const;

private:
    std::chrono::milliseconds timeout_;
};

// Trim leading and trailing whitespace
std::string trim(const std::string& text);

} // namespace router
