#pragma once

#include "worker_pool.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace router {

struct DispatchError {
    enum class Kind {
        NoWorkerAvailable,
        AttemptsExhausted
    };

    Kind kind;
    int attempts;
    std::string message;
};

class Dispatcher {
public:
    static constexpr const char* kRunPath = "/run_code";
    static constexpr size_t kMaxAttempts = 3;

    explicit Dispatcher(WorkerPool& pool);

    // Forward a request body verbatim, failing over to other workers on error.
    // On success the worker's JSON gains router_metadata.
    std::expected<nlohmann::json, DispatchError> dispatch(const std::string& request_body);

    // min(3, number of configured workers)
    size_t max_attempts() const;

private:
    std::expected<nlohmann::json, std::string> forward(const WorkerRecord& worker,
                                                       const std::string& request_body,
                                                       int attempt);

    WorkerPool& pool_;
};

} // namespace router
