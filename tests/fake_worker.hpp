#pragma once

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace router::fakes {

// In-process stand-in for an execution worker, bound to an ephemeral
// localhost port. Ping and run behavior can be changed while serving.
class FakeWorker {
public:
    FakeWorker() {
        server_.Get("/v1/ping", [this](const httplib::Request&, httplib::Response& res) {
            ping_count_.fetch_add(1);
            std::string body;
            int status;
            std::chrono::milliseconds delay;
            {
                std::lock_guard lock(mutex_);
                body = ping_body_;
                status = ping_status_;
                delay = ping_delay_;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            res.status = status;
            send_body(res, body, "text/plain");
        });

        server_.Post("/run_code", [this](const httplib::Request& req, httplib::Response& res) {
            run_count_.fetch_add(1);
            std::string body;
            int status;
            std::chrono::milliseconds delay;
            {
                std::lock_guard lock(mutex_);
                last_run_body_ = req.body;
                last_content_type_ = req.get_header_value("Content-Type");
                body = run_body_;
                status = run_status_;
                delay = run_delay_;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            res.status = status;
            send_body(res, body, "application/json");
        });

        // Room for many slow requests in flight at once
        server_.new_task_queue = [] { return new httplib::ThreadPool(32); };

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~FakeWorker() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeWorker(const FakeWorker&) = delete;
    FakeWorker& operator=(const FakeWorker&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int port() const { return port_; }

    void set_ping(int status, const std::string& body,
                  std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::lock_guard lock(mutex_);
        ping_status_ = status;
        ping_body_ = body;
        ping_delay_ = delay;
    }

    void set_run(int status, const std::string& body,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::lock_guard lock(mutex_);
        run_status_ = status;
        run_body_ = body;
        run_delay_ = delay;
    }

    // Send response bodies one byte at a time, pausing before each byte
    void set_trickle(std::chrono::milliseconds per_byte) {
        std::lock_guard lock(mutex_);
        trickle_ = per_byte;
    }

    int ping_count() const { return ping_count_.load(); }
    int run_count() const { return run_count_.load(); }

    std::string last_run_body() const {
        std::lock_guard lock(mutex_);
        return last_run_body_;
    }

    std::string last_content_type() const {
        std::lock_guard lock(mutex_);
        return last_content_type_;
    }

private:
    void send_body(httplib::Response& res, const std::string& body, const char* content_type) {
        std::chrono::milliseconds per_byte;
        {
            std::lock_guard lock(mutex_);
            per_byte = trickle_;
        }
        if (per_byte.count() == 0) {
            res.set_content(body, content_type);
            return;
        }
        res.set_chunked_content_provider(content_type,
            [body, per_byte](size_t, httplib::DataSink& sink) {
                for (char c : body) {
                    std::this_thread::sleep_for(per_byte);
                    if (!sink.write(&c, 1)) {
                        return false;
                    }
                }
                sink.done();
                return true;
            });
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;

    mutable std::mutex mutex_;
    int ping_status_ = 200;
    std::string ping_body_ = "pong\n";
    std::chrono::milliseconds ping_delay_{0};
    int run_status_ = 200;
    std::string run_body_ = R"({"status": "Success", "run": {"status": "Finished", "stdout": "4\n", "stderr": "", "exit_code": 0}})";
    std::chrono::milliseconds run_delay_{0};
    std::chrono::milliseconds trickle_{0};
    std::string last_run_body_;
    std::string last_content_type_;

    std::atomic<int> ping_count_{0};
    std::atomic<int> run_count_{0};
};

// Nothing listens here; connections are refused immediately
inline const std::string kUnreachableWorker = "http://127.0.0.1:1";

} // namespace router::fakes
