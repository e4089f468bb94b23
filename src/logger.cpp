#include "logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace router {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& log_file, const std::string& log_level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);

        // 10MB x 5 rotating files
        constexpr size_t max_size = 10 * 1024 * 1024;
        constexpr size_t max_files = 5;

        std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
        if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
            std::error_code ec;
            std::filesystem::create_directories(log_dir, ec);
            if (ec) {
                std::cerr << "Could not create log directory " << log_dir << ": "
                          << ec.message() << std::endl;
            }
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_level(string_to_level(log_level));

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("router", sinks.begin(), sinks.end());

        logger_->set_level(string_to_level(log_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger_->flush_on(spdlog::level::info);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
    }
}

void Logger::info(Component component, const std::string& message) {
    if (logger_) {
        logger_->info("[{}] {}", component_to_string(component), message);
    }
}

void Logger::warn(Component component, const std::string& message) {
    if (logger_) {
        logger_->warn("[{}] {}", component_to_string(component), message);
    }
}

void Logger::error(Component component, const std::string& message) {
    if (logger_) {
        logger_->error("[{}] {}", component_to_string(component), message);
    }
}

void Logger::debug(Component component, const std::string& message) {
    if (logger_) {
        logger_->debug("[{}] {}", component_to_string(component), message);
    }
}

std::string Logger::component_to_string(Component component) {
    switch (component) {
        case Component::Router: return "Router";
        case Component::Config: return "Config";
        case Component::HealthCheck: return "HealthCheck";
        case Component::Request: return "Request";
        case Component::Dispatch: return "Dispatch";
        case Component::Response: return "Response";
        default: return "Unknown";
    }
}

spdlog::level::level_enum Logger::string_to_level(const std::string& level) {
    if (level == "DEBUG") return spdlog::level::debug;
    if (level == "INFO") return spdlog::level::info;
    if (level == "WARN") return spdlog::level::warn;
    if (level == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace router
