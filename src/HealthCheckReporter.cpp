/**
 * @file    HealthCheckReporter.cpp
 * @brief   Liveness reporting implementation
 */

#include "HealthCheckReporter.hpp"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace book_watch {

    HealthCheckReporter::HealthCheckReporter(const LivenessRegistry& registry, const HealthCheckConfig& config)
        : registry_(registry)
          , config_(config)
          , running_(false)
          , should_stop_(false) {
        if (!config_.healthcheck_dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(config_.healthcheck_dir, ec);
            if (ec) {
                SPDLOG_WARN("Cannot create healthcheck directory {}: {}", config_.healthcheck_dir, ec.message());
            }
        }
    }

    HealthCheckReporter::~HealthCheckReporter() {
        stop();
    }

    void HealthCheckReporter::start() {
        if (running_) return;

        {
            std::lock_guard lock(stop_mutex_);
            should_stop_ = false;
        }
        running_ = true;
        thread_ = std::thread(&HealthCheckReporter::run, this);
        SPDLOG_INFO("Health check reporter started (interval={}s, threshold={}s, dir='{}')",
                    config_.report_interval_s, config_.threshold_s, config_.healthcheck_dir);
    }

    void HealthCheckReporter::stop() {
        if (!running_) return;

        {
            std::lock_guard lock(stop_mutex_);
            should_stop_ = true;
        }
        stop_cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }
        running_ = false;
    }

    void HealthCheckReporter::run() {
        std::unique_lock lock(stop_mutex_);
        while (!should_stop_) {
            lock.unlock();
            report_once();
            lock.lock();

            stop_cv_.wait_for(lock, std::chrono::seconds(config_.report_interval_s),
                              [this]() { return should_stop_; });
        }
    }

    size_t HealthCheckReporter::report_once() {
        const auto statuses = registry_.report(std::chrono::seconds(config_.threshold_s));

        size_t active = 0;
        for (const auto& status : statuses) {
            if (status.active) {
                ++active;
                if (!config_.healthcheck_dir.empty()) {
                    touch(touch_path(status.name));
                }
            } else {
                SPDLOG_WARN("Feed '{}' silent for more than {}s ({} messages total)",
                            status.name, config_.threshold_s, status.message_count);
            }
        }

        SPDLOG_INFO("Liveness: {}/{} feeds active", active, statuses.size());
        return active;
    }

    std::string HealthCheckReporter::touch_path(const std::string& feed_name) const {
        return (std::filesystem::path(config_.healthcheck_dir) / (config_.healthcheck_prefix + feed_name)).string();
    }

    void HealthCheckReporter::touch(const std::string& path) const {
        {
            std::ofstream file(path, std::ios::app);
            if (!file) {
                SPDLOG_WARN("Cannot open healthcheck file {}", path);
                return;
            }
        }

        std::error_code ec;
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now(), ec);
        if (ec) {
            SPDLOG_WARN("Cannot update healthcheck file {}: {}", path, ec.message());
        }
    }

} // namespace book_watch
