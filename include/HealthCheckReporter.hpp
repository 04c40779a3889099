/**
 * @file    HealthCheckReporter.hpp
 * @brief   Periodic liveness reporting for external health monitoring
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Logs the liveness registry on an interval and, when a directory is
 *   configured, touches one file per active feed so an external monitor can
 *   alert on stale modification times.
 */

#pragma once

#ifndef HEALTH_CHECK_REPORTER_HPP_
#define HEALTH_CHECK_REPORTER_HPP_

#include "LivenessRegistry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace book_watch {

struct HealthCheckConfig {
    uint32_t threshold_s = 60;          // Silence longer than this marks a feed inactive
    uint32_t report_interval_s = 10;
    std::string healthcheck_dir;        // Empty disables touch files
    std::string healthcheck_prefix = "book_watch_";
};

class HealthCheckReporter {
public:
    HealthCheckReporter(const LivenessRegistry& registry, const HealthCheckConfig& config);
    ~HealthCheckReporter();

    HealthCheckReporter(const HealthCheckReporter&) = delete;
    HealthCheckReporter& operator=(const HealthCheckReporter&) = delete;

    void start();
    void stop();

    /**
     * @brief One reporting pass
     * @return Number of feeds currently active
     */
    size_t report_once();

    /**
     * @brief Touch file path for a feed name
     */
    std::string touch_path(const std::string& feed_name) const;

private:
    void run();
    void touch(const std::string& path) const;

    const LivenessRegistry& registry_;
    HealthCheckConfig config_;

    std::atomic<bool> running_;
    bool should_stop_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::thread thread_;
};

} // namespace book_watch

#endif /* HEALTH_CHECK_REPORTER_HPP_ */
