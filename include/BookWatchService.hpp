/**
 * @file    BookWatchService.hpp
 * @brief   Service orchestrating account feed, book watchers and publishing
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Owns the Kafka account feed, the liveness registry, one MarketBookWatcher
 *   per configured market and the health check reporter. While running it
 *   periodically renders each market's latest bids and asks to JSON and
 *   publishes them to Kafka.
 */

#pragma once

#ifndef BOOK_WATCH_SERVICE_HPP_
#define BOOK_WATCH_SERVICE_HPP_

#include "BookSideLayout.hpp"
#include "BookSideWatcher.hpp"
#include "HealthCheckReporter.hpp"
#include "KafkaAccountFeed.hpp"
#include "LivenessRegistry.hpp"
#include "MessageFactory.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace book_watch {

/**
 * @brief Configuration for the book watch service
 */
struct ServiceConfig {
    // Transport
    FeedConfig feed_config;

    // Book layout
    BookLayout layout;

    // Markets to watch
    std::vector<MarketConfig> markets;

    // Liveness
    HealthCheckConfig health_config;

    // Publishing
    bool publish_enabled;
    uint32_t publish_interval_ms;
    MessageFactory::JsonConfig json_config;
    MessageRouter::TopicConfig topic_config;

    // Statistics
    bool enable_statistics;
    uint32_t stats_report_interval_s;

    ServiceConfig();
};

/**
 * @brief Load service configuration from YAML, falling back to defaults per key
 * @throws YAML::Exception when the file cannot be read or a value has the wrong type
 * @throws std::runtime_error when a market entry lacks a required field
 */
ServiceConfig load_service_config(const std::string& config_path);

/**
 * @brief Publishing metrics for monitoring
 */
struct ServiceMetrics {
    std::atomic<uint64_t> books_published{0};
    std::atomic<uint64_t> publish_errors{0};
    std::atomic<uint64_t> malformed_updates{0};
};

/**
 * @brief Main book watch service
 */
class BookWatchService {
public:
    explicit BookWatchService(const ServiceConfig& config);
    ~BookWatchService();

    /**
     * @brief Connect the feed, build watchers and the producer
     * @return false on failure (logged); nothing keeps running
     */
    bool initialize();

    /**
     * @brief Publish until stopped (blocking call)
     * @param max_runtime_s Maximum runtime in seconds (0 = infinite)
     */
    void start_processing(uint32_t max_runtime_s = 0);

    /**
     * @brief Stop processing gracefully
     */
    void stop_processing();

    /**
     * @brief Ask the processing loop to stop; async-signal-safe
     */
    void request_stop() { should_stop_ = true; }

    bool is_running() const { return running_; }

    /**
     * @brief Publish every market whose book changed since the last pass
     * @return Number of markets published
     */
    size_t publish_changed_books();

    void print_statistics() const;

    const LivenessRegistry& get_liveness() const { return liveness_; }
    const ServiceMetrics& get_metrics() const { return metrics_; }

private:
    bool publish_book(MarketBookWatcher& market);
    void shutdown_components();

    static uint64_t get_timestamp() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

private:
    ServiceConfig config_;

    // Core components
    LivenessRegistry liveness_;
    std::unique_ptr<KafkaAccountFeed> feed_;
    std::vector<std::unique_ptr<MarketBookWatcher>> markets_;
    std::unique_ptr<HealthCheckReporter> health_reporter_;
    std::unique_ptr<MessageFactory> message_factory_;
    std::unique_ptr<MessageRouter> message_router_;

    // Updates applied per market at its last publish
    std::unordered_map<std::string, uint64_t> published_versions_;
    uint64_t publish_sequence_;

    // Threading and control
    std::atomic<bool> running_;
    std::atomic<bool> should_stop_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    ServiceMetrics metrics_;
    std::chrono::steady_clock::time_point start_time_;
};

/**
 * @brief RAII wrapper for graceful shutdown handling
 */
class ServiceShutdownHandler {
public:
    explicit ServiceShutdownHandler(BookWatchService& service);
    ~ServiceShutdownHandler();

private:
    BookWatchService& service_;
    static void signal_handler(int signal);
    static ServiceShutdownHandler* instance_;
};

} // namespace book_watch

#endif /* BOOK_WATCH_SERVICE_HPP_ */
