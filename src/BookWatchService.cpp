/**
 * @file    BookWatchService.cpp
 * @brief   Book watch service implementation
 */

#include "BookWatchService.hpp"
#include "KafkaProducer.hpp"
#include "KafkaPush.hpp"
#include "spdlog/spdlog.h"
#include <yaml-cpp/yaml.h>
#include <signal.h>
#include <stdexcept>

namespace book_watch {
    // ServiceConfig implementation
    ServiceConfig::ServiceConfig()
        : publish_enabled(true)
          , publish_interval_ms(1000)
          , enable_statistics(true)
          , stats_report_interval_s(30) {
    }

    ServiceConfig load_service_config(const std::string &config_path) {
        ServiceConfig config;
        YAML::Node yaml_config = YAML::LoadFile(config_path);

        config.feed_config.kafka_config_path = config_path;

        if (yaml_config["feed"]) {
            const auto &feed = yaml_config["feed"];
            config.feed_config.topic = feed["topic"] ? feed["topic"].as<std::string>() : "account_updates";
            config.feed_config.poll_timeout_ms = feed["poll_timeout_ms"] ? feed["poll_timeout_ms"].as<int>() : 100;
            config.feed_config.fetch_timeout_ms = feed["fetch_timeout_ms"] ? feed["fetch_timeout_ms"].as<uint32_t>() : 5000;
        }

        if (yaml_config["book"]) {
            const auto &book = yaml_config["book"];
            config.layout.node_capacity = book["node_capacity"] ? book["node_capacity"].as<size_t>() : BookLayout::kDefaultNodeCapacity;
        }

        if (yaml_config["liveness"]) {
            const auto &liveness = yaml_config["liveness"];
            config.health_config.threshold_s = liveness["threshold_s"] ? liveness["threshold_s"].as<uint32_t>() : 60;
            config.health_config.report_interval_s = liveness["report_interval_s"] ? liveness["report_interval_s"].as<uint32_t>() : 10;
            config.health_config.healthcheck_dir = liveness["healthcheck_dir"] ? liveness["healthcheck_dir"].as<std::string>() : "";
            config.health_config.healthcheck_prefix = liveness["healthcheck_prefix"] ? liveness["healthcheck_prefix"].as<std::string>() : "book_watch_";
        }

        if (yaml_config["publish"]) {
            const auto &publish = yaml_config["publish"];
            config.publish_enabled = publish["enabled"] ? publish["enabled"].as<bool>() : true;
            config.publish_interval_ms = publish["interval_ms"] ? publish["interval_ms"].as<uint32_t>() : 1000;
            config.json_config.depth = publish["depth"] ? publish["depth"].as<uint32_t>() : 0;
            config.json_config.compact_format = publish["compact_format"] ? publish["compact_format"].as<bool>() : true;
            config.topic_config.snapshot_topic_prefix = publish["snapshot_prefix"] ? publish["snapshot_prefix"].as<std::string>() : "order_book.";
        }

        if (yaml_config["statistics"]) {
            const auto &stats = yaml_config["statistics"];
            config.enable_statistics = stats["enabled"] ? stats["enabled"].as<bool>() : true;
            config.stats_report_interval_s = stats["interval_s"] ? stats["interval_s"].as<uint32_t>() : 30;
        }

        if (yaml_config["markets"]) {
            for (const auto &entry: yaml_config["markets"]) {
                if (!entry["name"] || !entry["bids"] || !entry["asks"]) {
                    throw std::runtime_error("Market config: each market needs 'name', 'bids' and 'asks'");
                }

                MarketConfig market;
                market.name = entry["name"].as<std::string>();
                market.bids_address = entry["bids"].as<std::string>();
                market.asks_address = entry["asks"].as<std::string>();
                market.scaling.base_decimals = entry["base_decimals"] ? entry["base_decimals"].as<int32_t>() : 0;
                market.scaling.quote_decimals = entry["quote_decimals"] ? entry["quote_decimals"].as<int32_t>() : 0;
                market.scaling.base_lot_size = entry["base_lot_size"] ? entry["base_lot_size"].as<int64_t>() : 1;
                market.scaling.quote_lot_size = entry["quote_lot_size"] ? entry["quote_lot_size"].as<int64_t>() : 1;

                if (market.scaling.base_lot_size <= 0 || market.scaling.quote_lot_size <= 0) {
                    throw std::runtime_error("Market config: lot sizes of '" + market.name + "' must be positive");
                }
                config.markets.push_back(market);
            }
        }

        return config;
    }

    BookWatchService::BookWatchService(const ServiceConfig &config)
        : config_(config)
          , publish_sequence_(0)
          , running_(false)
          , should_stop_(false) {
        SPDLOG_INFO("BookWatchService created with config: topic={}, markets={}, node_capacity={}, publish={}",
                    config_.feed_config.topic, config_.markets.size(), config_.layout.node_capacity,
                    config_.publish_enabled);
    }

    BookWatchService::~BookWatchService() {
        if (running_) {
            stop_processing();
        }
        shutdown_components();
    }

    bool BookWatchService::initialize() {
        try {
            // Transport first: watchers fetch their initial state from it
            feed_ = std::make_unique<KafkaAccountFeed>(config_.feed_config);
            if (!feed_->initialize()) {
                feed_.reset();
                return false;
            }
            feed_->start();

            if (config_.publish_enabled) {
                KafkaProducer::instance().initialize(config_.feed_config.kafka_config_path);
            }

            auto on_error = [this](const MalformedUpdate &error) {
                metrics_.malformed_updates++;
                SPDLOG_WARN("Dropped book update: {}", error.what());
            };

            for (const auto &market: config_.markets) {
                markets_.push_back(std::make_unique<MarketBookWatcher>(
                    *feed_, *feed_, liveness_, market, config_.layout, on_error));
            }

            health_reporter_ = std::make_unique<HealthCheckReporter>(liveness_, config_.health_config);
            health_reporter_->start();

            message_factory_ = std::make_unique<MessageFactory>(config_.json_config);
            message_router_ = std::make_unique<MessageRouter>(config_.topic_config);

            SPDLOG_INFO("BookWatchService initialized successfully ({} markets, {} feeds)",
                        markets_.size(), liveness_.feed_count());
            return true;
        } catch (const std::exception &e) {
            SPDLOG_ERROR("Failed to initialize BookWatchService: {}", e.what());
            shutdown_components();
            return false;
        }
    }

    void BookWatchService::start_processing(uint32_t max_runtime_s) {
        if (running_) {
            SPDLOG_WARN("Service is already running");
            return;
        }

        running_ = true;
        start_time_ = std::chrono::steady_clock::now();
        auto last_stats_time = start_time_;

        SPDLOG_INFO("Starting book watch service (max_runtime={}s)", max_runtime_s);

        std::unique_lock lock(stop_mutex_);
        while (!should_stop_) {
            stop_cv_.wait_for(lock, std::chrono::milliseconds(config_.publish_interval_ms),
                              [this]() { return should_stop_.load(); });
            if (should_stop_) break;

            lock.unlock();
            if (config_.publish_enabled) {
                publish_changed_books();
                KafkaProducer::instance().poll(0);
            }

            auto now = std::chrono::steady_clock::now();
            if (config_.enable_statistics &&
                now - last_stats_time >= std::chrono::seconds(config_.stats_report_interval_s)) {
                print_statistics();
                last_stats_time = now;
            }

            if (max_runtime_s > 0 && now - start_time_ >= std::chrono::seconds(max_runtime_s)) {
                SPDLOG_INFO("Stopping service after {}s (max_runtime reached)", max_runtime_s);
                should_stop_ = true;
            }
            lock.lock();
        }
        lock.unlock();

        running_ = false;

        // Print final statistics
        if (config_.enable_statistics) {
            print_statistics();
        }
        SPDLOG_INFO("Book watch service stopped");
    }

    void BookWatchService::stop_processing() {
        {
            std::lock_guard lock(stop_mutex_);
            should_stop_ = true;
        }
        stop_cv_.notify_all();
    }

    size_t BookWatchService::publish_changed_books() {
        size_t published = 0;
        for (auto &market: markets_) {
            const uint64_t version = market->bids_watcher().updates_applied() +
                                     market->asks_watcher().updates_applied();
            auto it = published_versions_.find(market->get_market().name);
            if (it != published_versions_.end() && it->second == version) {
                continue;
            }

            if (publish_book(*market)) {
                published_versions_[market->get_market().name] = version;
                ++published;
            }
        }
        return published;
    }

    bool BookWatchService::publish_book(MarketBookWatcher &market) {
        try {
            const auto bids = market.bids();
            const auto asks = market.asks();
            const std::string &name = market.get_market().name;

            std::string json_payload = message_factory_->create_book_json(
                name, *bids, *asks, ++publish_sequence_, get_timestamp());

            auto kafka_msg = message_router_->route_book(name, json_payload);
            if (!KafkaPush(kafka_msg.topic, RD_KAFKA_PARTITION_UA, kafka_msg.key,
                           kafka_msg.payload.c_str(), kafka_msg.payload.size())) {
                metrics_.publish_errors++;
                return false;
            }

            metrics_.books_published++;
            return true;
        } catch (const std::exception &e) {
            SPDLOG_ERROR("Failed to publish book for market {}: {}", market.get_market().name, e.what());
            metrics_.publish_errors++;
            return false;
        }
    }

    void BookWatchService::shutdown_components() {
        if (health_reporter_) {
            health_reporter_->stop();
            health_reporter_.reset();
        }

        // Watchers unsubscribe before the feed goes away
        for (auto &market: markets_) {
            market->dispose();
        }
        markets_.clear();

        if (feed_) {
            feed_->stop();
            feed_.reset();
        }

        if (config_.publish_enabled) {
            KafkaProducer::instance().shutdown();
        }
    }

    void BookWatchService::print_statistics() const {
        auto total_runtime_s = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();

        SPDLOG_INFO("=== BOOK WATCH STATISTICS ({}s runtime) ===", total_runtime_s);
        SPDLOG_INFO("Books: published={}, publish_errors={}, malformed_updates={}",
                    metrics_.books_published.load(), metrics_.publish_errors.load(),
                    metrics_.malformed_updates.load());

        if (feed_) {
            const auto &stats = feed_->get_stats();
            SPDLOG_INFO("Feed: consumed={}, dispatched={}, decode_errors={}, kafka_errors={}, callback_errors={}",
                        stats.messages_consumed.load(), stats.messages_dispatched.load(),
                        stats.decode_errors.load(), stats.kafka_errors.load(), stats.callback_errors.load());
        }

        for (const auto &market: markets_) {
            SPDLOG_INFO("Market {}: bids={}, asks={}",
                        market->get_market().name, market->bids()->size(), market->asks()->size());
        }
    }

    // ServiceShutdownHandler Implementation

    ServiceShutdownHandler *ServiceShutdownHandler::instance_ = nullptr;

    ServiceShutdownHandler::ServiceShutdownHandler(BookWatchService &service)
        : service_(service) {
        instance_ = this;
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
    }

    ServiceShutdownHandler::~ServiceShutdownHandler() {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        instance_ = nullptr;
    }

    void ServiceShutdownHandler::signal_handler(int /*signal*/) {
        // Only an atomic store here; the processing loop notices on its next wake
        if (instance_) {
            instance_->service_.request_stop();
        }
    }
} // namespace book_watch
