/**
 * @file    KafkaAccountFeed.hpp
 * @brief   Account fetch/subscribe transport on top of a Kafka topic
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Consumes FlatBuffers AccountUpdate messages from one topic, keeps the
 *   latest account seen per address (compacted-topic semantics) and pushes
 *   each update to the callbacks subscribed to its address. fetch() answers
 *   from the latest-seen map, waiting a bounded time for a first update.
 */

#pragma once

#ifndef KAFKA_ACCOUNT_FEED_HPP_
#define KAFKA_ACCOUNT_FEED_HPP_

#include "AccountSource.hpp"
#include "KafkaConsumer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace book_watch {

/**
 * @brief Feed configuration
 */
struct FeedConfig {
    std::string kafka_config_path = "config/config.yaml";
    std::string topic = "account_updates";
    int poll_timeout_ms = 100;
    uint32_t fetch_timeout_ms = 5000;
};

/**
 * @brief Counters for monitoring the feed
 */
struct FeedStats {
    std::atomic<uint64_t> messages_consumed{0};
    std::atomic<uint64_t> messages_dispatched{0};
    std::atomic<uint64_t> decode_errors{0};
    std::atomic<uint64_t> kafka_errors{0};
    std::atomic<uint64_t> callback_errors{0};
};

class KafkaAccountFeed : public AccountFetcher, public AccountSubscriber {
public:
    explicit KafkaAccountFeed(const FeedConfig& config = FeedConfig{});
    ~KafkaAccountFeed() override;

    KafkaAccountFeed(const KafkaAccountFeed&) = delete;
    KafkaAccountFeed& operator=(const KafkaAccountFeed&) = delete;

    /**
     * @brief Connect the consumer and subscribe to the topic
     * @return false on failure (logged)
     */
    bool initialize();

    /**
     * @brief Start the poll thread
     */
    void start();

    /**
     * @brief Stop the poll thread and close the consumer
     */
    void stop();

    bool is_running() const { return running_; }

    std::optional<AccountInfo> fetch(const std::string& address) override;

    SubscriptionId subscribe(const std::string& address, AccountCallback callback) override;
    void unsubscribe(SubscriptionId id) override;

    /**
     * @brief Decode one AccountUpdate envelope and deliver it
     * @return false if the payload is not a valid envelope
     */
    bool handle_payload(const uint8_t* data, size_t len);

    const FeedStats& get_stats() const { return stats_; }

private:
    void poll_loop();
    void dispatch(const AccountInfo& account_info);

    FeedConfig config_;
    KafkaConsumer consumer_;

    std::atomic<bool> running_;
    std::atomic<bool> should_stop_;
    std::thread poll_thread_;

    // Latest account per address
    std::unordered_map<std::string, AccountInfo> latest_;
    std::mutex latest_mutex_;
    std::condition_variable latest_cv_;

    // address -> (id -> callback)
    std::unordered_map<std::string, std::map<SubscriptionId, AccountCallback>> subscriptions_;
    std::unordered_map<SubscriptionId, std::string> subscription_addresses_;
    std::mutex subscriptions_mutex_;
    SubscriptionId next_subscription_id_;

    // Held while callbacks run so unsubscribe can wait them out
    std::mutex dispatch_mutex_;
    std::atomic<std::thread::id> dispatch_thread_;

    FeedStats stats_;
};

} // namespace book_watch

#endif /* KAFKA_ACCOUNT_FEED_HPP_ */
