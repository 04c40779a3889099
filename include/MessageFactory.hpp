/**
 * @file    MessageFactory.hpp
 * @brief   JSON message factory for watched order books
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Converts the latest bid and ask order lists of a market into JSON for
 *   downstream consumers, and routes the result to a per-market topic.
 *   Prices and quantities are exact decimal strings.
 */

#pragma once

#ifndef MESSAGE_FACTORY_HPP_
#define MESSAGE_FACTORY_HPP_

#include "BookWatchTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace book_watch {

/**
 * @brief JSON message factory for book snapshots
 */
class MessageFactory {
public:
    /**
     * @brief Configuration for JSON formatting
     */
    struct JsonConfig {
        uint32_t depth = 0;               // Orders per side, 0 = all
        bool include_timestamp = true;    // Include timestamp in messages
        bool include_sequence = true;     // Include sequence numbers
        bool compact_format = true;       // Use compact JSON (no pretty printing)
    };

    MessageFactory();
    explicit MessageFactory(const JsonConfig& config);

    /**
     * @brief Create JSON book message for one market
     * @param market Market name
     * @param bids Bids, best first
     * @param asks Asks, best first
     * @param sequence Publisher sequence number
     * @param timestamp_us Capture time in microseconds since epoch
     * @return JSON string
     */
    std::string create_book_json(const std::string& market,
                                 const OrderList& bids,
                                 const OrderList& asks,
                                 uint64_t sequence,
                                 uint64_t timestamp_us) const;

    /**
     * @brief Convert one order to a JSON object
     */
    static nlohmann::json order_to_json(const Order& order);

    const JsonConfig& get_config() const { return config_; }

private:
    nlohmann::json orders_to_json(const OrderList& orders) const;

    /**
     * @brief Add common fields to JSON message
     */
    void add_common_fields(nlohmann::json& j, const std::string& market,
                          uint64_t sequence, uint64_t timestamp_us) const;

private:
    JsonConfig config_;
};

/**
 * @brief Kafka message wrapper with topic routing information
 */
struct KafkaMessage {
    std::string topic;
    std::string key;        // Market name for partitioning
    std::string payload;    // JSON payload
};

/**
 * @brief Message router for determining Kafka topics
 */
class MessageRouter {
public:
    struct TopicConfig {
        std::string snapshot_topic_prefix = "order_book.";
    };

    MessageRouter();
    explicit MessageRouter(const TopicConfig& config);

    KafkaMessage route_book(const std::string& market, const std::string& json_payload) const;

private:
    TopicConfig config_;
};

} // namespace book_watch

#endif /* MESSAGE_FACTORY_HPP_ */
