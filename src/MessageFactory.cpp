/**
 * @file    MessageFactory.cpp
 * @brief   JSON message factory implementation
 */

#include "MessageFactory.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace book_watch {

    // MessageFactory implementation
    MessageFactory::MessageFactory(const JsonConfig &config) : config_(config) {
        SPDLOG_DEBUG("MessageFactory created with depth={}, compact={}",
                     config_.depth, config_.compact_format);
    }

    MessageFactory::MessageFactory() : config_() {
    }

    std::string MessageFactory::create_book_json(const std::string &market,
                                                 const OrderList &bids,
                                                 const OrderList &asks,
                                                 uint64_t sequence,
                                                 uint64_t timestamp_us) const {
        nlohmann::json j;

        // Add common fields
        add_common_fields(j, market, sequence, timestamp_us);

        j["message_type"] = "book";
        j["depth"] = config_.depth;
        j["bids"] = orders_to_json(bids);
        j["asks"] = orders_to_json(asks);

        j["book_stats"] = {
            {"total_bids", bids.size()},
            {"total_asks", asks.size()}
        };
        if (!bids.empty()) {
            j["book_stats"]["best_bid"] = format_decimal(bids.front().price);
        }
        if (!asks.empty()) {
            j["book_stats"]["best_ask"] = format_decimal(asks.front().price);
        }

        return config_.compact_format ? j.dump() : j.dump(2);
    }

    nlohmann::json MessageFactory::order_to_json(const Order &order) {
        nlohmann::json j;

        j["id"] = to_string(order.id);
        j["client_order_id"] = order.client_order_id;
        j["owner"] = order.owner.to_base58();
        j["side"] = to_string(order.side);
        j["price"] = format_decimal(order.price);
        j["quantity"] = format_decimal(order.quantity);
        j["order_type"] = to_string(order.order_type);

        return j;
    }

    nlohmann::json MessageFactory::orders_to_json(const OrderList &orders) const {
        nlohmann::json result = nlohmann::json::array();

        const size_t limit = config_.depth > 0 ? std::min<size_t>(config_.depth, orders.size()) : orders.size();
        for (size_t i = 0; i < limit; ++i) {
            result.push_back(order_to_json(orders[i]));
        }
        return result;
    }

    void MessageFactory::add_common_fields(nlohmann::json &j, const std::string &market,
                                           uint64_t sequence, uint64_t timestamp_us) const {
        j["market"] = market;

        if (config_.include_sequence) {
            j["sequence"] = sequence;
        }

        if (config_.include_timestamp) {
            j["timestamp"] = timestamp_us;

            // Also add human-readable timestamp
            auto timestamp_ms = timestamp_us / 1000;
            auto time_point = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(timestamp_ms / 1000));
            auto ms_part = timestamp_ms % 1000;

            std::time_t tt = std::chrono::system_clock::to_time_t(time_point);
            std::tm tm_utc{};
            gmtime_r(&tt, &tm_utc);
            std::ostringstream ss;
            ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(3) << ms_part << "Z";
            j["timestamp_iso"] = ss.str();
        }
    }

    // MessageRouter implementation
    MessageRouter::MessageRouter(const TopicConfig &config) : config_(config) {
        SPDLOG_DEBUG("MessageRouter created with snapshot_prefix={}", config_.snapshot_topic_prefix);
    }

    MessageRouter::MessageRouter() : config_() {
    }

    KafkaMessage MessageRouter::route_book(const std::string &market, const std::string &json_payload) const {
        return KafkaMessage{config_.snapshot_topic_prefix + market, market, json_payload};
    }

} // namespace book_watch
