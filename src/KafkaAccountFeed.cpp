/**
 * @file    KafkaAccountFeed.cpp
 * @brief   Kafka-backed account transport implementation
 */

#include "KafkaAccountFeed.hpp"
#include "account_update_generated.h"
#include "spdlog/spdlog.h"

#include <flatbuffers/flatbuffers.h>
#include <exception>
#include <vector>

namespace book_watch {

    KafkaAccountFeed::KafkaAccountFeed(const FeedConfig& config)
        : config_(config)
          , running_(false)
          , should_stop_(false)
          , next_subscription_id_(1)
          , dispatch_thread_(std::thread::id()) {
        SPDLOG_INFO("KafkaAccountFeed created with config: topic={}, poll_timeout_ms={}, fetch_timeout_ms={}",
                    config_.topic, config_.poll_timeout_ms, config_.fetch_timeout_ms);
    }

    KafkaAccountFeed::~KafkaAccountFeed() {
        stop();
    }

    bool KafkaAccountFeed::initialize() {
        try {
            consumer_.initialize(config_.kafka_config_path);
            consumer_.subscribe({config_.topic});

            SPDLOG_INFO("KafkaAccountFeed initialized successfully");
            return true;
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Failed to initialize KafkaAccountFeed: {}", e.what());
            return false;
        }
    }

    void KafkaAccountFeed::start() {
        if (running_) {
            SPDLOG_WARN("KafkaAccountFeed is already running");
            return;
        }

        running_ = true;
        should_stop_ = false;
        poll_thread_ = std::thread(&KafkaAccountFeed::poll_loop, this);
        SPDLOG_INFO("KafkaAccountFeed polling topic {}", config_.topic);
    }

    void KafkaAccountFeed::stop() {
        if (!running_) return;

        SPDLOG_INFO("Stopping KafkaAccountFeed...");
        should_stop_ = true;

        if (poll_thread_.joinable()) {
            poll_thread_.join();
        }
        consumer_.shutdown();
        running_ = false;

        SPDLOG_INFO("KafkaAccountFeed stopped: consumed={}, dispatched={}, decode_errors={}, kafka_errors={}",
                    stats_.messages_consumed.load(), stats_.messages_dispatched.load(),
                    stats_.decode_errors.load(), stats_.kafka_errors.load());
    }

    void KafkaAccountFeed::poll_loop() {
        while (!should_stop_) {
            rd_kafka_message_t* msg = consumer_.consume(config_.poll_timeout_ms);

            if (!msg) {
                // No message available, continue polling
                continue;
            }

            if (msg->err) {
                if (msg->err != RD_KAFKA_RESP_ERR__PARTITION_EOF) {
                    SPDLOG_ERROR("Kafka consume error: {}", rd_kafka_err2str(msg->err));
                    stats_.kafka_errors++;
                }
                rd_kafka_message_destroy(msg);
                continue;
            }

            stats_.messages_consumed++;
            if (!handle_payload(static_cast<const uint8_t*>(msg->payload), msg->len)) {
                stats_.decode_errors++;
            }

            rd_kafka_message_destroy(msg);
        }
    }

    bool KafkaAccountFeed::handle_payload(const uint8_t* data, size_t len) {
        if (!data || len == 0) {
            SPDLOG_WARN("Received empty or invalid message");
            return false;
        }

        flatbuffers::Verifier verifier(data, len);
        if (!fb::VerifyAccountUpdateBuffer(verifier)) {
            SPDLOG_ERROR("Failed to verify AccountUpdate envelope ({} bytes)", len);
            return false;
        }

        const auto* update = fb::GetAccountUpdate(data);

        AccountInfo account_info;
        account_info.address = update->address()->str();
        account_info.owner = update->owner() ? update->owner()->str() : std::string();
        account_info.slot = update->slot();
        if (update->data()) {
            account_info.data.assign(update->data()->begin(), update->data()->end());
        }

        {
            std::lock_guard lock(latest_mutex_);
            latest_[account_info.address] = account_info;
        }
        latest_cv_.notify_all();

        dispatch(account_info);
        return true;
    }

    void KafkaAccountFeed::dispatch(const AccountInfo& account_info) {
        std::lock_guard dispatch_lock(dispatch_mutex_);

        std::vector<SubscriptionId> ids;
        {
            std::lock_guard lock(subscriptions_mutex_);
            auto it = subscriptions_.find(account_info.address);
            if (it == subscriptions_.end()) {
                return;
            }
            ids.reserve(it->second.size());
            for (const auto& [id, callback] : it->second) {
                ids.push_back(id);
            }
        }

        // Lets a callback unsubscribe without waiting on itself
        dispatch_thread_ = std::this_thread::get_id();
        for (const SubscriptionId id : ids) {
            // An earlier callback may have unsubscribed this one
            AccountCallback callback;
            {
                std::lock_guard lock(subscriptions_mutex_);
                auto it = subscriptions_.find(account_info.address);
                if (it == subscriptions_.end()) {
                    break;
                }
                auto cb_it = it->second.find(id);
                if (cb_it == it->second.end()) {
                    continue;
                }
                callback = cb_it->second;
            }

            try {
                callback(account_info);
                stats_.messages_dispatched++;
            } catch (const std::exception& e) {
                stats_.callback_errors++;
                SPDLOG_ERROR("Subscriber callback for {} failed: {}", account_info.address, e.what());
            }
        }
        dispatch_thread_ = std::thread::id();
    }

    std::optional<AccountInfo> KafkaAccountFeed::fetch(const std::string& address) {
        std::unique_lock lock(latest_mutex_);
        const bool found = latest_cv_.wait_for(lock, std::chrono::milliseconds(config_.fetch_timeout_ms),
                                               [&]() { return latest_.count(address) > 0; });
        if (!found) {
            SPDLOG_WARN("No account data for {} after {}ms", address, config_.fetch_timeout_ms);
            return std::nullopt;
        }
        return latest_.at(address);
    }

    SubscriptionId KafkaAccountFeed::subscribe(const std::string& address, AccountCallback callback) {
        std::lock_guard lock(subscriptions_mutex_);
        const SubscriptionId id = next_subscription_id_++;
        subscriptions_[address][id] = std::move(callback);
        subscription_addresses_[id] = address;

        SPDLOG_DEBUG("Subscription {} added for {}", id, address);
        return id;
    }

    void KafkaAccountFeed::unsubscribe(SubscriptionId id) {
        {
            std::lock_guard lock(subscriptions_mutex_);
            auto it = subscription_addresses_.find(id);
            if (it == subscription_addresses_.end()) {
                return;
            }

            auto sub_it = subscriptions_.find(it->second);
            if (sub_it != subscriptions_.end()) {
                sub_it->second.erase(id);
                if (sub_it->second.empty()) {
                    subscriptions_.erase(sub_it);
                }
            }
            subscription_addresses_.erase(it);
        }

        // Wait out an in-flight dispatch unless we are inside it
        if (dispatch_thread_.load() != std::this_thread::get_id()) {
            std::lock_guard dispatch_lock(dispatch_mutex_);
        }

        SPDLOG_DEBUG("Subscription {} removed", id);
    }

} // namespace book_watch
