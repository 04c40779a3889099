/**
 * @file    AccountWatcher.hpp
 * @brief   Live, continuously updated view over one account feed
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   AccountWatcher seeds a SnapshotCell with a synchronous fetch-and-decode,
 *   then decodes every pushed update with the same function and replaces
 *   the snapshot. A payload that fails to decode is reported and dropped;
 *   the previous snapshot stays and the subscription stays alive.
 *   LambdaWatcher derives a value from other watchers at read time.
 */

#pragma once

#ifndef ACCOUNT_WATCHER_HPP_
#define ACCOUNT_WATCHER_HPP_

#include "AccountSource.hpp"
#include "BookWatchErrors.hpp"
#include "LivenessRegistry.hpp"
#include "SnapshotCell.hpp"
#include "spdlog/spdlog.h"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace book_watch {

/**
 * @brief Read side of a watcher
 */
template <typename T>
class Watcher {
public:
    virtual ~Watcher() = default;

    virtual std::shared_ptr<const T> latest() const = 0;
};

/**
 * @brief Receives updates that were dropped because they failed to decode
 */
using UpdateErrorCallback = std::function<void(const MalformedUpdate&)>;

template <typename T>
class AccountWatcher : public Watcher<T> {
public:
    using Decoder = std::function<T(const AccountInfo&)>;

    /**
     * @brief Fetch, decode and subscribe
     * @throws AccountNotFound when the initial fetch finds nothing
     * @throws any exception raised by `decode` on the initial account
     */
    AccountWatcher(AccountFetcher& fetcher,
                   AccountSubscriber& subscriber,
                   LivenessRegistry& liveness,
                   const std::string& name,
                   const std::string& address,
                   Decoder decode,
                   UpdateErrorCallback on_error = nullptr)
        : subscriber_(subscriber)
        , liveness_(liveness)
        , name_(name)
        , address_(address)
        , decode_(std::move(decode))
        , on_error_(std::move(on_error))
        , cell_(initial_value(fetcher, address_, decode_)) {

        feed_id_ = liveness_.add(name_);
        try {
            subscription_id_ = subscriber_.subscribe(address_, [this](const AccountInfo& account_info) {
                this->on_update(account_info);
            });
        } catch (...) {
            liveness_.remove(feed_id_);
            throw;
        }

        SPDLOG_INFO("Watcher '{}' started for {}", name_, address_);
    }

    ~AccountWatcher() override {
        dispose();
    }

    AccountWatcher(const AccountWatcher&) = delete;
    AccountWatcher& operator=(const AccountWatcher&) = delete;

    std::shared_ptr<const T> latest() const override { return cell_.read(); }

    /**
     * @brief Stop updates and release the subscription; safe to call twice
     *
     * Once this returns no further update reaches latest().
     */
    void dispose() {
        {
            std::lock_guard lock(dispatch_mutex_);
            if (disposed_) {
                return;
            }
            disposed_ = true;
        }

        subscriber_.unsubscribe(subscription_id_);
        liveness_.remove(feed_id_);
        SPDLOG_INFO("Watcher '{}' disposed ({} updates, {} dropped)", name_, updates_applied(), updates_dropped());
    }

    bool is_disposed() const {
        std::lock_guard lock(dispatch_mutex_);
        return disposed_;
    }

    const std::string& name() const { return name_; }
    const std::string& address() const { return address_; }
    FeedId feed_id() const { return feed_id_; }

    uint64_t updates_applied() const { return updates_applied_.load(); }
    uint64_t updates_dropped() const { return updates_dropped_.load(); }

private:
    static T initial_value(AccountFetcher& fetcher, const std::string& address, const Decoder& decode) {
        auto account_info = fetcher.fetch(address);
        if (!account_info) {
            throw AccountNotFound(address);
        }
        return decode(*account_info);
    }

    void on_update(const AccountInfo& account_info) {
        std::optional<MalformedUpdate> error;
        {
            std::lock_guard lock(dispatch_mutex_);
            if (disposed_) {
                return;
            }

            liveness_.record_activity(feed_id_);

            try {
                cell_.write(decode_(account_info));
                ++updates_applied_;
            } catch (const std::exception& e) {
                ++updates_dropped_;
                error.emplace(address_, e.what());
                SPDLOG_WARN("Watcher '{}' dropped update at slot {}: {}", name_, account_info.slot, e.what());
            }
        }

        // Called unlocked so the callback may dispose() this watcher
        if (error && on_error_) {
            on_error_(*error);
        }
    }

    AccountSubscriber& subscriber_;
    LivenessRegistry& liveness_;
    std::string name_;
    std::string address_;
    Decoder decode_;
    UpdateErrorCallback on_error_;
    SnapshotCell<T> cell_;

    FeedId feed_id_ = 0;
    SubscriptionId subscription_id_ = 0;

    // Serialises update handling against dispose(); readers never take it
    mutable std::mutex dispatch_mutex_;
    bool disposed_ = false;

    std::atomic<uint64_t> updates_applied_{0};
    std::atomic<uint64_t> updates_dropped_{0};
};

/**
 * @brief Watcher whose value is computed from other watchers on every read
 */
template <typename T>
class LambdaWatcher : public Watcher<T> {
public:
    using Accessor = std::function<T()>;

    explicit LambdaWatcher(Accessor accessor)
        : accessor_(std::move(accessor)) {}

    std::shared_ptr<const T> latest() const override {
        return std::make_shared<const T>(accessor_());
    }

private:
    Accessor accessor_;
};

} // namespace book_watch

#endif /* ACCOUNT_WATCHER_HPP_ */
