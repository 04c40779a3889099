/**
 * @file    AccountSource.hpp
 * @brief   Transport contracts consumed by the watchers
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   AccountFetcher answers "what are the bytes at this address now";
 *   AccountSubscriber pushes every later change of an address to a callback.
 *   KafkaAccountFeed implements both; tests use an in-memory source.
 */

#pragma once

#ifndef ACCOUNT_SOURCE_HPP_
#define ACCOUNT_SOURCE_HPP_

#include "BookWatchTypes.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace book_watch {

using SubscriptionId = uint64_t;

/**
 * @brief Callback invoked once per delivered account update
 */
using AccountCallback = std::function<void(const AccountInfo&)>;

class AccountFetcher {
public:
    virtual ~AccountFetcher() = default;

    /**
     * @brief Synchronous fetch
     * @return The account, or std::nullopt when nothing exists at the address
     */
    virtual std::optional<AccountInfo> fetch(const std::string& address) = 0;
};

class AccountSubscriber {
public:
    virtual ~AccountSubscriber() = default;

    /**
     * @brief Start delivering updates of `address` to `callback`
     *
     * Updates for one address are delivered in arrival order on the
     * subscriber's delivery thread.
     */
    virtual SubscriptionId subscribe(const std::string& address, AccountCallback callback) = 0;

    /**
     * @brief Stop delivery; must not return while the callback is running
     *        on another thread. Unknown ids are ignored.
     */
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace book_watch

#endif /* ACCOUNT_SOURCE_HPP_ */
