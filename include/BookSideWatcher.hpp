/**
 * @file    BookSideWatcher.hpp
 * @brief   Watchers that keep the latest ordered orders of a market
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Wires the book-side decoder and traversal into AccountWatcher so each
 *   market side exposes its latest price-sorted order list. MarketBookWatcher
 *   groups the bid and ask watchers of one market.
 */

#pragma once

#ifndef BOOK_SIDE_WATCHER_HPP_
#define BOOK_SIDE_WATCHER_HPP_

#include "AccountWatcher.hpp"
#include "BookSideLayout.hpp"
#include "BookWatchTypes.hpp"
#include "OrderBookSide.hpp"

#include <memory>
#include <string>

namespace book_watch {

using BookSideWatcher = AccountWatcher<OrderList>;

/**
 * @brief Addresses and scaling of one market
 */
struct MarketConfig {
    std::string name;
    std::string bids_address;
    std::string asks_address;
    MarketScaling scaling;
};

/**
 * @brief Decode a book-side account straight to its ordered orders
 * @throws DecodeSizeMismatch, CorruptTree
 */
OrderList decode_orders(const AccountInfo& account_info,
                        const MarketScaling& scaling,
                        const BookLayout& layout);

/**
 * @brief Watcher over one book side
 * @throws AccountNotFound when the side account does not exist
 */
std::unique_ptr<BookSideWatcher> build_book_side_watcher(AccountFetcher& fetcher,
                                                         AccountSubscriber& subscriber,
                                                         LivenessRegistry& liveness,
                                                         const std::string& name,
                                                         const std::string& address,
                                                         const MarketScaling& scaling,
                                                         const BookLayout& layout = BookLayout{},
                                                         UpdateErrorCallback on_error = nullptr);

/**
 * @brief Bid and ask watchers of one market
 */
class MarketBookWatcher {
public:
    /**
     * @throws AccountNotFound if either side is missing; nothing stays subscribed
     */
    MarketBookWatcher(AccountFetcher& fetcher,
                      AccountSubscriber& subscriber,
                      LivenessRegistry& liveness,
                      const MarketConfig& market,
                      const BookLayout& layout = BookLayout{},
                      UpdateErrorCallback on_error = nullptr);

    const MarketConfig& get_market() const { return market_; }

    std::shared_ptr<const OrderList> bids() const { return bids_->latest(); }
    std::shared_ptr<const OrderList> asks() const { return asks_->latest(); }

    BookSideWatcher& bids_watcher() { return *bids_; }
    BookSideWatcher& asks_watcher() { return *asks_; }

    void dispose();

private:
    MarketConfig market_;
    std::unique_ptr<BookSideWatcher> bids_;
    std::unique_ptr<BookSideWatcher> asks_;
};

} // namespace book_watch

#endif /* BOOK_SIDE_WATCHER_HPP_ */
