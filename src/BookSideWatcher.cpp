/**
 * @file    BookSideWatcher.cpp
 * @brief   Book-side watcher construction
 */

#include "BookSideWatcher.hpp"
#include "spdlog/spdlog.h"

namespace book_watch {

    OrderList decode_orders(const AccountInfo& account_info,
                            const MarketScaling& scaling,
                            const BookLayout& layout) {
        return OrderBookSide::parse(account_info, scaling, layout).orders().to_vector();
    }

    std::unique_ptr<BookSideWatcher> build_book_side_watcher(AccountFetcher& fetcher,
                                                             AccountSubscriber& subscriber,
                                                             LivenessRegistry& liveness,
                                                             const std::string& name,
                                                             const std::string& address,
                                                             const MarketScaling& scaling,
                                                             const BookLayout& layout,
                                                             UpdateErrorCallback on_error) {
        auto decode = [scaling, layout](const AccountInfo& account_info) {
            return decode_orders(account_info, scaling, layout);
        };

        return std::make_unique<BookSideWatcher>(fetcher, subscriber, liveness, name, address,
                                                 decode, std::move(on_error));
    }

    MarketBookWatcher::MarketBookWatcher(AccountFetcher& fetcher,
                                         AccountSubscriber& subscriber,
                                         LivenessRegistry& liveness,
                                         const MarketConfig& market,
                                         const BookLayout& layout,
                                         UpdateErrorCallback on_error)
        : market_(market) {
        bids_ = build_book_side_watcher(fetcher, subscriber, liveness, market_.name + "_bids",
                                        market_.bids_address, market_.scaling, layout, on_error);
        // bids_ is disposed by its destructor if the asks side throws
        asks_ = build_book_side_watcher(fetcher, subscriber, liveness, market_.name + "_asks",
                                        market_.asks_address, market_.scaling, layout, on_error);

        SPDLOG_INFO("Market {} watching bids={} ({} orders), asks={} ({} orders)",
                    market_.name, market_.bids_address, bids()->size(),
                    market_.asks_address, asks()->size());
    }

    void MarketBookWatcher::dispose() {
        bids_->dispose();
        asks_->dispose();
    }

} // namespace book_watch
