/**
 * @file    OrderBookSide.hpp
 * @brief   Decoded book-side slab and its ordered order traversal
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   OrderBookSide holds one decoded side of a market (bids or asks) together
 *   with the raw account it came from and the market scaling used to turn
 *   native integers into UI decimals. orders() walks the tree with an
 *   explicit stack and yields orders best price first: descending for bids,
 *   ascending for asks. The walk fails fast with CorruptTree instead of
 *   following bad indices or cycles.
 */

#pragma once

#ifndef ORDER_BOOK_SIDE_HPP_
#define ORDER_BOOK_SIDE_HPP_

#include "AccountSource.hpp"
#include "BookSideLayout.hpp"
#include "BookWatchTypes.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace book_watch {

class OrderBookSide;

/**
 * @brief Single-pass iterator over the orders of one side
 *
 * Each iterator carries its own stack and visited set; the side itself is
 * never modified, so independent iterations never interfere.
 * @throws CorruptTree from construction or increment on a malformed tree
 */
class OrderIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Order;
    using difference_type = std::ptrdiff_t;
    using pointer = const Order*;
    using reference = const Order&;

    OrderIterator() = default;
    explicit OrderIterator(const OrderBookSide* side);

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    OrderIterator& operator++();

    bool operator==(const OrderIterator& other) const { return side_ == other.side_; }
    bool operator!=(const OrderIterator& other) const { return !(*this == other); }

private:
    void advance();

    const OrderBookSide* side_ = nullptr;
    std::vector<uint32_t> stack_;
    std::vector<bool> visited_;
    Order current_;
};

/**
 * @brief Restartable range of orders; every begin() starts a fresh walk
 */
class OrderRange {
public:
    explicit OrderRange(const OrderBookSide& side) : side_(&side) {}

    OrderIterator begin() const { return OrderIterator(side_); }
    OrderIterator end() const { return OrderIterator(); }

    OrderList to_vector() const;

private:
    const OrderBookSide* side_;
};

class OrderBookSide {
public:
    OrderBookSide(AccountInfo account_info,
                  const BookSideHeader& header,
                  std::vector<Node> nodes,
                  const MarketScaling& scaling);

    /**
     * @brief Decode a raw account
     * @throws DecodeSizeMismatch when the data length is not layout.account_size()
     */
    static OrderBookSide parse(const AccountInfo& account_info,
                               const MarketScaling& scaling,
                               const BookLayout& layout = BookLayout{});

    /**
     * @brief Fetch and decode
     * @throws AccountNotFound when the fetcher has no data at the address
     */
    static OrderBookSide load(AccountFetcher& fetcher,
                              const std::string& address,
                              const MarketScaling& scaling,
                              const BookLayout& layout = BookLayout{});

    OrderRange orders() const { return OrderRange(*this); }

    /**
     * @brief Walk the whole tree and check reachable leaves match leaf_count
     * @throws CorruptTree on the first violation found
     */
    void validate() const;

    OrderSide side() const;

    /**
     * @brief Convert a leaf to UI units with this side's scaling
     */
    Order to_order(const LeafNode& leaf) const;

    const AccountInfo& get_account_info() const { return account_info_; }
    const std::string& get_address() const { return account_info_.address; }
    const Metadata& get_meta_data() const { return header_.meta_data; }
    const MarketScaling& get_scaling() const { return scaling_; }
    uint64_t get_bump_index() const { return header_.bump_index; }
    uint64_t get_free_list_len() const { return header_.free_list_len; }
    uint32_t get_free_list_head() const { return header_.free_list_head; }
    uint32_t get_root_node() const { return header_.root_node; }
    uint64_t get_leaf_count() const { return header_.leaf_count; }
    const std::vector<Node>& get_nodes() const { return nodes_; }

    /**
     * @brief Highest index a traversal may visit, exclusive
     */
    size_t index_limit() const;

    std::string to_string() const;

private:
    AccountInfo account_info_;
    BookSideHeader header_;
    std::vector<Node> nodes_;
    MarketScaling scaling_;
};

/**
 * @brief Free-function form of OrderBookSide::parse
 */
OrderBookSide decode_book_side(const AccountInfo& account_info,
                               const MarketScaling& scaling,
                               const BookLayout& layout = BookLayout{});

} // namespace book_watch

#endif /* ORDER_BOOK_SIDE_HPP_ */
