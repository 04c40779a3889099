/**
 * @file    OrderBookSide.cpp
 * @brief   Book-side decoding, traversal and diagnostics
 */

#include "OrderBookSide.hpp"
#include "BookWatchErrors.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <utility>

namespace book_watch {

    // OrderIterator implementation

    OrderIterator::OrderIterator(const OrderBookSide* side)
        : side_(side) {
        if (!side_ || side_->get_leaf_count() == 0) {
            side_ = nullptr;
            return;
        }

        visited_.assign(side_->index_limit(), false);
        stack_.push_back(side_->get_root_node());
        advance();
    }

    OrderIterator& OrderIterator::operator++() {
        advance();
        return *this;
    }

    void OrderIterator::advance() {
        const OrderSide order_side = side_->side();
        const auto& nodes = side_->get_nodes();

        while (!stack_.empty()) {
            const uint32_t index = stack_.back();
            stack_.pop_back();

            if (index >= visited_.size()) {
                throw CorruptTree(index, "index beyond allocated nodes (" + std::to_string(visited_.size()) + ")");
            }
            if (visited_[index]) {
                throw CorruptTree(index, "node reached twice");
            }
            visited_[index] = true;

            bool emitted = false;
            std::visit([&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, LeafNode>) {
                    current_ = side_->to_order(node);
                    emitted = true;
                } else if constexpr (std::is_same_v<T, InnerNode>) {
                    // child[0] holds the lesser keys; pop order yields best price first
                    if (order_side == OrderSide::Buy) {
                        stack_.push_back(node.children[0]);
                        stack_.push_back(node.children[1]);
                    } else {
                        stack_.push_back(node.children[1]);
                        stack_.push_back(node.children[0]);
                    }
                } else if constexpr (std::is_same_v<T, FreeNode>) {
                    throw CorruptTree(index, "free node reachable from root");
                } else {
                    throw CorruptTree(index, "uninitialized node reachable from root");
                }
            }, nodes[index]);

            if (emitted) {
                return;
            }
        }

        side_ = nullptr;
    }

    // OrderRange implementation

    OrderList OrderRange::to_vector() const {
        OrderList result;
        result.reserve(static_cast<size_t>(std::min<uint64_t>(side_->get_leaf_count(), side_->index_limit())));
        for (const auto& order : *this) {
            result.push_back(order);
        }
        return result;
    }

    // OrderBookSide implementation

    OrderBookSide::OrderBookSide(AccountInfo account_info,
                                 const BookSideHeader& header,
                                 std::vector<Node> nodes,
                                 const MarketScaling& scaling)
        : account_info_(std::move(account_info))
        , header_(header)
        , nodes_(std::move(nodes))
        , scaling_(scaling) {
    }

    OrderBookSide OrderBookSide::parse(const AccountInfo& account_info,
                                       const MarketScaling& scaling,
                                       const BookLayout& layout) {
        BookSideHeader header;
        std::vector<Node> nodes;
        decode_slab(account_info.data, layout, header, nodes);

        SPDLOG_DEBUG("Decoded book side {}: data_type={}, bump_index={}, root={}, leaf_count={}",
                     account_info.address, header.meta_data.data_type, header.bump_index,
                     header.root_node, header.leaf_count);

        return OrderBookSide(account_info, header, std::move(nodes), scaling);
    }

    OrderBookSide OrderBookSide::load(AccountFetcher& fetcher,
                                      const std::string& address,
                                      const MarketScaling& scaling,
                                      const BookLayout& layout) {
        auto account_info = fetcher.fetch(address);
        if (!account_info) {
            throw AccountNotFound(address);
        }
        return parse(*account_info, scaling, layout);
    }

    void OrderBookSide::validate() const {
        uint64_t leaves = 0;
        const OrderRange range = orders();
        for (auto it = range.begin(); it != range.end(); ++it) {
            ++leaves;
        }

        if (leaves != header_.leaf_count) {
            throw CorruptTree(header_.root_node,
                              "reachable leaves (" + std::to_string(leaves) +
                              ") differ from leaf_count (" + std::to_string(header_.leaf_count) + ")");
        }
    }

    OrderSide OrderBookSide::side() const {
        return header_.meta_data.is_bids() ? OrderSide::Buy : OrderSide::Sell;
    }

    Order OrderBookSide::to_order(const LeafNode& leaf) const {
        const Decimal native_to_ui = power_of_ten(scaling_.base_decimals - scaling_.quote_decimals);
        const Decimal base_factor = power_of_ten(-scaling_.base_decimals);

        Order order;
        order.id = leaf.key;
        order.client_order_id = leaf.client_order_id;
        order.owner = leaf.owner;
        order.side = side();
        order.price = Decimal(leaf.price()) * Decimal(scaling_.quote_lot_size) * native_to_ui
                      / Decimal(scaling_.base_lot_size);
        order.quantity = Decimal(leaf.quantity) * Decimal(scaling_.base_lot_size) * base_factor;
        order.order_type = order_type_from_wire(leaf.order_type);
        return order;
    }

    size_t OrderBookSide::index_limit() const {
        return static_cast<size_t>(std::min<uint64_t>(header_.bump_index, nodes_.size()));
    }

    std::string OrderBookSide::to_string() const {
        std::ostringstream ss;
        ss << "OrderBookSide [" << account_info_.address << "]\n"
           << "    Data Type: " << static_cast<int>(header_.meta_data.data_type)
           << " (" << book_watch::to_string(side()) << "), Version: "
           << static_cast<int>(header_.meta_data.version)
           << ", Initialized: " << (header_.meta_data.is_initialized ? "true" : "false") << "\n"
           << "    Bump Index: " << header_.bump_index << "\n"
           << "    Free List: " << header_.free_list_head << " (head) "
           << header_.free_list_len << " (length)\n"
           << "    Root Node: " << header_.root_node << "\n"
           << "    Leaf Count: " << header_.leaf_count << "\n";

        for (const auto& order : orders()) {
            ss << "        " << book_watch::to_string(order.side) << " "
               << format_decimal(order.quantity) << " at " << format_decimal(order.price)
               << " [ID: " << book_watch::to_string(order.id)
               << " / " << order.client_order_id << "] " << book_watch::to_string(order.order_type)
               << " owner " << order.owner.to_base58() << "\n";
        }
        return ss.str();
    }

    OrderBookSide decode_book_side(const AccountInfo& account_info,
                                   const MarketScaling& scaling,
                                   const BookLayout& layout) {
        return OrderBookSide::parse(account_info, scaling, layout);
    }

} // namespace book_watch
