#include <gtest/gtest.h>

#include "BookSideBuilder.hpp"
#include "BookWatchErrors.hpp"
#include "InMemoryAccountSource.hpp"
#include "OrderBookSide.hpp"

#include <algorithm>
#include <functional>
#include <random>
#include <set>

using namespace book_watch;
using book_watch::test_support::BookSideBuilder;
using book_watch::test_support::InMemoryAccountSource;
using book_watch::test_support::LeafFields;

namespace {

MarketScaling unit_scaling() {
    return MarketScaling{0, 0, 1, 1};
}

std::vector<uint64_t> prices_of(const OrderList& orders) {
    std::vector<uint64_t> prices;
    for (const auto& order : orders) {
        prices.push_back(order.price.convert_to<uint64_t>());
    }
    return prices;
}

std::vector<LeafFields> sample_leaves() {
    return {
        LeafFields{100, 1, 10, 1, 0, 1},
        LeafFields{300, 2, 30, 2, 0, 2},
        LeafFields{200, 3, 20, 3, 0, 3},
        LeafFields{50, 4, 5, 4, 0, 4},
    };
}

} // namespace

TEST(OrderBookSide, ZeroLeafCountYieldsNothing) {
    BookSideBuilder builder(DataType::Bids, 16);
    // Root points at garbage; leaf_count = 0 must short-circuit
    builder.set_root(9999).set_leaf_count(0);

    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());
    EXPECT_TRUE(side.orders().to_vector().empty());
    EXPECT_NO_THROW(side.validate());
}

TEST(OrderBookSide, BidsBestPriceFirst) {
    BookSideBuilder builder(DataType::Bids, 16);
    builder.add_tree(sample_leaves());

    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());
    EXPECT_EQ(side.side(), OrderSide::Buy);

    const auto orders = side.orders().to_vector();
    EXPECT_EQ(prices_of(orders), (std::vector<uint64_t>{300, 200, 100, 50}));
    for (const auto& order : orders) {
        EXPECT_EQ(order.side, OrderSide::Buy);
    }
}

TEST(OrderBookSide, AsksBestPriceFirst) {
    BookSideBuilder builder(DataType::Asks, 16);
    builder.add_tree(sample_leaves());

    auto side = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout());
    EXPECT_EQ(side.side(), OrderSide::Sell);
    EXPECT_EQ(prices_of(side.orders().to_vector()), (std::vector<uint64_t>{50, 100, 200, 300}));
}

TEST(OrderBookSide, SingleLeafRoot) {
    BookSideBuilder builder(DataType::Asks, 4);
    builder.add_leaf(LeafFields{42, 7, 3, 11, 1, 0});
    builder.set_root(0);

    auto orders = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout()).orders().to_vector();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].client_order_id, 11u);
    EXPECT_EQ(orders[0].order_type, OrderType::ImmediateOrCancel);
}

TEST(OrderBookSide, EveryLeafEmittedExactlyOnce) {
    std::mt19937_64 rng(7);
    std::vector<LeafFields> leaves;
    std::set<uint64_t> prices;
    while (leaves.size() < 200) {
        const uint64_t price = 1 + rng() % 100000;
        if (!prices.insert(price).second) continue;
        leaves.push_back(LeafFields{price, leaves.size(), 1, leaves.size(), 0, 0});
    }

    BookSideBuilder builder(DataType::Bids);
    builder.add_tree(leaves);
    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());

    const auto emitted = prices_of(side.orders().to_vector());
    ASSERT_EQ(emitted.size(), leaves.size());
    EXPECT_TRUE(std::is_sorted(emitted.begin(), emitted.end(), std::greater<uint64_t>()));
    EXPECT_EQ(std::set<uint64_t>(emitted.begin(), emitted.end()), prices);
    EXPECT_NO_THROW(side.validate());
}

TEST(OrderBookSide, TraversalIsRestartable) {
    BookSideBuilder builder(DataType::Asks, 16);
    builder.add_tree(sample_leaves());
    auto side = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout());

    const auto first = side.orders().to_vector();
    const auto second = side.orders().to_vector();
    EXPECT_EQ(first, second);

    // A partially consumed traversal does not disturb a fresh one
    auto range = side.orders();
    auto it = range.begin();
    ++it;
    EXPECT_EQ(prices_of(side.orders().to_vector()).front(), 50u);
    EXPECT_EQ(it->price.convert_to<uint64_t>(), 100u);
}

TEST(OrderBookSide, ScalesPriceAndQuantityExactly) {
    BookSideBuilder builder(DataType::Bids, 4);
    builder.add_leaf(LeafFields{500, 1, 200, 0, 0, 0});
    builder.set_root(0);

    const MarketScaling scaling{6, 6, 100, 1};
    auto orders = OrderBookSide::parse(builder.account("bids"), scaling, builder.layout()).orders().to_vector();
    ASSERT_EQ(orders.size(), 1u);

    EXPECT_EQ(orders[0].price, Decimal(5));
    EXPECT_EQ(orders[0].quantity, Decimal("0.02"));
    EXPECT_EQ(format_decimal(orders[0].price), "5");
    EXPECT_EQ(format_decimal(orders[0].quantity), "0.02");
}

TEST(OrderBookSide, ScalesAcrossDifferentDecimals) {
    BookSideBuilder builder(DataType::Asks, 4);
    builder.add_leaf(LeafFields{2345, 1, 3, 0, 0, 0});
    builder.set_root(0);

    // 9 base decimals, 6 quote decimals
    const MarketScaling scaling{9, 6, 10000000, 100};
    auto orders = OrderBookSide::parse(builder.account("asks"), scaling, builder.layout()).orders().to_vector();
    ASSERT_EQ(orders.size(), 1u);

    // 2345 * 100 * 10^3 / 10^7 = 23.45
    EXPECT_EQ(format_decimal(orders[0].price), "23.45");
    // 3 * 10^7 * 10^-9 = 0.03
    EXPECT_EQ(format_decimal(orders[0].quantity), "0.03");
}

TEST(OrderBookSide, QuantityAboveSignedRangeStaysPositive) {
    BookSideBuilder builder(DataType::Bids, 4);
    builder.add_leaf(LeafFields{1, 1, 9223372036854775808u, 0, 0, 0});
    builder.set_root(0);

    auto orders = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout()).orders().to_vector();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(format_decimal(orders[0].quantity), "9223372036854775808");
}

TEST(OrderBookSide, OrderCarriesLeafIdentity) {
    BookSideBuilder builder(DataType::Asks, 4);
    builder.add_leaf(LeafFields{77, 12345, 1, 555, 2, 0});
    builder.set_root(0);

    auto orders = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout()).orders().to_vector();
    ASSERT_EQ(orders.size(), 1u);

    const uint128_t expected_id = (static_cast<uint128_t>(77) << 64) | 12345;
    EXPECT_TRUE(orders[0].id == expected_id);
    EXPECT_EQ(orders[0].client_order_id, 555u);
    EXPECT_EQ(orders[0].order_type, OrderType::PostOnly);
    EXPECT_EQ(orders[0].owner.to_base58(), "11111111111111111111111111111111");
}

TEST(OrderBookSide, ChildBeyondBumpIndexIsCorrupt) {
    BookSideBuilder builder(DataType::Bids, 16);
    const uint32_t leaf = builder.add_leaf(LeafFields{1, 1, 1, 0, 0, 0});
    const uint32_t inner = builder.add_inner(leaf, 7);
    builder.set_root(inner).set_leaf_count(2);

    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());
    try {
        side.orders().to_vector();
        FAIL() << "expected CorruptTree";
    } catch (const CorruptTree& e) {
        EXPECT_EQ(e.index(), 7u);
    }
}

TEST(OrderBookSide, CycleIsCorrupt) {
    BookSideBuilder builder(DataType::Bids, 16);
    const uint32_t leaf = builder.add_leaf(LeafFields{1, 1, 1, 0, 0, 0});
    // Inner node 1 lists itself as its greater child
    builder.add_inner(leaf, 1);
    builder.set_root(1).set_leaf_count(1);

    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());
    EXPECT_THROW(side.orders().to_vector(), CorruptTree);
}

TEST(OrderBookSide, ReachableFreeNodeIsCorrupt) {
    BookSideBuilder builder(DataType::Asks, 16);
    const uint32_t free_node = builder.add_free(0, true);
    const uint32_t leaf = builder.add_leaf(LeafFields{1, 1, 1, 0, 0, 0});
    const uint32_t inner = builder.add_inner(free_node, leaf);
    builder.set_root(inner);

    auto side = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout());
    EXPECT_THROW(side.orders().to_vector(), CorruptTree);
}

TEST(OrderBookSide, ReachableUninitializedNodeIsCorrupt) {
    BookSideBuilder builder(DataType::Asks, 16);
    const uint32_t leaf = builder.add_leaf(LeafFields{1, 1, 1, 0, 0, 0});
    const uint32_t inner = builder.add_inner(leaf, 5);
    builder.set_root(inner).set_bump_index(10);

    auto side = OrderBookSide::parse(builder.account("asks"), unit_scaling(), builder.layout());
    EXPECT_THROW(side.orders().to_vector(), CorruptTree);
}

TEST(OrderBookSide, ValidateComparesLeafCount) {
    BookSideBuilder builder(DataType::Bids, 16);
    builder.add_tree(sample_leaves());
    builder.set_leaf_count(5);

    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());
    EXPECT_THROW(side.validate(), CorruptTree);
}

TEST(OrderBookSide, ParseRejectsWrongLength) {
    BookSideBuilder builder(DataType::Bids, 16);
    auto account = builder.account("bids");
    account.data.pop_back();
    EXPECT_THROW(OrderBookSide::parse(account, unit_scaling(), builder.layout()), DecodeSizeMismatch);
}

TEST(OrderBookSide, LoadFetchesThroughFetcher) {
    InMemoryAccountSource source;
    BookSideBuilder builder(DataType::Asks, 16);
    builder.add_tree(sample_leaves());
    source.put(builder.account("asks-address"));

    auto side = OrderBookSide::load(source, "asks-address", unit_scaling(), builder.layout());
    EXPECT_EQ(side.get_address(), "asks-address");
    EXPECT_EQ(side.orders().to_vector().size(), 4u);

    EXPECT_THROW(OrderBookSide::load(source, "missing", unit_scaling(), builder.layout()), AccountNotFound);
}

TEST(OrderBookSide, ToStringListsOrders) {
    BookSideBuilder builder(DataType::Bids, 16);
    builder.add_tree(sample_leaves());
    auto side = OrderBookSide::parse(builder.account("bids"), unit_scaling(), builder.layout());

    const std::string text = side.to_string();
    EXPECT_NE(text.find("Leaf Count: 4"), std::string::npos);
    EXPECT_NE(text.find("buy 30 at 300"), std::string::npos);
}
