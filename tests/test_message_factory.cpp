#include <gtest/gtest.h>

#include "MessageFactory.hpp"

#include <nlohmann/json.hpp>

using namespace book_watch;

namespace {

Order make_order(OrderSide side, const char* price, const char* quantity, uint64_t client_id) {
    Order order;
    order.id = (static_cast<uint128_t>(1) << 64) | client_id;
    order.client_order_id = client_id;
    order.side = side;
    order.price = Decimal(price);
    order.quantity = Decimal(quantity);
    order.order_type = OrderType::Limit;
    return order;
}

} // namespace

TEST(MessageFactory, BookJsonCarriesBothSides) {
    MessageFactory factory;
    OrderList bids{make_order(OrderSide::Buy, "20.5", "1", 1), make_order(OrderSide::Buy, "20", "2.25", 2)};
    OrderList asks{make_order(OrderSide::Sell, "21", "0.5", 3)};

    const auto j = nlohmann::json::parse(factory.create_book_json("BTC-PERP", bids, asks, 7, 1700000000123456ULL));

    EXPECT_EQ(j["market"], "BTC-PERP");
    EXPECT_EQ(j["message_type"], "book");
    EXPECT_EQ(j["sequence"], 7);
    EXPECT_EQ(j["timestamp"], 1700000000123456ULL);
    EXPECT_EQ(j["timestamp_iso"], "2023-11-14T22:13:20.123Z");

    ASSERT_EQ(j["bids"].size(), 2u);
    ASSERT_EQ(j["asks"].size(), 1u);
    EXPECT_EQ(j["bids"][0]["price"], "20.5");
    EXPECT_EQ(j["bids"][1]["quantity"], "2.25");
    EXPECT_EQ(j["asks"][0]["side"], "sell");

    EXPECT_EQ(j["book_stats"]["total_bids"], 2);
    EXPECT_EQ(j["book_stats"]["total_asks"], 1);
    EXPECT_EQ(j["book_stats"]["best_bid"], "20.5");
    EXPECT_EQ(j["book_stats"]["best_ask"], "21");
}

TEST(MessageFactory, OrderJsonFields) {
    Order order = make_order(OrderSide::Buy, "0.02", "5", 9);
    order.order_type = OrderType::PostOnly;

    const auto j = MessageFactory::order_to_json(order);
    EXPECT_EQ(j["id"], "18446744073709551625");
    EXPECT_EQ(j["client_order_id"], 9);
    EXPECT_EQ(j["owner"], "11111111111111111111111111111111");
    EXPECT_EQ(j["side"], "buy");
    EXPECT_EQ(j["price"], "0.02");
    EXPECT_EQ(j["quantity"], "5");
    EXPECT_EQ(j["order_type"], "post_only");
}

TEST(MessageFactory, DepthLimitsEachSide) {
    MessageFactory::JsonConfig config;
    config.depth = 1;
    MessageFactory factory(config);

    OrderList bids{make_order(OrderSide::Buy, "3", "1", 1), make_order(OrderSide::Buy, "2", "1", 2)};
    OrderList asks{make_order(OrderSide::Sell, "4", "1", 3), make_order(OrderSide::Sell, "5", "1", 4)};

    const auto j = nlohmann::json::parse(factory.create_book_json("M", bids, asks, 1, 0));
    EXPECT_EQ(j["bids"].size(), 1u);
    EXPECT_EQ(j["asks"].size(), 1u);
    // Totals still describe the whole book
    EXPECT_EQ(j["book_stats"]["total_bids"], 2);
}

TEST(MessageFactory, EmptyBookOmitsBestPrices) {
    MessageFactory::JsonConfig config;
    config.include_sequence = false;
    config.include_timestamp = false;
    MessageFactory factory(config);

    const auto j = nlohmann::json::parse(factory.create_book_json("M", {}, {}, 1, 0));
    EXPECT_FALSE(j.contains("sequence"));
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_FALSE(j["book_stats"].contains("best_bid"));
    EXPECT_FALSE(j["book_stats"].contains("best_ask"));
    EXPECT_TRUE(j["bids"].is_array());
}

TEST(MessageRouter, RoutesByMarket) {
    MessageRouter router;
    const auto msg = router.route_book("SOL-PERP", "{}");
    EXPECT_EQ(msg.topic, "order_book.SOL-PERP");
    EXPECT_EQ(msg.key, "SOL-PERP");
    EXPECT_EQ(msg.payload, "{}");

    MessageRouter::TopicConfig config;
    config.snapshot_topic_prefix = "books.";
    EXPECT_EQ(MessageRouter(config).route_book("X", "").topic, "books.X");
}
