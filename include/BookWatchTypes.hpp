/**
 * @file    BookWatchTypes.hpp
 * @brief   Core data types shared by the book-side decoder and watchers
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Defines the raw account container, order and side enumerations, market
 *   scaling parameters and the decimal type used for UI-scale prices and
 *   quantities.
 */

#pragma once

#ifndef BOOK_WATCH_TYPES_HPP_
#define BOOK_WATCH_TYPES_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace book_watch {

/**
 * @brief Decimal type for UI-scale values (no binary floating point)
 */
using Decimal = boost::multiprecision::cpp_dec_float_50;

using uint128_t = __uint128_t;

/**
 * @brief 32-byte ledger account identifier
 */
struct PublicKey {
    std::array<uint8_t, 32> bytes{};

    /**
     * @brief Base58 rendering, the usual ledger address notation
     */
    std::string to_base58() const;

    bool operator==(const PublicKey& other) const { return bytes == other.bytes; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }
};

/**
 * @brief Order side enumeration
 */
enum class OrderSide : uint8_t {
    Buy = 0,
    Sell = 1
};

/**
 * @brief Order type as recorded on the leaf
 */
enum class OrderType : uint8_t {
    Limit = 0,
    ImmediateOrCancel = 1,
    PostOnly = 2,
    Market = 3,
    PostOnlySlide = 4,
    Unknown = 255
};

/**
 * @brief Account data type discriminant carried in the metadata header
 */
enum class DataType : uint8_t {
    MangoGroup = 0,
    MangoAccount = 1,
    RootBank = 2,
    NodeBank = 3,
    PerpMarket = 4,
    Bids = 5,
    Asks = 6,
    MangoCache = 7,
    EventQueue = 8
};

/**
 * @brief Raw account bytes as delivered by the transport
 */
struct AccountInfo {
    std::string address;
    std::string owner;
    uint64_t slot = 0;
    std::vector<uint8_t> data;
};

/**
 * @brief Native-to-UI conversion parameters of one market
 *
 * Supplied by configuration, never decoded from the book-side account.
 */
struct MarketScaling {
    int32_t base_decimals = 0;
    int32_t quote_decimals = 0;
    int64_t base_lot_size = 1;
    int64_t quote_lot_size = 1;
};

/**
 * @brief One resting order in UI units
 */
struct Order {
    uint128_t id = 0;
    uint64_t client_order_id = 0;
    PublicKey owner;
    OrderSide side = OrderSide::Buy;
    Decimal price;
    Decimal quantity;
    OrderType order_type = OrderType::Unknown;

    bool operator==(const Order& other) const {
        return id == other.id &&
               client_order_id == other.client_order_id &&
               owner == other.owner &&
               side == other.side &&
               price == other.price &&
               quantity == other.quantity &&
               order_type == other.order_type;
    }

    bool operator!=(const Order& other) const {
        return !(*this == other);
    }
};

using OrderList = std::vector<Order>;

/**
 * @brief 10^exponent, exact for negative exponents too
 */
Decimal power_of_ten(int32_t exponent);

/**
 * @brief Fixed-notation rendering with trailing zeros trimmed ("5", "0.02")
 */
std::string format_decimal(const Decimal& value);

std::string to_string(uint128_t value);
std::string to_string(OrderSide side);
std::string to_string(OrderType type);

OrderType order_type_from_wire(uint8_t raw);

} // namespace book_watch

#endif /* BOOK_WATCH_TYPES_HPP_ */
