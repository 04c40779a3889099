/**
 * @file    BookWatchTypes.cpp
 * @brief   Helpers for the core data types
 */

#include "BookWatchTypes.hpp"

#include <algorithm>
#include <ios>
#include <limits>

namespace book_watch {

    namespace {
        constexpr char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    }

    std::string PublicKey::to_base58() const {
        // Leading zero bytes map to leading '1's
        size_t zeros = 0;
        while (zeros < bytes.size() && bytes[zeros] == 0) {
            ++zeros;
        }

        // log(256) / log(58) ~ 1.37
        std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
        size_t length = 0;

        for (size_t i = zeros; i < bytes.size(); ++i) {
            uint32_t carry = bytes[i];
            size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
                carry += 256u * (*it);
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            length = j;
        }

        auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
        while (it != digits.end() && *it == 0) {
            ++it;
        }

        std::string result(zeros, '1');
        result.reserve(zeros + static_cast<size_t>(digits.end() - it));
        for (; it != digits.end(); ++it) {
            result += kBase58Alphabet[*it];
        }
        return result;
    }

    Decimal power_of_ten(int32_t exponent) {
        // Parsed rather than divided so negative powers stay exact
        const std::string literal = "1e" + std::to_string(exponent);
        return Decimal(literal.c_str());
    }

    std::string format_decimal(const Decimal& value) {
        std::string text = value.str(std::numeric_limits<Decimal>::digits10, std::ios_base::fixed);

        if (text.find('.') != std::string::npos) {
            while (!text.empty() && text.back() == '0') {
                text.pop_back();
            }
            if (!text.empty() && text.back() == '.') {
                text.pop_back();
            }
        }
        if (text == "-0") {
            text = "0";
        }
        return text;
    }

    std::string to_string(uint128_t value) {
        if (value == 0) return "0";

        std::string text;
        while (value != 0) {
            text += static_cast<char>('0' + static_cast<int>(value % 10));
            value /= 10;
        }
        std::reverse(text.begin(), text.end());
        return text;
    }

    std::string to_string(OrderSide side) {
        switch (side) {
            case OrderSide::Buy: return "buy";
            case OrderSide::Sell: return "sell";
            default: return "unknown";
        }
    }

    std::string to_string(OrderType type) {
        switch (type) {
            case OrderType::Limit: return "limit";
            case OrderType::ImmediateOrCancel: return "ioc";
            case OrderType::PostOnly: return "post_only";
            case OrderType::Market: return "market";
            case OrderType::PostOnlySlide: return "post_only_slide";
            default: return "unknown";
        }
    }

    OrderType order_type_from_wire(uint8_t raw) {
        switch (raw) {
            case 0: return OrderType::Limit;
            case 1: return OrderType::ImmediateOrCancel;
            case 2: return OrderType::PostOnly;
            case 3: return OrderType::Market;
            case 4: return OrderType::PostOnlySlide;
            default: return OrderType::Unknown;
        }
    }

} // namespace book_watch
