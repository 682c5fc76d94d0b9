#pragma once

#include <cstdint>

namespace matchbook {

// Strong typedefs for domain clarity
using Price = int64_t;      // Micros of currency (e.g., $100.00 = 100000000)
using Qty = uint64_t;       // Quantity in instrument units
using OrderId = uint64_t;   // Unique order identifier (0 = engine assigns)
using Timestamp = uint64_t; // Nanoseconds since epoch (UTC)

constexpr Price kDefaultPriceScale = 1000000;

// Side of the order
enum class Side : uint8_t { Buy = 1, Sell = 2 };

// Order type / time in force
enum class OrderType : uint8_t {
    Limit = 1,
    Market = 2,
    ImmediateOrCancel = 3,
    FillOrKill = 4,
    GoodTillCancel = 5,
    GoodForDay = 6
};

[[nodiscard]] inline Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

// Remainder of these types may rest in the book
[[nodiscard]] inline bool canRest(OrderType type)
{
    return type == OrderType::Limit || type == OrderType::GoodTillCancel || type == OrderType::GoodForDay;
}

[[nodiscard]] inline const char* toString(Side side) { return side == Side::Buy ? "BUY" : "SELL"; }

[[nodiscard]] inline const char* toString(OrderType type)
{
    switch (type) {
    case OrderType::Limit:
        return "LIMIT";
    case OrderType::Market:
        return "MARKET";
    case OrderType::ImmediateOrCancel:
        return "IOC";
    case OrderType::FillOrKill:
        return "FOK";
    case OrderType::GoodTillCancel:
        return "GTC";
    case OrderType::GoodForDay:
        return "GFD";
    }
    return "UNKNOWN";
}

} // namespace matchbook
