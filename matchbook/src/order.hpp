#pragma once

#include "types.hpp"

#include <string>
#include <utility>

namespace matchbook {

struct Order {
    OrderId id;          // Unique identifier
    Side side;           // Buy or Sell
    OrderType type;      // Limit, Market, IOC, FOK, GTC, GFD
    Price price;         // Limit price (ignored for market orders)
    Qty qty;             // Original quantity
    Qty remaining;       // Quantity still open
    Timestamp timestamp; // Arrival time (for time priority)
    Timestamp expiry;    // Day boundary for GFD orders, 0 otherwise
    std::string owner;   // Opaque owner tag, may be empty

    // Check if order is fully filled
    [[nodiscard]] bool isFilled() const { return remaining == 0; }

    // Reduce remaining quantity (after partial fill)
    void fill(Qty amount) { remaining -= amount; }
};

// Convenience constructor used by callers and tests
[[nodiscard]] inline Order makeOrder(OrderId id, Side side, OrderType type, Price price, Qty qty,
                                     std::string owner = {})
{
    return Order{id, side, type, price, qty, qty, 0, 0, std::move(owner)};
}

} // namespace matchbook
