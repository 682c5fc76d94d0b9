#pragma once

#include "types.hpp"

namespace matchbook {

struct Trade {
    uint64_t id;          // Engine-wide trade sequence
    OrderId buyOrderId;   // Buy side participant
    OrderId sellOrderId;  // Sell side participant
    OrderId takerOrderId; // Aggressive order
    OrderId makerOrderId; // Passive order (was resting in book)
    Side takerSide;       // Side of the taker
    Price price;          // Execution price (maker's price)
    Qty qty;              // Quantity traded
    Timestamp timestamp;  // Execution time
};

} // namespace matchbook
