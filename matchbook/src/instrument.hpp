#pragma once

#include "types.hpp"

#include <string>

namespace matchbook {

struct Instrument {
    std::string symbol;      // "BTCUSDT", "AAPL", etc.
    std::string description; // "Bitcoin / Tether"
    Price tickSize;          // Minimum price increment (e.g., 10000 = $0.01)
    Qty lotSize;             // Minimum quantity increment
    Price priceScale;        // Multiplier for fixed-point (1000000)

    // Validate price is on tick
    [[nodiscard]] bool isValidPrice(Price price) const { return tickSize > 0 && (price % tickSize) == 0; }

    // Validate quantity is on lot
    [[nodiscard]] bool isValidQty(Qty qty) const { return lotSize > 0 && (qty % lotSize) == 0; }
};

// Instrument accepting any positive price and quantity
[[nodiscard]] inline Instrument defaultInstrument() { return Instrument{"DEFAULT", "", 1, 1, kDefaultPriceScale}; }

} // namespace matchbook
