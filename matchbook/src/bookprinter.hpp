#pragma once

#include "instrument.hpp"
#include "snapshot.hpp"

#include <ostream>
#include <string>

namespace matchbook {

// Fixed-point price as dollars with two decimals, e.g. 100500000 -> "$100.50"
[[nodiscard]] std::string formatPrice(Price price, Price priceScale);

// Side-by-side depth table with best bid/ask and spread footer
void printBook(std::ostream& out, const BookSnapshot& snapshot, const Instrument& instrument, size_t levels);

} // namespace matchbook
