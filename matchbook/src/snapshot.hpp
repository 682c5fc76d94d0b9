#pragma once

#include "booklevel.hpp"
#include "types.hpp"

#include <vector>

namespace matchbook {

// Point-in-time view of the top of book, best level first on each side
struct BookSnapshot {
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
    Timestamp timestamp = 0; // Clock reading when the copy was taken
    uint64_t sequence = 0;   // Number of book mutations applied before the copy
};

} // namespace matchbook
