#pragma once

#include "orderarena.hpp"
#include "types.hpp"

#include <list>

namespace matchbook {

class PriceLevel {
public:
    // Stable handle to a queue entry, valid until that entry is erased
    using Position = std::list<Slot>::iterator;

    explicit PriceLevel(Price price);

    // Getters
    [[nodiscard]] Price price() const { return m_price; }
    [[nodiscard]] Qty totalQty() const { return m_totalQty; }
    [[nodiscard]] int orderCount() const { return static_cast<int>(m_orders.size()); }
    [[nodiscard]] bool empty() const { return m_orders.empty(); }

    // Add order to back of queue (time priority)
    Position append(Slot slot, Qty qty);

    // Remove the entry at pos, O(1)
    void erase(Position pos, Qty qty);

    // Decrease aggregate after an in-place fill or reduction
    void reduce(Qty qty);

    // Get front order slot (oldest)
    [[nodiscard]] Slot front() const { return m_orders.front(); }

    // Iterator access (for depth queries and invariant checks)
    [[nodiscard]] auto begin() const { return m_orders.begin(); }
    [[nodiscard]] auto end() const { return m_orders.end(); }

private:
    Price m_price;
    Qty m_totalQty;
    std::list<Slot> m_orders; // FIFO queue (list for stable iterators)
};

} // namespace matchbook
