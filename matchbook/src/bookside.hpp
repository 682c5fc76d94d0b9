#pragma once

#include "booklevel.hpp"
#include "order.hpp"
#include "orderindex.hpp"
#include "pricelevel.hpp"

#include <map>
#include <optional>
#include <vector>

namespace matchbook {

// Best price first: descending for bids, ascending for asks
struct PriceOrder {
    Side side;

    bool operator()(Price lhs, Price rhs) const { return side == Side::Buy ? lhs > rhs : lhs < rhs; }
};

// One side of the book: price levels ordered best first
class BookSide {
public:
    using Levels = std::map<Price, PriceLevel, PriceOrder>;

    explicit BookSide(Side side);

    [[nodiscard]] Side side() const { return m_side; }
    [[nodiscard]] bool empty() const { return m_levels.empty(); }
    [[nodiscard]] size_t levelCount() const { return m_levels.size(); }

    // Append order to the tail of its price level, creating the level if absent
    OrderLocation insert(Slot slot, const Order& order);

    // Remove a resting order with the given remaining quantity, dropping an emptied level
    void remove(const OrderLocation& location, Qty remaining);

    // Decrement order in place; removes it when it reaches zero. Returns true if removed.
    bool reduce(const OrderLocation& location, Order& order, Qty amount);

    // Best level, or nullptr if the side is empty
    [[nodiscard]] PriceLevel* peekBest();
    [[nodiscard]] const PriceLevel* peekBest() const;
    [[nodiscard]] std::optional<Price> bestPrice() const;

    // Would an opposing order with this limit trade against a level at levelPrice?
    [[nodiscard]] bool crosses(Price levelPrice, Price limit, OrderType type) const;

    // Read-only walk: quantity an opposing order could take, stopping once wanted is reached
    [[nodiscard]] Qty matchableQty(Price limit, OrderType type, Qty wanted) const;

    // Top N levels, best first
    [[nodiscard]] std::vector<BookLevel> depth(size_t levels) const;

    [[nodiscard]] auto begin() const { return m_levels.begin(); }
    [[nodiscard]] auto end() const { return m_levels.end(); }

    void clear() { m_levels.clear(); }

private:
    [[nodiscard]] PriceLevel& levelAt(Price price);

    Side m_side;
    Levels m_levels;
};

} // namespace matchbook
