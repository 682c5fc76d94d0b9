#pragma once

#include "booklevel.hpp"
#include "bookside.hpp"
#include "instrument.hpp"
#include "order.hpp"
#include "orderarena.hpp"
#include "orderindex.hpp"
#include "status.hpp"
#include "trade.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace matchbook {

// Limit order book for one instrument. Not thread-safe: MatchingEngine
// serializes access. Every mutation keeps the book sides, the index and the
// arena consistent with each other before it returns.
class OrderBook {
public:
    explicit OrderBook(Instrument instrument = defaultInstrument());

    // Main operations
    ExecutionReport submit(Order order, Timestamp now);
    Status cancel(OrderId id);
    ExecutionReport modify(OrderId id, Price newPrice, Qty newQty, Timestamp now);

    // Cancel GFD orders whose expiry is at or before now. Returns count removed.
    size_t purgeExpired(Timestamp now);

    // Cancel every GFD order regardless of expiry. Returns count removed.
    size_t purgeGoodForDay();

    // Restamp the expiry of every resting GFD order
    void rescheduleGoodForDay(const std::function<Timestamp(const Order&)>& expiryFor);

    // Drop all resting orders
    void clear();

    // Check an order against the instrument without touching the book
    [[nodiscard]] Status validate(const Order& order) const;

    // Queries
    [[nodiscard]] std::optional<Price> bestBid() const { return m_bids.bestPrice(); }
    [[nodiscard]] std::optional<Price> bestAsk() const { return m_asks.bestPrice(); }
    [[nodiscard]] std::optional<Price> spread() const;

    // Get depth (top N levels per side)
    [[nodiscard]] std::vector<BookLevel> bidDepth(size_t levels) const { return m_bids.depth(levels); }
    [[nodiscard]] std::vector<BookLevel> askDepth(size_t levels) const { return m_asks.depth(levels); }

    // Order lookup, throws std::out_of_range for unknown ids
    [[nodiscard]] const Order& findOrder(OrderId id) const;
    [[nodiscard]] bool contains(OrderId id) const { return m_index.contains(id); }

    // Statistics
    [[nodiscard]] size_t bidLevelCount() const { return m_bids.levelCount(); }
    [[nodiscard]] size_t askLevelCount() const { return m_asks.levelCount(); }
    [[nodiscard]] size_t orderCount() const { return m_index.size(); }

    [[nodiscard]] const Instrument& instrument() const { return m_instrument; }

    // Throws InvariantViolation if levels, index and arena disagree
    void verifyInvariants() const;

private:
    // FOK pre-check, matching walk and remainder policy for a validated order
    ExecutionReport execute(Order& order, Timestamp now);

    // Match aggressive order against opposite side
    std::vector<Trade> matchOrder(Order& order, Timestamp now);

    // Insert passive order into book and index
    void insertOrder(const Order& order);

    // Remove resting order from its level, the index and the arena
    void removeOrder(OrderId id, const OrderLocation& location);

    size_t purgeIf(const std::function<bool(const Order&)>& predicate);

    [[nodiscard]] OrderId nextOrderId();

    [[nodiscard]] BookSide& sideFor(Side side) { return side == Side::Buy ? m_bids : m_asks; }
    [[nodiscard]] const BookSide& sideFor(Side side) const { return side == Side::Buy ? m_bids : m_asks; }

    void verifySide(const BookSide& side, size_t& ordersSeen) const;

    Instrument m_instrument;

    // Bids: sorted descending (highest price first)
    BookSide m_bids{Side::Buy};

    // Asks: sorted ascending (lowest price first)
    BookSide m_asks{Side::Sell};

    // Resting orders, addressed by slot from the levels and the index
    OrderArena m_arena;

    // Fast order lookup by ID
    OrderIndex m_index;

    OrderId m_nextOrderId = 1;
    uint64_t m_nextTradeId = 1;
};

} // namespace matchbook
