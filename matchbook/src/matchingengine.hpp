#pragma once

#include "dayreset.hpp"
#include "engineconfig.hpp"
#include "order.hpp"
#include "orderbook.hpp"
#include "snapshot.hpp"
#include "statistics.hpp"
#include "status.hpp"
#include "trade.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace matchbook {

// Thread-safe front end to a single OrderBook.
//
// submit, cancel, modify, runMaintenance, resetDay and clear each run as one
// exclusive critical section, so no two of them interleave. Snapshots and
// queries take the lock shared and only for the duration of a copy.
// Statistics are kept under their own mutex.
//
// Trade callbacks run after the book lock is released, in the order the
// operations completed. A callback may read the engine but must not call a
// mutating operation or setTradeCallback.
class MatchingEngine {
public:
    // Callback type for trade notifications
    using TradeCallback = std::function<void(const Trade&)>;

    // Wall clock in nanoseconds since the epoch; injectable for tests
    using Clock = std::function<Timestamp()>;

    explicit MatchingEngine(EngineConfig config = EngineConfig{}, Clock clock = systemClock);

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    // Set optional trade callback (called for each trade)
    void setTradeCallback(TradeCallback callback);

    // Main operations
    ExecutionReport submit(Order order);
    Status cancel(OrderId id);
    ExecutionReport modify(OrderId id, Price newPrice, Qty newQty);

    // Periodic tick: once the configured boundary has passed since the last
    // reset, purge expired GFD orders and reset daily statistics.
    // Returns true if a reset happened.
    bool runMaintenance();

    // Unconditional day reset. Returns the number of GFD orders purged.
    size_t resetDay();

    // Drop every resting order
    void clear();

    // Throws std::invalid_argument for hour outside 0-23 or minute outside 0-59.
    // Resting GFD orders are restamped to the new schedule; any whose new
    // expiry has already passed are purged.
    void setDayResetTime(int hour, int minute);
    [[nodiscard]] DayResetSchedule dayResetTime() const;

    // Read path
    [[nodiscard]] BookSnapshot snapshot(size_t depth) const;
    [[nodiscard]] BookSnapshot snapshot() const { return snapshot(m_defaultDepth); }
    [[nodiscard]] std::optional<Price> bestBid() const;
    [[nodiscard]] std::optional<Price> bestAsk() const;
    [[nodiscard]] std::optional<Price> spread() const;
    [[nodiscard]] std::optional<Order> findOrder(OrderId id) const;
    [[nodiscard]] size_t orderCount() const;
    [[nodiscard]] uint64_t sequence() const;

    [[nodiscard]] StatsSnapshot stats() const { return m_stats.snapshot(); }
    void resetStats() { m_stats.reset(); }

    [[nodiscard]] const Instrument& instrument() const { return m_book.instrument(); }

    // Throws InvariantViolation if the book is inconsistent
    void verifyInvariants() const;

    [[nodiscard]] static Timestamp systemClock();

private:
    // Called with the book lock held after a successful mutation
    void commitMutation();

    // Releases bookLock, then hands trades to the callback in operation order
    void publish(std::unique_lock<std::shared_mutex>& bookLock, const std::vector<Trade>& trades);

    mutable std::shared_mutex m_bookMutex;
    OrderBook m_book;
    DayResetSchedule m_schedule;
    Timestamp m_lastReset;
    uint64_t m_sequence = 0;
    size_t m_defaultDepth;
    bool m_checkInvariants;
    Clock m_clock;

    EngineStats m_stats;

    // Delivery order for trade batches. m_nextTicket is guarded by the book
    // lock, m_deliveredTicket and the callback by m_callbackMutex.
    uint64_t m_nextTicket = 0;
    uint64_t m_deliveredTicket = 0;
    std::mutex m_callbackMutex;
    std::condition_variable m_callbackTurn;
    TradeCallback m_tradeCallback;
};

} // namespace matchbook
