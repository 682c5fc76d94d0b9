#include "matchingengine.hpp"

#include <chrono>
#include <utility>

namespace matchbook {

namespace {

uint64_t elapsedNs(std::chrono::steady_clock::time_point start)
{
    auto duration = std::chrono::steady_clock::now() - start;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

} // namespace

MatchingEngine::MatchingEngine(EngineConfig config, Clock clock)
    : m_book(config.instrument), m_schedule(config.dayReset), m_lastReset(0), m_defaultDepth(config.snapshotDepth),
      m_checkInvariants(config.checkInvariants), m_clock(std::move(clock))
{
    config.validate();
    m_lastReset = m_schedule.lastBoundary(m_clock());
}

void MatchingEngine::setTradeCallback(TradeCallback callback)
{
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_tradeCallback = std::move(callback);
}

ExecutionReport MatchingEngine::submit(Order order)
{
    auto start = std::chrono::steady_clock::now();
    ExecutionReport report;

    std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
    Timestamp now = m_clock();
    if (order.type == OrderType::GoodForDay) {
        order.expiry = m_schedule.nextBoundary(now);
    }

    report = m_book.submit(std::move(order), now);
    if (report.ok()) {
        commitMutation();
    }
    publish(bookLock, report.trades);

    m_stats.recordSubmit(report, elapsedNs(start));
    return report;
}

Status MatchingEngine::cancel(OrderId id)
{
    auto start = std::chrono::steady_clock::now();
    Status status;
    {
        std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
        status = m_book.cancel(id);
        if (status == Status::Ok) {
            commitMutation();
        }
    }

    m_stats.recordCancel(status, elapsedNs(start));
    return status;
}

ExecutionReport MatchingEngine::modify(OrderId id, Price newPrice, Qty newQty)
{
    auto start = std::chrono::steady_clock::now();
    ExecutionReport report;

    std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
    report = m_book.modify(id, newPrice, newQty, m_clock());
    if (report.ok()) {
        commitMutation();
    }
    publish(bookLock, report.trades);

    m_stats.recordModify(report, elapsedNs(start));
    return report;
}

bool MatchingEngine::runMaintenance()
{
    auto start = std::chrono::steady_clock::now();
    size_t expired = 0;
    {
        std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
        Timestamp now = m_clock();
        Timestamp boundary = m_schedule.lastBoundary(now);
        if (boundary <= m_lastReset) {
            bookLock.unlock();
            m_stats.recordMaintenance(0, elapsedNs(start));
            return false;
        }

        expired = m_book.purgeExpired(now);
        m_lastReset = boundary;
        commitMutation();
    }

    m_stats.recordDayReset(expired, elapsedNs(start));
    return true;
}

size_t MatchingEngine::resetDay()
{
    auto start = std::chrono::steady_clock::now();
    size_t expired = 0;
    {
        std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
        expired = m_book.purgeGoodForDay();
        m_lastReset = m_clock();
        commitMutation();
    }

    m_stats.recordDayReset(expired, elapsedNs(start));
    return expired;
}

void MatchingEngine::clear()
{
    auto start = std::chrono::steady_clock::now();
    {
        std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
        m_book.clear();
        commitMutation();
    }

    m_stats.recordMaintenance(0, elapsedNs(start));
}

void MatchingEngine::setDayResetTime(int hour, int minute)
{
    DayResetSchedule schedule{hour, minute};
    schedule.validate();

    auto start = std::chrono::steady_clock::now();
    size_t expired = 0;
    {
        std::unique_lock<std::shared_mutex> bookLock(m_bookMutex);
        Timestamp now = m_clock();
        m_schedule = schedule;
        m_lastReset = m_schedule.lastBoundary(now);

        // Resting GFD orders expire at the first new boundary after they entered the book
        m_book.rescheduleGoodForDay([&schedule](const Order& order) { return schedule.nextBoundary(order.timestamp); });
        expired = m_book.purgeExpired(now);
        commitMutation();
    }

    m_stats.recordMaintenance(expired, elapsedNs(start));
}

DayResetSchedule MatchingEngine::dayResetTime() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_schedule;
}

BookSnapshot MatchingEngine::snapshot(size_t depth) const
{
    BookSnapshot result;
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    result.bids = m_book.bidDepth(depth);
    result.asks = m_book.askDepth(depth);
    result.timestamp = m_clock();
    result.sequence = m_sequence;
    return result;
}

std::optional<Price> MatchingEngine::bestBid() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_book.bestBid();
}

std::optional<Price> MatchingEngine::bestAsk() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_book.bestAsk();
}

std::optional<Price> MatchingEngine::spread() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_book.spread();
}

std::optional<Order> MatchingEngine::findOrder(OrderId id) const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    if (!m_book.contains(id)) {
        return std::nullopt;
    }
    return m_book.findOrder(id);
}

size_t MatchingEngine::orderCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_book.orderCount();
}

uint64_t MatchingEngine::sequence() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    return m_sequence;
}

void MatchingEngine::verifyInvariants() const
{
    std::shared_lock<std::shared_mutex> lock(m_bookMutex);
    m_book.verifyInvariants();
}

Timestamp MatchingEngine::systemClock()
{
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

void MatchingEngine::commitMutation()
{
    ++m_sequence;
    if (m_checkInvariants) {
        m_book.verifyInvariants();
    }
}

void MatchingEngine::publish(std::unique_lock<std::shared_mutex>& bookLock, const std::vector<Trade>& trades)
{
    if (trades.empty()) {
        bookLock.unlock();
        return;
    }

    // Tickets are taken under the book lock, so they follow operation order
    uint64_t ticket = m_nextTicket++;
    bookLock.unlock();

    std::unique_lock<std::mutex> callbackLock(m_callbackMutex);
    m_callbackTurn.wait(callbackLock, [this, ticket]() { return m_deliveredTicket == ticket; });

    try {
        if (m_tradeCallback != nullptr) {
            for (const auto& trade : trades) {
                m_tradeCallback(trade);
            }
        }
    } catch (...) {
        ++m_deliveredTicket;
        m_callbackTurn.notify_all();
        throw;
    }

    ++m_deliveredTicket;
    m_callbackTurn.notify_all();
}

} // namespace matchbook
