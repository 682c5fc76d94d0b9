#include "orderbook.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace matchbook {

OrderBook::OrderBook(Instrument instrument) : m_instrument(std::move(instrument)) {}

ExecutionReport OrderBook::submit(Order order, Timestamp now)
{
    ExecutionReport report;
    report.orderId = order.id;

    report.status = validate(order);
    if (report.status != Status::Ok) {
        return report;
    }

    if (order.id == 0) {
        order.id = nextOrderId();
        report.orderId = order.id;
    } else if (m_index.contains(order.id)) {
        report.status = Status::DuplicateOrderId;
        return report;
    }

    order.remaining = order.qty;
    if (order.timestamp == 0) {
        order.timestamp = now;
    }
    if (order.type != OrderType::GoodForDay) {
        order.expiry = 0;
    }

    return execute(order, now);
}

Status OrderBook::cancel(OrderId id)
{
    const OrderLocation* location = m_index.find(id);
    if (location == nullptr) {
        return Status::NotFound;
    }

    removeOrder(id, *location);
    return Status::Ok;
}

ExecutionReport OrderBook::modify(OrderId id, Price newPrice, Qty newQty, Timestamp now)
{
    ExecutionReport report;
    report.orderId = id;

    const OrderLocation* found = m_index.find(id);
    if (found == nullptr) {
        report.status = Status::NotFound;
        return report;
    }
    OrderLocation location = *found;
    Order& order = m_arena[location.slot];

    if (newQty == 0 || newPrice <= 0 || !m_instrument.isValidPrice(newPrice) || !m_instrument.isValidQty(newQty)) {
        report.status = Status::InvalidOrder;
        return report;
    }

    // Same price, no increase: reduce in place and keep queue position
    if (newPrice == order.price && newQty <= order.remaining) {
        if (newQty < order.remaining) {
            sideFor(order.side).reduce(location, order, order.remaining - newQty);
        }
        report.restingQty = order.remaining;
        return report;
    }

    // Otherwise cancel and resubmit at the back of the new level
    Order replacement = order;
    replacement.price = newPrice;
    replacement.qty = newQty;
    replacement.remaining = newQty;
    replacement.timestamp = now;

    removeOrder(id, location);
    return execute(replacement, now);
}

size_t OrderBook::purgeExpired(Timestamp now)
{
    return purgeIf([now](const Order& order) {
        return order.type == OrderType::GoodForDay && order.expiry != 0 && order.expiry <= now;
    });
}

size_t OrderBook::purgeGoodForDay()
{
    return purgeIf([](const Order& order) { return order.type == OrderType::GoodForDay; });
}

void OrderBook::rescheduleGoodForDay(const std::function<Timestamp(const Order&)>& expiryFor)
{
    for (const auto& entry : m_index) {
        Order& order = m_arena[entry.second.slot];
        if (order.type == OrderType::GoodForDay) {
            order.expiry = expiryFor(order);
        }
    }
}

void OrderBook::clear()
{
    m_bids.clear();
    m_asks.clear();
    m_index.clear();
    m_arena.clear();
}

Status OrderBook::validate(const Order& order) const
{
    if (order.qty == 0 || !m_instrument.isValidQty(order.qty)) {
        return Status::InvalidOrder;
    }

    if (order.type != OrderType::Market) {
        if (order.price <= 0 || !m_instrument.isValidPrice(order.price)) {
            return Status::InvalidOrder;
        }
    }

    return Status::Ok;
}

std::optional<Price> OrderBook::spread() const
{
    auto bid = bestBid();
    auto ask = bestAsk();
    if (!bid.has_value() || !ask.has_value()) {
        return std::nullopt;
    }
    return ask.value() - bid.value();
}

const Order& OrderBook::findOrder(OrderId id) const
{
    const OrderLocation* location = m_index.find(id);
    if (location == nullptr) {
        throw std::out_of_range("Order not found: " + std::to_string(id));
    }
    if (!m_arena.isLive(location->slot)) {
        throw InvariantViolation("order index points at free slot for ID: " + std::to_string(id));
    }
    return m_arena[location->slot];
}

void OrderBook::verifyInvariants() const
{
    size_t ordersSeen = 0;
    verifySide(m_bids, ordersSeen);
    verifySide(m_asks, ordersSeen);

    if (ordersSeen != m_index.size()) {
        throw InvariantViolation("levels hold " + std::to_string(ordersSeen) + " orders, index holds " +
                                 std::to_string(m_index.size()));
    }
    if (m_arena.liveCount() != m_index.size()) {
        throw InvariantViolation("arena holds " + std::to_string(m_arena.liveCount()) + " orders, index holds " +
                                 std::to_string(m_index.size()));
    }

    auto bid = bestBid();
    auto ask = bestAsk();
    if (bid.has_value() && ask.has_value() && bid.value() >= ask.value()) {
        throw InvariantViolation("crossed book: bid " + std::to_string(bid.value()) + " >= ask " +
                                 std::to_string(ask.value()));
    }
}

ExecutionReport OrderBook::execute(Order& order, Timestamp now)
{
    ExecutionReport report;
    report.orderId = order.id;

    // Dry run: FOK must be fillable in full before any trade is generated
    if (order.type == OrderType::FillOrKill) {
        const BookSide& opposing = sideFor(opposite(order.side));
        if (opposing.matchableQty(order.price, order.type, order.remaining) < order.remaining) {
            report.status = Status::RejectedFillOrKill;
            return report;
        }
    }

    report.trades = matchOrder(order, now);
    for (const auto& trade : report.trades) {
        report.filledQty += trade.qty;
    }

    // Market, IOC and FOK remainders never rest
    if (!order.isFilled() && canRest(order.type)) {
        insertOrder(order);
        report.restingQty = order.remaining;
    }

    return report;
}

std::vector<Trade> OrderBook::matchOrder(Order& order, Timestamp now)
{
    std::vector<Trade> trades;
    BookSide& opposing = sideFor(opposite(order.side));

    while (order.remaining > 0) {
        PriceLevel* level = opposing.peekBest();
        if (level == nullptr || !opposing.crosses(level->price(), order.price, order.type)) {
            break;
        }

        Slot slot = level->front();
        Order& resting = m_arena[slot];
        const OrderLocation* found = m_index.find(resting.id);
        if (found == nullptr || found->slot != slot) {
            throw InvariantViolation("resting order " + std::to_string(resting.id) + " missing from index");
        }
        OrderLocation location = *found;

        Qty fillQty = std::min(order.remaining, resting.remaining);

        Trade trade{};
        trade.id = m_nextTradeId++;
        trade.buyOrderId = order.side == Side::Buy ? order.id : resting.id;
        trade.sellOrderId = order.side == Side::Sell ? order.id : resting.id;
        trade.takerOrderId = order.id;
        trade.makerOrderId = resting.id;
        trade.takerSide = order.side;
        trade.price = level->price();
        trade.qty = fillQty;
        trade.timestamp = now;
        trades.push_back(trade);

        order.fill(fillQty);
        OrderId restingId = resting.id;
        if (opposing.reduce(location, resting, fillQty)) {
            m_index.erase(restingId);
            m_arena.release(slot);
        }
    }

    return trades;
}

void OrderBook::insertOrder(const Order& order)
{
    Slot slot = m_arena.allocate(order);
    OrderLocation location = sideFor(order.side).insert(slot, m_arena[slot]);
    if (!m_index.add(order.id, location)) {
        throw InvariantViolation("order " + std::to_string(order.id) + " indexed twice");
    }
}

void OrderBook::removeOrder(OrderId id, const OrderLocation& location)
{
    // Copy first: erasing the index entry invalidates the reference
    OrderLocation target = location;
    sideFor(target.side).remove(target, m_arena[target.slot].remaining);
    m_index.erase(id);
    m_arena.release(target.slot);
}

size_t OrderBook::purgeIf(const std::function<bool(const Order&)>& predicate)
{
    std::vector<OrderId> victims;
    for (const auto& [id, location] : m_index) {
        if (predicate(m_arena[location.slot])) {
            victims.push_back(id);
        }
    }

    for (OrderId id : victims) {
        removeOrder(id, *m_index.find(id));
    }
    return victims.size();
}

OrderId OrderBook::nextOrderId()
{
    while (m_index.contains(m_nextOrderId)) {
        ++m_nextOrderId;
    }
    return m_nextOrderId++;
}

void OrderBook::verifySide(const BookSide& side, size_t& ordersSeen) const
{
    for (const auto& [price, level] : side) {
        if (level.empty()) {
            throw InvariantViolation("empty level left at " + std::to_string(price));
        }
        if (level.price() != price) {
            throw InvariantViolation("level keyed " + std::to_string(price) + " reports " +
                                     std::to_string(level.price()));
        }

        Qty sum = 0;
        for (auto position = level.begin(); position != level.end(); ++position) {
            Slot slot = *position;
            if (!m_arena.isLive(slot)) {
                throw InvariantViolation("level " + std::to_string(price) + " references free slot");
            }

            const Order& order = m_arena[slot];
            if (order.side != side.side() || order.price != price) {
                throw InvariantViolation("order " + std::to_string(order.id) + " filed under wrong side or price");
            }
            if (order.remaining == 0 || order.remaining > order.qty) {
                throw InvariantViolation("order " + std::to_string(order.id) + " has remaining " +
                                         std::to_string(order.remaining) + " of " + std::to_string(order.qty));
            }

            const OrderLocation* location = m_index.find(order.id);
            if (location == nullptr || location->slot != slot || location->price != price ||
                location->side != side.side() || *location->position != slot) {
                throw InvariantViolation("order " + std::to_string(order.id) + " not indexed at its level");
            }

            sum += order.remaining;
            ++ordersSeen;
        }

        if (sum != level.totalQty()) {
            throw InvariantViolation("level " + std::to_string(price) + " aggregate " +
                                     std::to_string(level.totalQty()) + " != sum " + std::to_string(sum));
        }
    }
}

} // namespace matchbook
