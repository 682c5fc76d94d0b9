#include "bookside.hpp"
#include "status.hpp"

#include <algorithm>
#include <string>

namespace matchbook {

BookSide::BookSide(Side side) : m_side(side), m_levels(PriceOrder{side}) {}

OrderLocation BookSide::insert(Slot slot, const Order& order)
{
    auto [iterator, inserted] = m_levels.try_emplace(order.price, order.price);
    auto position = iterator->second.append(slot, order.remaining);
    return OrderLocation{slot, m_side, order.price, position};
}

void BookSide::remove(const OrderLocation& location, Qty remaining)
{
    auto iterator = m_levels.find(location.price);
    if (iterator == m_levels.end()) {
        throw InvariantViolation("no level at " + std::to_string(location.price) + " for indexed order");
    }

    iterator->second.erase(location.position, remaining);
    if (iterator->second.empty()) {
        m_levels.erase(iterator);
    }
}

bool BookSide::reduce(const OrderLocation& location, Order& order, Qty amount)
{
    if (amount > order.remaining) {
        throw InvariantViolation("reduce of order " + std::to_string(order.id) + " by " + std::to_string(amount) +
                                 " exceeds remaining " + std::to_string(order.remaining));
    }

    if (amount == order.remaining) {
        remove(location, order.remaining);
        order.remaining = 0;
        return true;
    }

    levelAt(location.price).reduce(amount);
    order.fill(amount);
    return false;
}

PriceLevel* BookSide::peekBest()
{
    if (m_levels.empty()) {
        return nullptr;
    }
    return &m_levels.begin()->second;
}

const PriceLevel* BookSide::peekBest() const
{
    if (m_levels.empty()) {
        return nullptr;
    }
    return &m_levels.begin()->second;
}

std::optional<Price> BookSide::bestPrice() const
{
    if (m_levels.empty()) {
        return std::nullopt;
    }
    return m_levels.begin()->first;
}

bool BookSide::crosses(Price levelPrice, Price limit, OrderType type) const
{
    if (type == OrderType::Market) {
        return true;
    }

    // Resting asks are hit by buys at or above, resting bids by sells at or below
    if (m_side == Side::Sell) {
        return limit >= levelPrice;
    }
    return limit <= levelPrice;
}

Qty BookSide::matchableQty(Price limit, OrderType type, Qty wanted) const
{
    Qty available = 0;
    for (const auto& [price, level] : m_levels) {
        if (available >= wanted || !crosses(price, limit, type)) {
            break;
        }
        available += level.totalQty();
    }
    return available;
}

std::vector<BookLevel> BookSide::depth(size_t levels) const
{
    std::vector<BookLevel> result;
    result.reserve(std::min(levels, m_levels.size()));

    size_t count = 0;
    for (const auto& [price, level] : m_levels) {
        if (count >= levels) {
            break;
        }
        result.push_back({price, level.totalQty(), level.orderCount()});
        ++count;
    }

    return result;
}

PriceLevel& BookSide::levelAt(Price price)
{
    auto iterator = m_levels.find(price);
    if (iterator == m_levels.end()) {
        throw InvariantViolation("no level at " + std::to_string(price));
    }
    return iterator->second;
}

} // namespace matchbook
