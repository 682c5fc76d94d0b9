#include "pricelevel.hpp"
#include "status.hpp"

#include <string>

namespace matchbook {

PriceLevel::PriceLevel(Price price) : m_price(price), m_totalQty(0) {}

PriceLevel::Position PriceLevel::append(Slot slot, Qty qty)
{
    m_totalQty += qty;
    return m_orders.insert(m_orders.end(), slot);
}

void PriceLevel::erase(Position pos, Qty qty)
{
    reduce(qty);
    m_orders.erase(pos);
}

void PriceLevel::reduce(Qty qty)
{
    if (qty > m_totalQty) {
        throw InvariantViolation("level " + std::to_string(m_price) + " aggregate " + std::to_string(m_totalQty) +
                                 " below reduction " + std::to_string(qty));
    }
    m_totalQty -= qty;
}

} // namespace matchbook
