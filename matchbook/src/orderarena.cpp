#include "orderarena.hpp"
#include "status.hpp"

#include <string>
#include <utility>

namespace matchbook {

Slot OrderArena::allocate(Order order)
{
    Slot slot;
    if (!m_free.empty()) {
        slot = m_free.back();
        m_free.pop_back();
        m_slots[slot] = std::move(order);
        m_live[slot] = true;
    } else {
        slot = static_cast<Slot>(m_slots.size());
        m_slots.push_back(std::move(order));
        m_live.push_back(true);
    }
    ++m_liveCount;
    return slot;
}

void OrderArena::release(Slot slot)
{
    if (!isLive(slot)) {
        throw InvariantViolation("release of free arena slot " + std::to_string(slot));
    }
    m_live[slot] = false;
    m_slots[slot].owner.clear();
    m_free.push_back(slot);
    --m_liveCount;
}

void OrderArena::clear()
{
    m_slots.clear();
    m_live.clear();
    m_free.clear();
    m_liveCount = 0;
}

} // namespace matchbook
