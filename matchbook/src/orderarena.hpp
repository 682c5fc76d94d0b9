#pragma once

#include "order.hpp"

#include <cstdint>
#include <vector>

namespace matchbook {

using Slot = uint32_t;

// Slot storage for resting orders. Slots stay valid until released and are
// reused through a free list, so price levels can refer to orders by slot.
class OrderArena {
public:
    // Store order, returns its slot
    Slot allocate(Order order);

    // Return slot to the free list
    void release(Slot slot);

    [[nodiscard]] Order& operator[](Slot slot) { return m_slots[slot]; }
    [[nodiscard]] const Order& operator[](Slot slot) const { return m_slots[slot]; }

    [[nodiscard]] bool isLive(Slot slot) const { return slot < m_live.size() && m_live[slot]; }
    [[nodiscard]] size_t liveCount() const { return m_liveCount; }
    [[nodiscard]] size_t capacity() const { return m_slots.size(); }

    void clear();

private:
    std::vector<Order> m_slots;
    std::vector<bool> m_live;
    std::vector<Slot> m_free; // LIFO free list
    size_t m_liveCount = 0;
};

} // namespace matchbook
