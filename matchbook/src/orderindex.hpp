#pragma once

#include "pricelevel.hpp"
#include "types.hpp"

#include <unordered_map>
#include <vector>

namespace matchbook {

// Where a resting order lives: enough to remove it without scanning
struct OrderLocation {
    Slot slot;
    Side side;
    Price price;
    PriceLevel::Position position;
};

class OrderIndex {
public:
    // Returns false if id is already present
    bool add(OrderId id, const OrderLocation& location);

    // Returns nullptr if id is unknown
    [[nodiscard]] const OrderLocation* find(OrderId id) const;

    bool erase(OrderId id);

    [[nodiscard]] bool contains(OrderId id) const { return m_entries.count(id) != 0; }
    [[nodiscard]] size_t size() const { return m_entries.size(); }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }

    // All indexed ids (unordered)
    [[nodiscard]] std::vector<OrderId> ids() const;

    [[nodiscard]] auto begin() const { return m_entries.begin(); }
    [[nodiscard]] auto end() const { return m_entries.end(); }

    void clear() { m_entries.clear(); }

private:
    std::unordered_map<OrderId, OrderLocation> m_entries;
};

} // namespace matchbook
