#include "orderindex.hpp"

namespace matchbook {

bool OrderIndex::add(OrderId id, const OrderLocation& location) { return m_entries.try_emplace(id, location).second; }

const OrderLocation* OrderIndex::find(OrderId id) const
{
    auto iterator = m_entries.find(id);
    if (iterator == m_entries.end()) {
        return nullptr;
    }
    return &iterator->second;
}

bool OrderIndex::erase(OrderId id) { return m_entries.erase(id) != 0; }

std::vector<OrderId> OrderIndex::ids() const
{
    std::vector<OrderId> result;
    result.reserve(m_entries.size());
    for (const auto& [id, location] : m_entries) {
        result.push_back(id);
    }
    return result;
}

} // namespace matchbook
