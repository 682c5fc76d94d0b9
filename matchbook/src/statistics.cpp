#include "statistics.hpp"

#include <algorithm>

namespace matchbook {

void EngineStats::recordSubmit(const ExecutionReport& report, uint64_t latencyNs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.ordersSubmitted;

    switch (report.status) {
    case Status::Ok:
        ++m_stats.ordersAccepted;
        break;
    case Status::RejectedFillOrKill:
        ++m_stats.ordersAccepted;
        ++m_stats.fokRejected;
        break;
    default:
        ++m_stats.ordersRejected;
        break;
    }

    recordTrades(report);
    recordLatency(latencyNs);
}

void EngineStats::recordCancel(Status status, uint64_t latencyNs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (status == Status::Ok) {
        ++m_stats.cancels;
    } else {
        ++m_stats.cancelMisses;
    }
    recordLatency(latencyNs);
}

void EngineStats::recordModify(const ExecutionReport& report, uint64_t latencyNs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (report.ok()) {
        ++m_stats.modifies;
    }
    recordTrades(report);
    recordLatency(latencyNs);
}

void EngineStats::recordDayReset(size_t expiredOrders, uint64_t latencyNs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t dayResets = m_stats.dayResets + 1;
    m_stats = StatsSnapshot{};
    m_stats.dayResets = dayResets;
    m_stats.gfdExpired = expiredOrders;
    recordLatency(latencyNs);
}

void EngineStats::recordMaintenance(size_t expiredOrders, uint64_t latencyNs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.gfdExpired += expiredOrders;
    recordLatency(latencyNs);
}

StatsSnapshot EngineStats::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void EngineStats::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats = StatsSnapshot{};
}

void EngineStats::recordTrades(const ExecutionReport& report)
{
    m_stats.tradesExecuted += report.trades.size();
    m_stats.volumeTraded += report.filledQty;
}

void EngineStats::recordLatency(uint64_t latencyNs)
{
    ++m_stats.operations;
    m_stats.totalLatencyNs += latencyNs;
    m_stats.maxLatencyNs = std::max(m_stats.maxLatencyNs, latencyNs);
    if (m_stats.operations == 1) {
        m_stats.minLatencyNs = latencyNs;
    } else {
        m_stats.minLatencyNs = std::min(m_stats.minLatencyNs, latencyNs);
    }
}

} // namespace matchbook
