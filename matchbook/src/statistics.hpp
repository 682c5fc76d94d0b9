#pragma once

#include "status.hpp"
#include "types.hpp"

#include <cstdint>
#include <mutex>

namespace matchbook {

struct StatsSnapshot {
    uint64_t ordersSubmitted = 0; // Every submit call
    uint64_t ordersAccepted = 0;  // Submits that passed validation and were processed
    uint64_t ordersRejected = 0;  // Invalid or duplicate submits
    uint64_t fokRejected = 0;     // FOK orders killed by the pre-check
    uint64_t cancels = 0;         // Successful cancels
    uint64_t cancelMisses = 0;    // Cancels of unknown ids
    uint64_t modifies = 0;        // Successful modifies
    uint64_t gfdExpired = 0;      // GFD orders purged by day resets
    uint64_t tradesExecuted = 0;
    Qty volumeTraded = 0;
    uint64_t operations = 0; // Timed operations
    uint64_t totalLatencyNs = 0;
    uint64_t minLatencyNs = 0;
    uint64_t maxLatencyNs = 0;
    uint64_t dayResets = 0; // Survives daily resets

    [[nodiscard]] double averageLatencyNs() const
    {
        return operations > 0 ? static_cast<double>(totalLatencyNs) / static_cast<double>(operations) : 0.0;
    }

    [[nodiscard]] double averageLatencyMicros() const { return averageLatencyNs() / 1000.0; }
};

// Running counters, synchronized independently of the book lock
class EngineStats {
public:
    void recordSubmit(const ExecutionReport& report, uint64_t latencyNs);
    void recordCancel(Status status, uint64_t latencyNs);
    void recordModify(const ExecutionReport& report, uint64_t latencyNs);

    // Count a day reset and clear the daily counters
    void recordDayReset(size_t expiredOrders, uint64_t latencyNs);

    // Maintenance, clear and schedule changes that did not reset the day
    void recordMaintenance(size_t expiredOrders, uint64_t latencyNs);

    [[nodiscard]] StatsSnapshot snapshot() const;
    void reset();

private:
    void recordTrades(const ExecutionReport& report);
    void recordLatency(uint64_t latencyNs);

    mutable std::mutex m_mutex;
    StatsSnapshot m_stats;
};

} // namespace matchbook
