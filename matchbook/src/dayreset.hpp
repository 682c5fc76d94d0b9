#pragma once

#include "types.hpp"

#include <string>

namespace matchbook {

constexpr Timestamp kNanosPerMinute = 60ULL * 1000000000ULL;
constexpr Timestamp kNanosPerDay = 24ULL * 60ULL * kNanosPerMinute;

// Daily UTC boundary after which good-for-day orders expire
struct DayResetSchedule {
    int hour = 15;
    int minute = 59;

    // Throws std::invalid_argument unless 0 <= hour <= 23 and 0 <= minute <= 59
    void validate() const;

    // Most recent boundary at or before now (0 if none since the epoch)
    [[nodiscard]] Timestamp lastBoundary(Timestamp now) const;

    // First boundary strictly after now
    [[nodiscard]] Timestamp nextBoundary(Timestamp now) const;

private:
    [[nodiscard]] Timestamp offset() const;
};

// "HH:MM"
[[nodiscard]] std::string toString(const DayResetSchedule& schedule);

} // namespace matchbook
