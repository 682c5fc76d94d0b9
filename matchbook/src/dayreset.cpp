#include "dayreset.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace matchbook {

void DayResetSchedule::validate() const
{
    if (hour < 0 || hour > 23) {
        throw std::invalid_argument("Day reset hour out of range (0-23): " + std::to_string(hour));
    }
    if (minute < 0 || minute > 59) {
        throw std::invalid_argument("Day reset minute out of range (0-59): " + std::to_string(minute));
    }
}

Timestamp DayResetSchedule::lastBoundary(Timestamp now) const
{
    Timestamp boundary = now - (now % kNanosPerDay) + offset();
    if (boundary <= now) {
        return boundary;
    }
    return boundary >= kNanosPerDay ? boundary - kNanosPerDay : 0;
}

Timestamp DayResetSchedule::nextBoundary(Timestamp now) const
{
    Timestamp boundary = now - (now % kNanosPerDay) + offset();
    if (boundary <= now) {
        boundary += kNanosPerDay;
    }
    return boundary;
}

Timestamp DayResetSchedule::offset() const
{
    return static_cast<Timestamp>(hour * 60 + minute) * kNanosPerMinute;
}

std::string toString(const DayResetSchedule& schedule)
{
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << schedule.hour << ":" << std::setw(2) << schedule.minute;
    return out.str();
}

} // namespace matchbook
