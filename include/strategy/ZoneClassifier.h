#pragma once

#include "common/Types.h"
#include "strategy/HolidayCalendar.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace strategy {

class ZoneClassifier {
public:
    // Fixed UTC-5, no daylight-saving adjustment
    static constexpr int LOCAL_UTC_OFFSET_MINUTES = -5 * 60;

    // Weekends and holidays are long. On trading days the local window
    // [short_zone_start, short_zone_end) is short, everything else long.
    static Zone classify(TimestampMs timestamp_ms,
                         const ZoneConfig& config,
                         const HolidayCalendar& holidays);

    // Fractional hours until the next short_zone_start on a weekday.
    // Holidays are not skipped.
    static double hoursUntilShortZone(TimestampMs timestamp_ms, const ZoneConfig& config);

    static bool isWeekend(int day_of_week) {
        return day_of_week == 0 || day_of_week == 6;
    }
};

// Signed percentage move in the position's favor
inline double profitPct(double entry_price, double current_price, Side side) {
    const double price_diff = (side == Side::SHORT)
        ? (entry_price - current_price)
        : (current_price - entry_price);
    return (price_diff / entry_price) * 100.0;
}

} // namespace strategy
} // namespace ninetofive
