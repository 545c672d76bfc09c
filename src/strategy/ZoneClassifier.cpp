#include "strategy/ZoneClassifier.h"
#include "common/TimeUtils.h"

namespace ninetofive {
namespace strategy {

Zone ZoneClassifier::classify(TimestampMs timestamp_ms,
                              const ZoneConfig& config,
                              const HolidayCalendar& holidays) {
    const auto local = utils::TimeUtils::toLocal(timestamp_ms, LOCAL_UTC_OFFSET_MINUTES);

    if (isWeekend(local.day_of_week)) {
        return Zone::LONG;
    }
    if (holidays.contains(local.day_number)) {
        return Zone::LONG;
    }

    const bool after_open = local.minute_of_day >= config.short_zone_start.minuteOfDay();
    const bool before_close = local.minute_of_day < config.short_zone_end.minuteOfDay();
    return (after_open && before_close) ? Zone::SHORT : Zone::LONG;
}

double ZoneClassifier::hoursUntilShortZone(TimestampMs timestamp_ms, const ZoneConfig& config) {
    const auto local = utils::TimeUtils::toLocal(timestamp_ms, LOCAL_UTC_OFFSET_MINUTES);
    const int target_minutes = config.short_zone_start.minuteOfDay();
    const int current_minutes = local.minute_of_day;

    if (!isWeekend(local.day_of_week) && current_minutes < target_minutes) {
        return static_cast<double>(target_minutes - current_minutes) / 60.0;
    }

    int days_until = 1;
    int next_day = (local.day_of_week + 1) % 7;
    while (isWeekend(next_day)) {
        ++days_until;
        next_day = (next_day + 1) % 7;
    }

    const double hours_to_midnight = static_cast<double>(24 * 60 - current_minutes) / 60.0;
    const double hours_after_midnight = static_cast<double>(target_minutes) / 60.0;
    return hours_to_midnight + static_cast<double>(days_until - 1) * 24.0 + hours_after_midnight;
}

} // namespace strategy
} // namespace ninetofive
