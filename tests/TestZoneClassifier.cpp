#include "strategy/ZoneClassifier.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace ninetofive;
using strategy::HolidayCalendar;
using strategy::ZoneClassifier;
using strategy::ZoneConfig;
using utils::TimeUtils;

namespace {
// 2025-12-01T00:00:00Z, a Monday
constexpr TimestampMs kMonday = 1764547200000LL;

// Local (UTC-5) wall-clock time on the given day after Monday 2025-12-01
TimestampMs localTime(int day_offset, int hour, int minute) {
    return kMonday + day_offset * TimeUtils::MS_PER_DAY +
           (hour + 5) * TimeUtils::MS_PER_HOUR + minute * TimeUtils::MS_PER_MINUTE;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
}

int main() {
    const ZoneConfig config;
    const HolidayCalendar holidays = HolidayCalendar::usMarketDefaults();
    const HolidayCalendar no_holidays;

    // profitPct
    {
        assert(near(strategy::profitPct(100.0, 101.0, Side::LONG), 1.0));
        assert(near(strategy::profitPct(100.0, 99.0, Side::SHORT), 1.0));
        assert(near(strategy::profitPct(100.0, 101.0, Side::SHORT), -1.0));
        assert(near(strategy::profitPct(100.0, 100.0, Side::LONG), 0.0));
    }

    // Weekday session boundaries: start inclusive, end exclusive
    {
        assert(ZoneClassifier::classify(localTime(0, 8, 0), config, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(localTime(0, 9, 28), config, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(localTime(0, 9, 29), config, holidays) == Zone::SHORT);
        assert(ZoneClassifier::classify(localTime(0, 10, 0), config, holidays) == Zone::SHORT);
        assert(ZoneClassifier::classify(localTime(0, 16, 0), config, holidays) == Zone::SHORT);
        assert(ZoneClassifier::classify(localTime(0, 16, 1), config, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(localTime(0, 23, 59), config, holidays) == Zone::LONG);
    }

    // Weekend is always long
    {
        assert(ZoneClassifier::classify(localTime(5, 12, 0), config, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(localTime(6, 12, 0), config, no_holidays) == Zone::LONG);
    }

    // Holiday (Thursday 2025-12-25) is long unless the calendar is empty
    {
        const TimestampMs christmas_noon = localTime(24, 12, 0);
        assert(holidays.containsDate("2025-12-25"));
        assert(ZoneClassifier::classify(christmas_noon, config, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(christmas_noon, config, no_holidays) == Zone::SHORT);
    }

    // Custom session window
    {
        ZoneConfig custom;
        custom.short_zone_start = {10, 0};
        custom.short_zone_end = {15, 0};
        assert(ZoneClassifier::classify(localTime(1, 9, 45), custom, holidays) == Zone::LONG);
        assert(ZoneClassifier::classify(localTime(1, 10, 0), custom, holidays) == Zone::SHORT);
        assert(ZoneClassifier::classify(localTime(1, 15, 0), custom, holidays) == Zone::LONG);
    }

    // hoursUntilShortZone
    {
        const double to_open = (9 * 60 + 29) / 60.0;
        // Same morning
        assert(near(ZoneClassifier::hoursUntilShortZone(localTime(0, 8, 0), config), 89.0 / 60.0));
        // Monday evening -> Tuesday open
        assert(near(ZoneClassifier::hoursUntilShortZone(localTime(0, 17, 0), config), 7.0 + to_open));
        // Friday evening skips the weekend
        assert(near(ZoneClassifier::hoursUntilShortZone(localTime(4, 17, 0), config), 7.0 + 48.0 + to_open));
        // Saturday noon
        assert(near(ZoneClassifier::hoursUntilShortZone(localTime(5, 12, 0), config), 12.0 + 24.0 + to_open));
        // Inside the session counts to the next day's open
        assert(near(ZoneClassifier::hoursUntilShortZone(localTime(0, 10, 0), config), 14.0 + to_open));
    }

    assert(ZoneClassifier::isWeekend(0));
    assert(ZoneClassifier::isWeekend(6));
    assert(!ZoneClassifier::isWeekend(3));

    std::cout << "[TEST] ZoneClassifier PASSED\n";
    return 0;
}
