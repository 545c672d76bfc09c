#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using ninetofive::TimestampMs;
using ninetofive::utils::TimeUtils;

namespace {
// 2025-12-01T00:00:00Z, a Monday
constexpr TimestampMs kMonday = 1764547200000LL;

bool throwsInvalid(const std::string& text) {
    try {
        TimeUtils::parseTimestamp(text);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[TEST] Starting TimeUtils Test..." << std::endl;

    // Civil date conversion
    {
        assert(TimeUtils::daysFromCivil(1970, 1, 1) == 0);
        assert(TimeUtils::daysFromCivil(2025, 12, 1) == 20423);
        assert(TimeUtils::daysFromCivil(2024, 2, 29) - TimeUtils::daysFromCivil(2024, 2, 28) == 1);

        const auto d = TimeUtils::civilFromDays(20423);
        assert(d.year == 2025 && d.month == 12 && d.day == 1);
        assert(TimeUtils::formatDate(20423) == "2025-12-01");
        assert(TimeUtils::parseDate("2025-12-01") == 20423);
    }

    // Invalid dates are rejected
    {
        bool threw = false;
        try {
            TimeUtils::parseDate("2025-02-30");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            TimeUtils::parseDate("12/01/2025");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Timestamp parsing
    {
        assert(TimeUtils::parseTimestamp("2025-12-01T00:00:00.000Z") == kMonday);
        assert(TimeUtils::parseTimestamp("2025-12-01T00:00:00Z") == kMonday);
        assert(TimeUtils::parseTimestamp("2025-12-01") == kMonday);
        assert(TimeUtils::parseTimestamp("1764547200000") == kMonday);
        assert(TimeUtils::parseTimestamp("1764547200") == kMonday);
        assert(TimeUtils::parseTimestamp("2025-12-01 15:30") ==
               kMonday + 15 * TimeUtils::MS_PER_HOUR + 30 * TimeUtils::MS_PER_MINUTE);
        assert(TimeUtils::parseTimestamp("2025-12-01T00:00:01.5Z") == kMonday + 1500);

        assert(throwsInvalid(""));
        assert(throwsInvalid("yesterday"));
        assert(throwsInvalid("2025-12-01T25:00:00Z"));
        assert(throwsInvalid("2025-12-01X10:00"));
    }

    // Local breakdown at UTC-5
    {
        const auto local = TimeUtils::toLocal(kMonday, -300);
        assert(local.day_number == 20422);
        assert(local.day_of_week == 0);  // still Sunday locally
        assert(local.minute_of_day == 19 * 60);

        const auto utc = TimeUtils::toLocal(kMonday, 0);
        assert(utc.day_of_week == 1);
        assert(utc.minute_of_day == 0);

        // Before the epoch
        const auto early = TimeUtils::toLocal(-1, 0);
        assert(early.day_number == -1);
        assert(early.day_of_week == 3);
        assert(early.minute_of_day == 1439);
    }

    // Formatting and helpers
    {
        assert(TimeUtils::formatTimestamp(kMonday) == "2025-12-01 00:00");
        assert(TimeUtils::formatTimestamp(kMonday + 21 * TimeUtils::MS_PER_HOUR + 5 * TimeUtils::MS_PER_MINUTE) ==
               "2025-12-01 21:05");
        assert(TimeUtils::toMsTimestamp(1764547200LL) == kMonday);
        assert(TimeUtils::toMsTimestamp(kMonday) == kMonday);
        assert(std::abs(TimeUtils::hoursBetween(kMonday, kMonday + 90 * TimeUtils::MS_PER_MINUTE) - 1.5) < 1e-12);
    }

    std::cout << "[TEST] TimeUtils PASSED" << std::endl;
    return 0;
}
